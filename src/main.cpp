#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ansi.hpp"
#include "errors.hpp"
#include "parser.hpp"
#include "session.hpp"
#include "string_utils.hpp"

struct Options
{
    std::optional<std::filesystem::path> rc_file;
    std::vector<std::string> expressions;
    bool help = false;
};

static const char* const usage =
    "usage: calq [--rc PATH | --no-rc] [-e EXPR]... [--help]\n"
    "\n"
    "  --rc PATH   load and save variables and functions in PATH\n"
    "              (default: $CALQ_RC, then $HOME/.calqrc)\n"
    "  --no-rc     do not use an rc file\n"
    "  -e EXPR     evaluate EXPR and exit; may be repeated\n";

static const char* const commands_help =
    "  let x = 2 * pi      bind a variable\n"
    "  fn f(x, y) x ^ y    declare a function\n"
    "  vars | funcs        list variables | functions\n"
    "  history             list evaluated expressions\n"
    "  reset vars          drop all variables (functions stay)\n"
    "  reset history       forget the history\n"
    "  save                write variables and functions to the rc file\n"
    "  tree EXPR           show the syntax tree of EXPR\n"
    "  quit                leave\n";

static std::optional<std::filesystem::path> default_rc_file()
{
    if (const char* path = std::getenv("CALQ_RC"); path && *path)
    {
        return std::filesystem::path{ path };
    }
    if (const char* home = std::getenv("HOME"); home && *home)
    {
        return std::filesystem::path{ home } / ".calqrc";
    }
    return std::nullopt;
}

static Options parse_args(int argc, char* argv[])
{
    Options options;
    options.rc_file = default_rc_file();
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            options.help = true;
        }
        else if (arg == "--no-rc")
        {
            options.rc_file = std::nullopt;
        }
        else if (arg == "--rc" || arg == "-e")
        {
            if (i + 1 == argc)
            {
                throw std::runtime_error{ "missing value for " + std::string{ arg } };
            }
            if (arg == "--rc")
            {
                options.rc_file = std::filesystem::path{ argv[++i] };
            }
            else
            {
                options.expressions.emplace_back(argv[++i]);
            }
        }
        else
        {
            throw std::runtime_error{ "unknown argument '" + std::string{ arg } + "'" };
        }
    }
    return options;
}

std::optional<std::string> read_line(std::istream& is, std::function<void(std::ostream& os)> prompt)
{
    prompt(std::cout);
    std::string line;
    if (!std::getline(is, line))
    {
        return std::nullopt;
    }
    return line;
}

static void print_error(std::string_view message)
{
    std::cerr << ansi::fg{ansi::color::red} << message << ansi::reset << std::endl;
}

static void print_tree(std::string_view text)
{
    try
    {
        const auto expr = calq::parse_expr(text);
        expr->print(std::cout, 1);
    }
    catch (const std::runtime_error& ex)
    {
        print_error(std::string{ "ERROR: " } + ex.what());
    }
}

static int run_expressions(calq::Session& session, const std::vector<std::string>& expressions)
{
    int status = 0;
    for (const auto& text : expressions)
    {
        const auto response = session.eval(text);
        if (response.ok)
        {
            std::cout << response.text << std::endl;
        }
        else
        {
            std::cerr << response.text << std::endl;
            status = 1;
        }
    }
    return status;
}

static void run_repl(calq::Session& session)
{
    using namespace ansi;

    while (true)
    {
        const auto input = read_line(std::cin, [](std::ostream& os) { os << fg{color::green} << "> " << reset; });
        if (!input)
        {
            std::cout << std::endl;
            break;
        }

        const auto line = calq::trim_whitespace(*input);
        if (line.empty())
        {
            continue;
        }
        if (line == "quit" || line == "exit")
        {
            break;
        }
        else if (line == "help")
        {
            std::cout << commands_help;
        }
        else if (line == "vars")
        {
            for (const auto& [n, v] : session.interpreter().env().vars)
            {
                std::cout << "  " << n << " = " << v.format() << std::endl;
            }
        }
        else if (line == "funcs")
        {
            for (const auto& [n, def] : session.interpreter().env().functions)
            {
                std::cout << "  " << calq::to_input(n, def) << std::endl;
            }
            std::cout << fg{color::gray} << "  native:";
            for (const auto& native : session.interpreter().env().natives)
            {
                std::cout << " " << native.first;
            }
            std::cout << reset << std::endl;
        }
        else if (line == "history")
        {
            const auto& entries = session.history().entries;
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                std::cout << "  " << i + 1 << ": " << *entries[i] << std::endl;
            }
        }
        else if (line == "reset vars")
        {
            session.reset_vars();
        }
        else if (line == "reset history")
        {
            session.reset_history();
        }
        else if (line == "save")
        {
            try
            {
                session.save();
                std::cout << fg{color::gray} << "saved to " << session.rc_file()->string() << reset << std::endl;
            }
            catch (const std::runtime_error& ex)
            {
                print_error(std::string{ "ERROR: " } + ex.what());
            }
        }
        else if (calq::starts_with(line, "tree "))
        {
            print_tree(calq::drop(line, 5));
        }
        else
        {
            const auto response = session.eval(line);
            if (response.ok)
            {
                std::cout << fg{color::yellow} << "ans = " << response.text << reset << std::endl;
            }
            else
            {
                print_error(response.text);
            }
        }
    }
}

int main(int argc, char* argv[])
{
    Options options;
    try
    {
        options = parse_args(argc, argv);
    }
    catch (const std::runtime_error& ex)
    {
        std::cerr << "calq: " << ex.what() << '\n' << usage;
        return 2;
    }
    if (options.help)
    {
        std::cout << usage;
        return 0;
    }

    std::optional<calq::Session> session;
    try
    {
        session = options.rc_file ? calq::Session{ *options.rc_file } : calq::Session{};
    }
    catch (const calq::RcError& ex)
    {
        std::cerr << "calq: fatal: " << ex.what() << '\n'
                  << "fix or remove the rc file and start again" << std::endl;
        return 1;
    }

    if (!options.expressions.empty())
    {
        return run_expressions(*session, options.expressions);
    }

    run_repl(*session);
    return 0;
}

#include "session.hpp"

#include <fstream>
#include <stdexcept>
#include <type_traits>

#include "errors.hpp"
#include "parser.hpp"
#include "string_utils.hpp"

namespace calq
{
void History::push(ExprPtr expr)
{
    if (!contains(*expr))
    {
        entries.push_back(std::move(expr));
    }
}

bool History::contains(const Expr& expr) const
{
    for (const auto& entry : entries)
    {
        if (*entry == expr)
        {
            return true;
        }
    }
    return false;
}

void History::clear()
{
    entries.clear();
}

void load_rc(std::istream& is, Interpreter& interpreter, std::string_view source_name)
{
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(is, line))
    {
        ++line_number;
        if (trim_whitespace(line).empty())
        {
            continue;
        }

        try
        {
            auto stmt = parse(line);
            if (auto* assign = std::get_if<statements::Assign>(&stmt))
            {
                interpreter.define(std::move(assign->name), interpreter.interpret_expr(*assign->expr));
            }
            else if (auto* fn = std::get_if<statements::Fn>(&stmt))
            {
                interpreter.declare_function(std::move(fn->name), std::move(fn->params), std::move(fn->body));
            }
        }
        catch (const std::runtime_error& ex)
        {
            throw RcError{ std::string{ source_name } + ":" + std::to_string(line_number) + ": " + ex.what() };
        }
    }
}

Session::Session(std::filesystem::path rc_file)
    : rc_path{ std::move(rc_file) }
{
    if (!std::filesystem::exists(*rc_path))
    {
        std::ofstream create{ *rc_path };
        if (!create)
        {
            throw RcError{ "cannot create rc file " + rc_path->string() };
        }
    }

    std::ifstream is{ *rc_path };
    if (!is)
    {
        throw RcError{ "cannot read rc file " + rc_path->string() };
    }

    Interpreter loaded;
    load_rc(is, loaded, rc_path->string());
    interp = std::move(loaded);
}

Response Session::eval(std::string_view line)
{
    try
    {
        auto stmt = parse(line);
        return std::visit(
            [&](auto& s) -> Response {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, statements::Eval>)
                {
                    const double res = interp.evaluate(*s.expr);
                    hist.push(std::move(s.expr));
                    return Response{ true, format_number(res) };
                }
                else if constexpr (std::is_same_v<T, statements::Assign>)
                {
                    const double res = interp.assign(s.name, *s.expr);
                    hist.push(std::move(s.expr));
                    return Response{ true, format_number(res) };
                }
                else
                {
                    const auto name = s.name;
                    interp.declare_function(std::move(s.name), std::move(s.params), std::move(s.body));
                    return Response{ true, to_input(name, interp.env().functions.at(name)) };
                }
            },
            stmt);
    }
    catch (const std::runtime_error& ex)
    {
        return Response{ false, std::string{ "ERROR: " } + ex.what() };
    }
}

void Session::save() const
{
    if (!rc_path)
    {
        throw std::runtime_error{ "no rc file configured" };
    }

    std::ofstream os{ *rc_path, std::ios::trunc };
    if (!os)
    {
        throw std::runtime_error{ "failed to open rc file " + rc_path->string() };
    }
    for (const auto& line : interp.to_input())
    {
        os << line << '\n';
    }
    if (!os)
    {
        throw std::runtime_error{ "failed to write rc file " + rc_path->string() };
    }
}

void Session::reset_vars()
{
    interp.reset_vars();
}

void Session::reset_history()
{
    hist.clear();
}

const History& Session::history() const
{
    return hist;
}

Interpreter& Session::interpreter()
{
    return interp;
}

const Interpreter& Session::interpreter() const
{
    return interp;
}

const std::optional<std::filesystem::path>& Session::rc_file() const
{
    return rc_path;
}

}  // namespace calq

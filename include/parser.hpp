#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "expr.hpp"
#include "token.hpp"

namespace calq
{
namespace statements
{
struct Eval
{
    ExprPtr expr;
};

struct Assign
{
    std::string name;
    ExprPtr expr;
};

struct Fn
{
    std::string name;
    std::vector<std::string> params;
    ExprPtr body;
};

}  // namespace statements

using Stmt = std::variant<statements::Eval, statements::Assign, statements::Fn>;

// Deepest nesting of groups, calls, unary minus and operator chains in one line.
constexpr std::size_t max_nesting_depth = 256;

// Recursive descent parser for one line of input.
//
//   stmt     := "fn" NAME "(" [NAME {"," NAME}] ")" term
//             | "let" NAME "=" term
//             | term
//   term     := factor {("+" | "-") factor}
//   factor   := exponent {("*" | "/" | "%") exponent}
//   exponent := negative {"^" negative}            left fold: 2^3^2 == 64
//   negative := "-" negative | primary
//   primary  := NUMBER | "(" term ")" | "|" term "|"
//             | NAME "(" [term {"," term}] ")" | NAME
//             | FUNC "(" term ")" | "log" NUMBER "(" term ")"
//
// Any error throws ParseError with the offending token; nothing is returned.
// Nesting deeper than max_nesting_depth fails with "Expression nested too deeply".
struct Parser
{
public:
    explicit Parser(std::vector<Token> tokens);

    // Single letters found in `letters` are replaced by their value while
    // parsing; any other single letter fails with "Unknown variable".
    Parser(std::vector<Token> tokens, std::map<char, double> letters);

    Stmt parse();

    // Parses a bare expression only, let and fn are rejected.
    ExprPtr parse_expr();

private:
    // Restores the nesting level on scope exit.
    struct NestingGuard
    {
        explicit NestingGuard(Parser& parser)
            : nesting{ parser.nesting }
            , saved{ parser.nesting }
        {
        }

        ~NestingGuard()
        {
            nesting = saved;
        }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

        std::size_t& nesting;
        std::size_t saved;
    };

    void deepen();

    const Token& peek() const;
    const Token& previous() const;
    const Token& advance();
    bool at_end() const;
    bool check(TokenKind kind) const;
    bool match(TokenKind kind);
    const Token& consume(TokenKind kind, const char* message);
    const Token& consume_name(const char* message);
    void expect_end();

    statements::Fn function_declaration();
    statements::Assign assignment();

    ExprPtr term();
    ExprPtr factor();
    ExprPtr exponent();
    ExprPtr negative();
    ExprPtr primary();
    ExprPtr builtin();
    ExprPtr call(std::string name);

    std::vector<Token> tokens;
    std::size_t current = 0;
    std::size_t nesting = 0;
    std::optional<std::map<char, double>> letters;
};

Stmt parse(std::string_view text);
ExprPtr parse_expr(std::string_view text);

}  // namespace calq

#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace calq
{
enum class TokenKind
{
    Number,
    Letter,
    Identifier,
    Func,
    Let,
    Fn,
    Plus,
    Minus,
    Star,
    Slash,
    Percent,
    Caret,
    LParen,
    RParen,
    Pipe,
    Comma,
    Equal,
    End,
};

struct Token
{
    TokenKind kind;
    std::string text;
    double number = 0.0;
    std::size_t position = 0;

    // Position does not take part in comparison.
    friend bool operator==(const Token& lhs, const Token& rhs)
    {
        return lhs.kind == rhs.kind && lhs.text == rhs.text && lhs.number == rhs.number;
    }
};

const char* to_string(TokenKind kind);

std::ostream& operator<<(std::ostream& os, TokenKind kind);
std::ostream& operator<<(std::ostream& os, const Token& token);

}  // namespace calq

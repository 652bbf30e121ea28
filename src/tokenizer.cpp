#include "tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>

#include "errors.hpp"
#include "string_utils.hpp"

namespace calq
{
const std::string_view builtin_names[5] = { "sin", "cos", "tan", "ln", "log" };

const char* to_string(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Number: return "number";
        case TokenKind::Letter: return "letter";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::Func: return "function";
        case TokenKind::Let: return "let";
        case TokenKind::Fn: return "fn";
        case TokenKind::Plus: return "+";
        case TokenKind::Minus: return "-";
        case TokenKind::Star: return "*";
        case TokenKind::Slash: return "/";
        case TokenKind::Percent: return "%";
        case TokenKind::Caret: return "^";
        case TokenKind::LParen: return "(";
        case TokenKind::RParen: return ")";
        case TokenKind::Pipe: return "|";
        case TokenKind::Comma: return ",";
        case TokenKind::Equal: return "=";
        case TokenKind::End: return "end of expression";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, TokenKind kind)
{
    return os << to_string(kind);
}

std::ostream& operator<<(std::ostream& os, const Token& token)
{
    if (token.kind == TokenKind::End)
    {
        return os << to_string(token.kind);
    }
    return os << "'" << token.text << "' at " << token.position;
}

static bool is_digit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch));
}

static bool is_alpha(char ch)
{
    return std::isalpha(static_cast<unsigned char>(ch));
}

template <std::size_t N>
static bool contains(const std::string_view (&names)[N], std::string_view name)
{
    return std::find(std::begin(names), std::end(names), name) != std::end(names);
}

Tokenizer::Tokenizer(std::string_view text)
    : text{ text }
{
}

std::vector<Token> Tokenizer::operator()()
{
    std::vector<Token> tokens;
    while (true)
    {
        skip_whitespace();
        if (at_end())
        {
            break;
        }

        const char ch = peek();
        if (is_digit(ch) || ch == '.')
        {
            tokens.push_back(make_number());
        }
        else if (is_alpha(ch))
        {
            tokens.push_back(make_name());
        }
        else
        {
            tokens.push_back(make_symbol());
        }
    }
    tokens.push_back(Token{ TokenKind::End, "", 0.0, index });
    return tokens;
}

bool Tokenizer::at_end() const
{
    return index >= text.size();
}

char Tokenizer::peek() const
{
    return text[index];
}

void Tokenizer::skip_whitespace()
{
    while (!at_end() && std::isspace(static_cast<unsigned char>(peek())))
    {
        ++index;
    }
}

Token Tokenizer::make_number()
{
    const std::size_t start = index;
    while (!at_end() && (is_digit(peek()) || peek() == '.'))
    {
        ++index;
    }

    const auto lexeme = text.substr(start, index - start);
    const auto value = parse_double(lexeme);
    if (!value)
    {
        throw TokenizeError{ "malformed number '" + std::string{ lexeme } + "' at position " + std::to_string(start),
                             std::string{ lexeme },
                             start };
    }
    return Token{ TokenKind::Number, std::string{ lexeme }, *value, start };
}

Token Tokenizer::make_name()
{
    const std::size_t start = index;
    while (!at_end() && is_alpha(peek()))
    {
        ++index;
    }

    // "log" stops at the letters so its base can follow without a space: log2(8).
    if (text.substr(start, index - start) != "log")
    {
        while (!at_end() && (is_alpha(peek()) || is_digit(peek())))
        {
            ++index;
        }
    }

    const auto name = text.substr(start, index - start);
    if (name == "let")
    {
        return Token{ TokenKind::Let, std::string{ name }, 0.0, start };
    }
    if (name == "fn")
    {
        return Token{ TokenKind::Fn, std::string{ name }, 0.0, start };
    }
    if (contains(builtin_names, name))
    {
        return Token{ TokenKind::Func, std::string{ name }, 0.0, start };
    }
    if (name.size() == 1)
    {
        return Token{ TokenKind::Letter, std::string{ name }, 0.0, start };
    }
    return Token{ TokenKind::Identifier, std::string{ name }, 0.0, start };
}

Token Tokenizer::make_symbol()
{
    const std::size_t start = index;
    const char ch = text[index++];
    const auto symbol = [&](TokenKind kind) { return Token{ kind, std::string(1, ch), 0.0, start }; };
    switch (ch)
    {
        case '+': return symbol(TokenKind::Plus);
        case '-': return symbol(TokenKind::Minus);
        case '*': return symbol(TokenKind::Star);
        case '/': return symbol(TokenKind::Slash);
        case '%': return symbol(TokenKind::Percent);
        case '^': return symbol(TokenKind::Caret);
        case '(': return symbol(TokenKind::LParen);
        case ')': return symbol(TokenKind::RParen);
        case '|': return symbol(TokenKind::Pipe);
        case ',': return symbol(TokenKind::Comma);
        case '=': return symbol(TokenKind::Equal);
        default: break;
    }
    throw TokenizeError{ "unexpected character '" + std::string(1, ch) + "' at position " + std::to_string(start),
                         std::string(1, ch),
                         start };
}

}  // namespace calq

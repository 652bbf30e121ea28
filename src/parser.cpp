#include "parser.hpp"

#include <algorithm>
#include <functional>

#include "errors.hpp"
#include "tokenizer.hpp"

namespace calq
{
Parser::Parser(std::vector<Token> tokens)
    : tokens{ std::move(tokens) }
{
    if (this->tokens.empty() || this->tokens.back().kind != TokenKind::End)
    {
        const std::size_t position = this->tokens.empty() ? 0 : this->tokens.back().position + this->tokens.back().text.size();
        this->tokens.push_back(Token{ TokenKind::End, "", 0.0, position });
    }
}

Parser::Parser(std::vector<Token> tokens, std::map<char, double> letters)
    : Parser{ std::move(tokens) }
{
    this->letters = std::move(letters);
}

Stmt Parser::parse()
{
    Stmt res = std::invoke([&]() -> Stmt {
        if (match(TokenKind::Fn))
        {
            return function_declaration();
        }
        if (match(TokenKind::Let))
        {
            return assignment();
        }
        return statements::Eval{ term() };
    });
    expect_end();
    return res;
}

ExprPtr Parser::parse_expr()
{
    auto res = term();
    expect_end();
    return res;
}

void Parser::deepen()
{
    if (nesting >= max_nesting_depth)
    {
        throw ParseError{ peek(), "Expression nested too deeply" };
    }
    ++nesting;
}

const Token& Parser::peek() const
{
    return tokens[current];
}

const Token& Parser::previous() const
{
    return tokens[current - 1];
}

const Token& Parser::advance()
{
    if (!at_end())
    {
        ++current;
    }
    return previous();
}

bool Parser::at_end() const
{
    return peek().kind == TokenKind::End;
}

bool Parser::check(TokenKind kind) const
{
    return peek().kind == kind;
}

bool Parser::match(TokenKind kind)
{
    if (at_end() || !check(kind))
    {
        return false;
    }
    ++current;
    return true;
}

const Token& Parser::consume(TokenKind kind, const char* message)
{
    if (match(kind))
    {
        return previous();
    }
    throw ParseError{ peek(), message };
}

const Token& Parser::consume_name(const char* message)
{
    if (match(TokenKind::Identifier) || match(TokenKind::Letter))
    {
        return previous();
    }
    throw ParseError{ peek(), message };
}

void Parser::expect_end()
{
    if (!at_end())
    {
        throw ParseError{ peek(), "Unexpected token" };
    }
}

statements::Fn Parser::function_declaration()
{
    statements::Fn res;
    res.name = consume_name("Expected function name").text;
    consume(TokenKind::LParen, "Missing opening parentheses");
    if (!check(TokenKind::RParen))
    {
        do
        {
            const auto& param = consume_name("Expected parameter name");
            if (std::find(res.params.begin(), res.params.end(), param.text) != res.params.end())
            {
                throw ParseError{ param, "Duplicate parameter name" };
            }
            res.params.push_back(param.text);
        } while (match(TokenKind::Comma));
    }
    consume(TokenKind::RParen, "Missing closing parentheses");
    res.body = term();
    return res;
}

statements::Assign Parser::assignment()
{
    statements::Assign res;
    res.name = consume_name("Expected variable name").text;
    consume(TokenKind::Equal, "Missing '=' in assignment");
    res.expr = term();
    return res;
}

ExprPtr Parser::term()
{
    NestingGuard guard{ *this };
    auto expr = factor();
    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        deepen();
        const auto kind = advance().kind;
        auto rhs = factor();
        expr = std::make_unique<expressions::BinaryOp>(std::cref(binary_op_info(kind)), std::move(expr), std::move(rhs));
    }
    return expr;
}

ExprPtr Parser::factor()
{
    NestingGuard guard{ *this };
    auto expr = exponent();
    while (check(TokenKind::Star) || check(TokenKind::Slash) || check(TokenKind::Percent))
    {
        deepen();
        const auto kind = advance().kind;
        auto rhs = exponent();
        expr = std::make_unique<expressions::BinaryOp>(std::cref(binary_op_info(kind)), std::move(expr), std::move(rhs));
    }
    return expr;
}

ExprPtr Parser::exponent()
{
    NestingGuard guard{ *this };
    auto expr = negative();
    while (match(TokenKind::Caret))
    {
        deepen();
        auto rhs = negative();
        expr = std::make_unique<expressions::Exponent>(std::move(expr), std::move(rhs));
    }
    return expr;
}

ExprPtr Parser::negative()
{
    if (match(TokenKind::Minus))
    {
        NestingGuard guard{ *this };
        deepen();
        return std::make_unique<expressions::Negative>(negative());
    }
    return primary();
}

ExprPtr Parser::primary()
{
    const Token token = peek();
    switch (token.kind)
    {
        case TokenKind::Number:
            advance();
            return std::make_unique<expressions::Number>(token.number);

        case TokenKind::LParen:
        {
            advance();
            NestingGuard guard{ *this };
            deepen();
            auto expr = term();
            consume(TokenKind::RParen, "Missing closing parentheses");
            return std::make_unique<expressions::Grouping>(std::move(expr));
        }

        case TokenKind::Pipe:
        {
            advance();
            NestingGuard guard{ *this };
            deepen();
            auto expr = term();
            consume(TokenKind::Pipe, "Missing closing pipe");
            return std::make_unique<expressions::Abs>(std::move(expr));
        }

        case TokenKind::Func:
            return builtin();

        case TokenKind::Letter:
        case TokenKind::Identifier:
            advance();
            if (match(TokenKind::LParen))
            {
                return call(token.text);
            }
            if (token.kind == TokenKind::Letter && letters)
            {
                if (auto it = letters->find(token.text.front()); it != letters->end())
                {
                    return std::make_unique<expressions::Number>(it->second);
                }
                throw ParseError{ token, "Unknown variable" };
            }
            return std::make_unique<expressions::Variable>(token.text);

        case TokenKind::Let:
        case TokenKind::Fn:
        case TokenKind::Plus:
        case TokenKind::Minus:
        case TokenKind::Star:
        case TokenKind::Slash:
        case TokenKind::Percent:
        case TokenKind::Caret:
        case TokenKind::RParen:
        case TokenKind::Comma:
        case TokenKind::Equal:
        case TokenKind::End:
            break;
    }
    throw ParseError{ token, "Expected expression" };
}

ExprPtr Parser::builtin()
{
    const Token token = advance();
    const auto func = std::invoke([&]() -> Func {
        if (token.text == "sin")
        {
            return Func{ Func::Kind::Sin };
        }
        if (token.text == "cos")
        {
            return Func{ Func::Kind::Cos };
        }
        if (token.text == "tan")
        {
            return Func{ Func::Kind::Tan };
        }
        if (token.text == "ln")
        {
            return Func{ Func::Kind::Ln };
        }
        if (token.text == "log")
        {
            if (!match(TokenKind::Number))
            {
                throw ParseError{ peek(), "Missing base for log function" };
            }
            return Func{ Func::Kind::Log, previous().number };
        }
        throw ParseError{ token, "Unknown function" };
    });
    consume(TokenKind::LParen, "Missing opening parentheses");
    NestingGuard guard{ *this };
    deepen();
    auto arg = term();
    consume(TokenKind::RParen, "Missing closing parentheses");
    return std::make_unique<expressions::Builtin>(func, std::move(arg));
}

// The opening parenthesis is already consumed.
ExprPtr Parser::call(std::string name)
{
    NestingGuard guard{ *this };
    deepen();
    std::vector<ExprPtr> args;
    if (!check(TokenKind::RParen))
    {
        do
        {
            args.push_back(term());
        } while (match(TokenKind::Comma));
    }
    consume(TokenKind::RParen, "Missing closing parentheses");
    return std::make_unique<expressions::Call>(std::move(name), std::move(args));
}

Stmt parse(std::string_view text)
{
    return Parser{ tokenize(text) }.parse();
}

ExprPtr parse_expr(std::string_view text)
{
    return Parser{ tokenize(text) }.parse_expr();
}

}  // namespace calq

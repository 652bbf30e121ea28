#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include "token.hpp"

namespace calq
{
struct TokenizeError : public std::runtime_error
{
    TokenizeError(std::string message, std::string text, std::size_t position)
        : std::runtime_error{ std::move(message) }
        , text{ std::move(text) }
        , position{ position }
    {
    }

    std::string text;
    std::size_t position;
};

struct ParseError : public std::runtime_error
{
    ParseError(Token token, const char* message)
        : std::runtime_error{ message }
        , token{ std::move(token) }
    {
    }

    Token token;
};

struct EvalError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Raised while loading the rc file; always fatal for the session.
struct RcError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

}  // namespace calq

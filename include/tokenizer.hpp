#pragma once

#include <string_view>
#include <vector>

#include "token.hpp"

namespace calq
{
extern const std::string_view builtin_names[5];

struct Tokenizer
{
public:
    explicit Tokenizer(std::string_view text);

    // Scans the whole input. The result always ends with a single TokenKind::End.
    // Throws TokenizeError on a malformed numeral or an unknown character.
    std::vector<Token> operator()();

private:
    bool at_end() const;
    char peek() const;
    void skip_whitespace();

    Token make_number();
    Token make_name();
    Token make_symbol();

    std::string_view text;
    std::size_t index = 0;
};

inline std::vector<Token> tokenize(std::string_view text)
{
    return Tokenizer{ text }();
}

}  // namespace calq

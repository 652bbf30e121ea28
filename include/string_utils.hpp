#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace calq
{
inline std::string_view drop(std::string_view text, std::ptrdiff_t n)
{
    text.remove_prefix(std::min(n, static_cast<std::ptrdiff_t>(text.size())));
    return text;
}

inline std::string_view drop_last(std::string_view text, std::ptrdiff_t n)
{
    text.remove_suffix(std::min(n, static_cast<std::ptrdiff_t>(text.size())));
    return text;
}

inline std::string_view trim(std::string_view text, const std::function<bool(char)>& pred)
{
    while (!text.empty() && pred(text.front()))
    {
        text = drop(text, 1);
    }
    while (!text.empty() && pred(text.back()))
    {
        text = drop_last(text, 1);
    }
    return text;
}

inline std::string_view trim_whitespace(std::string_view text)
{
    return trim(text, [](char ch) { return std::isspace(static_cast<unsigned char>(ch)); });
}

inline bool starts_with(std::string_view haystack, std::string_view needle)
{
    return haystack.substr(0, std::min(haystack.size(), needle.size())) == needle;
}

// The whole text has to be consumed, "1.5x" is not a number.
// Out of range numerals keep strtod's result: subnormals or +/-HUGE_VAL.
inline std::optional<double> parse_double(std::string_view text)
{
    const std::string str{ text };
    if (str.empty() || std::isspace(static_cast<unsigned char>(str.front())))
    {
        return std::nullopt;
    }
    char* end = nullptr;
    const double res = std::strtod(str.c_str(), &end);
    if (end != str.c_str() + str.size())
    {
        return std::nullopt;
    }
    return res;
}

template <class Range>
std::string join(const Range& items, std::string_view separator)
{
    std::string res;
    bool first = true;
    for (const auto& item : items)
    {
        if (!first)
        {
            res += separator;
        }
        res += item;
        first = false;
    }
    return res;
}

}  // namespace calq

#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace calq
{
// Shortest text that reads back as the same double, never in exponent notation.
// Non-finite values print as inf, -inf and NaN.
std::string format_number(double value);

// Like format_number, but the result always tokenizes and parses back to the
// same value, including infinities and NaN.
std::string format_literal(double value);

// Runtime value of the language. Numbers only for now.
struct Value
{
    Value(double num)
        : data{ num }
    {
    }

    double as_number() const
    {
        return std::get<double>(data);
    }

    std::string format() const;

    // The statement that recreates this binding: "let NAME = VALUE".
    std::string to_input(std::string_view name) const;

    friend bool operator==(const Value& lhs, const Value& rhs)
    {
        return lhs.data == rhs.data;
    }

    std::variant<double> data;
};

}  // namespace calq

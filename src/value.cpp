#include "value.hpp"

#include <charconv>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace calq
{
std::string format_number(double value)
{
    if (std::isnan(value))
    {
        return "NaN";
    }
    if (std::isinf(value))
    {
        return value < 0 ? "-inf" : "inf";
    }

    // Fixed notation of DBL_MAX or of the smallest subnormal stays well below this.
    char buffer[512];
    const auto [end, ec] = std::to_chars(std::begin(buffer), std::end(buffer), value, std::chars_format::fixed);
    if (ec != std::errc{})
    {
        throw std::runtime_error{ "cannot format number" };
    }
    return std::string(buffer, end);
}

std::string format_literal(double value)
{
    if (std::isnan(value))
    {
        return "(0 / 0)";
    }
    if (std::isinf(value))
    {
        return value < 0 ? "-(1 / 0)" : "(1 / 0)";
    }
    return format_number(value);
}

std::string Value::format() const
{
    return std::visit([](double num) { return format_number(num); }, data);
}

std::string Value::to_input(std::string_view name) const
{
    return std::visit([&](double num) { return "let " + std::string{ name } + " = " + format_literal(num); }, data);
}

}  // namespace calq

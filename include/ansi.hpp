#pragma once

#include <ostream>

namespace ansi
{
enum class color
{
    black = 30,
    red = 31,
    green = 32,
    yellow = 33,
    blue = 34,
    magenta = 35,
    cyan = 36,
    white = 37,
    gray = 90,
};

struct fg
{
    color c;

    friend std::ostream& operator<<(std::ostream& os, const fg& item)
    {
        return os << "\033[" << static_cast<int>(item.c) << "m";
    }
};

inline std::ostream& reset(std::ostream& os)
{
    return os << "\033[0m";
}

}  // namespace ansi

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "expr.hpp"
#include "value.hpp"

namespace calq
{
struct FunctionDef
{
    std::vector<std::string> params;
    ExprPtr body;
};

// "fn NAME(P1, P2) BODY"
std::string to_input(std::string_view name, const FunctionDef& def);

using Function = std::function<double(const std::vector<double>&)>;

struct NativeFunction
{
    std::optional<std::size_t> arity;  // nullopt: any number, at least one
    Function func;
};

using Scope = std::map<std::string, double>;

struct Environment
{
    std::map<std::string, Value> vars;
    std::map<std::string, FunctionDef> functions;

    // Installed once by the interpreter, never persisted nor reset.
    std::map<std::string, NativeFunction> natives;
    std::map<std::string, double> constants;
};

constexpr std::size_t max_call_depth = 256;
constexpr std::size_t max_call_count = 1000000;

// What an expression is evaluated against: the environment plus the
// parameters of the function call currently being evaluated, if any.
struct Context
{
    const Environment& env;
    const Scope* locals = nullptr;
    std::size_t depth = 0;
    // User function calls made so far by the whole evaluation.
    std::size_t* calls = nullptr;
};

}  // namespace calq

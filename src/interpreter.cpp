#include "interpreter.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

#include "string_utils.hpp"

namespace calq
{
std::string to_input(std::string_view name, const FunctionDef& def)
{
    return "fn " + std::string{ name } + "(" + join(def.params, ", ") + ") " + def.body->format();
}

static double func_sqrt(const std::vector<double>& args)
{
    return std::sqrt(args.at(0));
}

static double func_sq(const std::vector<double>& args)
{
    return args.at(0) * args.at(0);
}

static double func_cube(const std::vector<double>& args)
{
    return args.at(0) * args.at(0) * args.at(0);
}

static double func_cbrt(const std::vector<double>& args)
{
    return std::cbrt(args.at(0));
}

static double func_abs(const std::vector<double>& args)
{
    return std::abs(args.at(0));
}

static double func_exp(const std::vector<double>& args)
{
    return std::exp(args.at(0));
}

static double func_floor(const std::vector<double>& args)
{
    return std::floor(args.at(0));
}

static double func_ceil(const std::vector<double>& args)
{
    return std::ceil(args.at(0));
}

static double func_round(const std::vector<double>& args)
{
    return std::round(args.at(0));
}

static double func_max(const std::vector<double>& args)
{
    return *std::max_element(args.begin(), args.end());
}

static double func_min(const std::vector<double>& args)
{
    return *std::min_element(args.begin(), args.end());
}

Interpreter::Interpreter()
{
    register_function("sqrt", 1, func_sqrt);
    register_function("sq", 1, func_sq);
    register_function("cube", 1, func_cube);
    register_function("cbrt", 1, func_cbrt);
    register_function("abs", 1, func_abs);
    register_function("exp", 1, func_exp);
    register_function("floor", 1, func_floor);
    register_function("ceil", 1, func_ceil);
    register_function("round", 1, func_round);
    register_function("max", std::nullopt, func_max);
    register_function("min", std::nullopt, func_min);

    environment.constants.emplace("pi", std::acos(-1.0));
    environment.constants.emplace("e", std::exp(1.0));
}

void Interpreter::define(std::string name, Value value)
{
    environment.vars.insert_or_assign(std::move(name), std::move(value));
}

void Interpreter::declare_function(std::string name, std::vector<std::string> params, ExprPtr body)
{
    environment.functions.insert_or_assign(std::move(name), FunctionDef{ std::move(params), std::move(body) });
}

void Interpreter::register_function(std::string name, std::optional<std::size_t> arity, Function func)
{
    environment.natives.insert_or_assign(std::move(name), NativeFunction{ arity, std::move(func) });
}

double Interpreter::interpret_expr(const Expr& expr) const
{
    std::size_t calls = 0;
    return expr.eval(Context{ environment, nullptr, 0, &calls });
}

double Interpreter::evaluate(const Expr& expr)
{
    const double res = interpret_expr(expr);
    define("ans", res);
    return res;
}

double Interpreter::assign(std::string name, const Expr& expr)
{
    const double res = interpret_expr(expr);
    define(std::move(name), res);
    define("ans", res);
    return res;
}

std::optional<double> Interpreter::execute(Stmt stmt)
{
    return std::visit(
        [&](auto& s) -> std::optional<double> {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, statements::Eval>)
            {
                return evaluate(*s.expr);
            }
            else if constexpr (std::is_same_v<T, statements::Assign>)
            {
                return assign(std::move(s.name), *s.expr);
            }
            else
            {
                declare_function(std::move(s.name), std::move(s.params), std::move(s.body));
                return std::nullopt;
            }
        },
        stmt);
}

void Interpreter::reset_vars()
{
    environment.vars.clear();
}

const Environment& Interpreter::env() const
{
    return environment;
}

std::vector<std::string> Interpreter::to_input() const
{
    std::vector<std::string> res;
    for (const auto& [name, value] : environment.vars)
    {
        res.push_back(value.to_input(name));
    }
    for (const auto& [name, def] : environment.functions)
    {
        res.push_back(calq::to_input(name, def));
    }
    return res;
}

}  // namespace calq

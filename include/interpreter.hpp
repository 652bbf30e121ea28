#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "environment.hpp"
#include "parser.hpp"
#include "value.hpp"

namespace calq
{
// Owns the environment of one calculator session and evaluates parsed
// statements against it. Evaluation errors are thrown as EvalError; numeric
// domain problems are not errors and come back as inf or NaN.
class Interpreter
{
public:
    Interpreter();

    void define(std::string name, Value value);
    void declare_function(std::string name, std::vector<std::string> params, ExprPtr body);

    // Native functions live next to the user defined ones but are neither
    // persisted nor cleared; a user function of the same name takes precedence.
    void register_function(std::string name, std::optional<std::size_t> arity, Function func);

    // Evaluates without touching the environment.
    double interpret_expr(const Expr& expr) const;

    // Evaluates and binds the result to `ans`.
    double evaluate(const Expr& expr);

    // Evaluates, binds the result to `name` and to `ans`.
    double assign(std::string name, const Expr& expr);

    // nullopt for a function declaration.
    std::optional<double> execute(Stmt stmt);

    // Drops all variables. Functions are kept.
    void reset_vars();

    const Environment& env() const;

    // One statement per binding, variables first, each group sorted by name.
    std::vector<std::string> to_input() const;

private:
    Environment environment;
};

}  // namespace calq

#include "expr.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "environment.hpp"
#include "errors.hpp"
#include "string_utils.hpp"
#include "value.hpp"

namespace calq
{
static std::string indent(int level)
{
    return std::string(level * 2, ' ');
}

static double binary_mod(double x, double y)
{
    return std::fmod(x, y);
}

static const std::array<BinaryOpInfo, 5> binary_op_info_list = {
    BinaryOpInfo{ TokenKind::Plus, "+", std::plus<>{} },
    BinaryOpInfo{ TokenKind::Minus, "-", std::minus<>{} },
    BinaryOpInfo{ TokenKind::Star, "*", std::multiplies<>{} },
    BinaryOpInfo{ TokenKind::Slash, "/", std::divides<>{} },
    BinaryOpInfo{ TokenKind::Percent, "%", binary_mod },
};

const BinaryOpInfo& binary_op_info(TokenKind kind)
{
    for (const auto& op_info : binary_op_info_list)
    {
        if (op_info.kind == kind)
        {
            return op_info;
        }
    }
    throw std::invalid_argument{ std::string{ "not a binary operator: " } + to_string(kind) };
}

std::ostream& operator<<(std::ostream& os, const Expr& expr)
{
    return os << expr.format();
}

double Func::apply(double arg) const
{
    switch (kind)
    {
        case Kind::Sin: return std::sin(arg);
        case Kind::Cos: return std::cos(arg);
        case Kind::Tan: return std::tan(arg);
        case Kind::Ln: return std::log(arg);
        case Kind::Log: return std::log(arg) / std::log(base);
    }
    throw std::logic_error{ "unhandled builtin function" };
}

std::string Func::name() const
{
    switch (kind)
    {
        case Kind::Sin: return "sin";
        case Kind::Cos: return "cos";
        case Kind::Tan: return "tan";
        case Kind::Ln: return "ln";
        case Kind::Log: return "log" + format_number(base);
    }
    throw std::logic_error{ "unhandled builtin function" };
}

namespace expressions
{
template <class T>
static const T* same_kind(const Expr& other)
{
    return dynamic_cast<const T*>(&other);
}

double Number::eval(const Context&) const
{
    return v;
}

void Number::print(std::ostream& os, int level) const
{
    os << indent(level) << format_number(v) << std::endl;
}

std::string Number::format() const
{
    return format_literal(v);
}

bool Number::equals(const Expr& other) const
{
    const auto* that = same_kind<Number>(other);
    return that && (that->v == v || (std::isnan(that->v) && std::isnan(v)));
}

double Variable::eval(const Context& ctx) const
{
    if (ctx.locals)
    {
        if (auto it = ctx.locals->find(name); it != ctx.locals->end())
        {
            return it->second;
        }
    }
    if (auto it = ctx.env.vars.find(name); it != ctx.env.vars.end())
    {
        return it->second.as_number();
    }
    if (auto it = ctx.env.constants.find(name); it != ctx.env.constants.end())
    {
        return it->second;
    }
    throw EvalError{ "unknown variable '" + name + "'" };
}

void Variable::print(std::ostream& os, int level) const
{
    os << indent(level) << name << std::endl;
}

std::string Variable::format() const
{
    return name;
}

bool Variable::equals(const Expr& other) const
{
    const auto* that = same_kind<Variable>(other);
    return that && that->name == name;
}

double Negative::eval(const Context& ctx) const
{
    return -sub->eval(ctx);
}

void Negative::print(std::ostream& os, int level) const
{
    os << indent(level) << "neg" << std::endl;
    sub->print(os, level + 1);
}

std::string Negative::format() const
{
    return "-" + sub->format();
}

bool Negative::equals(const Expr& other) const
{
    const auto* that = same_kind<Negative>(other);
    return that && *that->sub == *sub;
}

double Grouping::eval(const Context& ctx) const
{
    return sub->eval(ctx);
}

void Grouping::print(std::ostream& os, int level) const
{
    os << indent(level) << "()" << std::endl;
    sub->print(os, level + 1);
}

std::string Grouping::format() const
{
    return "(" + sub->format() + ")";
}

bool Grouping::equals(const Expr& other) const
{
    const auto* that = same_kind<Grouping>(other);
    return that && *that->sub == *sub;
}

double Abs::eval(const Context& ctx) const
{
    return std::abs(sub->eval(ctx));
}

void Abs::print(std::ostream& os, int level) const
{
    os << indent(level) << "||" << std::endl;
    sub->print(os, level + 1);
}

std::string Abs::format() const
{
    return "|" + sub->format() + "|";
}

bool Abs::equals(const Expr& other) const
{
    const auto* that = same_kind<Abs>(other);
    return that && *that->sub == *sub;
}

double BinaryOp::eval(const Context& ctx) const
{
    return info.get().func(lhs->eval(ctx), rhs->eval(ctx));
}

void BinaryOp::print(std::ostream& os, int level) const
{
    os << indent(level) << info.get().symbol << std::endl;
    lhs->print(os, level + 1);
    rhs->print(os, level + 1);
}

std::string BinaryOp::format() const
{
    return lhs->format() + " " + info.get().symbol + " " + rhs->format();
}

bool BinaryOp::equals(const Expr& other) const
{
    const auto* that = same_kind<BinaryOp>(other);
    return that && that->info.get().kind == info.get().kind && *that->lhs == *lhs && *that->rhs == *rhs;
}

double Exponent::eval(const Context& ctx) const
{
    return std::pow(base->eval(ctx), exponent->eval(ctx));
}

void Exponent::print(std::ostream& os, int level) const
{
    os << indent(level) << "^" << std::endl;
    base->print(os, level + 1);
    exponent->print(os, level + 1);
}

std::string Exponent::format() const
{
    return base->format() + "^" + exponent->format();
}

bool Exponent::equals(const Expr& other) const
{
    const auto* that = same_kind<Exponent>(other);
    return that && *that->base == *base && *that->exponent == *exponent;
}

double Builtin::eval(const Context& ctx) const
{
    return func.apply(arg->eval(ctx));
}

void Builtin::print(std::ostream& os, int level) const
{
    os << indent(level) << func.name() << std::endl;
    arg->print(os, level + 1);
}

std::string Builtin::format() const
{
    return func.name() + "(" + arg->format() + ")";
}

bool Builtin::equals(const Expr& other) const
{
    const auto* that = same_kind<Builtin>(other);
    return that && that->func == func && *that->arg == *arg;
}

static std::vector<double> eval_args(const std::vector<ExprPtr>& args, const Context& ctx)
{
    std::vector<double> res(args.size());
    std::transform(args.begin(), args.end(), res.begin(), [&](const auto& expr_ptr) { return expr_ptr->eval(ctx); });
    return res;
}

static std::string arity_message(const std::string& name, std::size_t expected, std::size_t actual)
{
    return "function '" + name + "' expects " + std::to_string(expected) + " argument" + (expected == 1 ? "" : "s")
           + ", got " + std::to_string(actual);
}

double Call::eval(const Context& ctx) const
{
    if (auto it = ctx.env.functions.find(name); it != ctx.env.functions.end())
    {
        const auto& def = it->second;
        if (def.params.size() != args.size())
        {
            throw EvalError{ arity_message(name, def.params.size(), args.size()) };
        }
        if (ctx.depth >= max_call_depth)
        {
            throw EvalError{ "maximum call depth exceeded in '" + name + "'" };
        }
        if (ctx.calls && ++*ctx.calls > max_call_count)
        {
            throw EvalError{ "maximum number of calls exceeded in '" + name + "'" };
        }

        const auto values = eval_args(args, ctx);
        Scope locals;
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            locals.emplace(def.params[i], values[i]);
        }
        return def.body->eval(Context{ ctx.env, &locals, ctx.depth + 1, ctx.calls });
    }

    if (auto it = ctx.env.natives.find(name); it != ctx.env.natives.end())
    {
        const auto& native = it->second;
        if (native.arity && *native.arity != args.size())
        {
            throw EvalError{ arity_message(name, *native.arity, args.size()) };
        }
        if (!native.arity && args.empty())
        {
            throw EvalError{ "function '" + name + "' expects at least 1 argument" };
        }
        return native.func(eval_args(args, ctx));
    }

    throw EvalError{ "undefined function '" + name + "'" };
}

void Call::print(std::ostream& os, int level) const
{
    os << indent(level) << name << "()" << std::endl;
    for (const auto& arg : args)
    {
        arg->print(os, level + 1);
    }
}

std::string Call::format() const
{
    std::vector<std::string> items;
    for (const auto& arg : args)
    {
        items.push_back(arg->format());
    }
    return name + "(" + join(items, ", ") + ")";
}

bool Call::equals(const Expr& other) const
{
    const auto* that = same_kind<Call>(other);
    return that && that->name == name
           && std::equal(args.begin(), args.end(), that->args.begin(), that->args.end(), [](const auto& lhs, const auto& rhs) {
                  return *lhs == *rhs;
              });
}

}  // namespace expressions

}  // namespace calq

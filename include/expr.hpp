#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "token.hpp"

namespace calq
{
struct Context;

// Node of the syntax tree. Trees are built once by the parser and never
// modified afterwards; every node owns its children.
struct Expr
{
    virtual ~Expr() = default;

    virtual double eval(const Context& ctx) const = 0;
    virtual void print(std::ostream& os, int level) const = 0;

    // Source text that parses back into an equal tree.
    virtual std::string format() const = 0;

    virtual bool equals(const Expr& other) const = 0;
};

using ExprPtr = std::unique_ptr<Expr>;

inline bool operator==(const Expr& lhs, const Expr& rhs)
{
    return lhs.equals(rhs);
}

std::ostream& operator<<(std::ostream& os, const Expr& expr);

using BinaryFunc = std::function<double(double, double)>;

struct BinaryOpInfo
{
    TokenKind kind;
    std::string symbol;
    BinaryFunc func;
};

// Throws std::invalid_argument for a token that is not one of + - * / %.
const BinaryOpInfo& binary_op_info(TokenKind kind);

struct Func
{
    enum class Kind
    {
        Sin,
        Cos,
        Tan,
        Ln,
        Log,
    };

    Kind kind;
    double base = 0.0;  // Log only

    double apply(double arg) const;
    std::string name() const;

    friend bool operator==(const Func& lhs, const Func& rhs)
    {
        return lhs.kind == rhs.kind && (lhs.kind != Kind::Log || lhs.base == rhs.base);
    }
};

namespace expressions
{
struct Number : public Expr
{
    double v;

    explicit Number(double v)
        : v{ v }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

struct Variable : public Expr
{
    std::string name;

    explicit Variable(std::string name)
        : name{ std::move(name) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

struct Negative : public Expr
{
    ExprPtr sub;

    explicit Negative(ExprPtr sub)
        : sub{ std::move(sub) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

struct Grouping : public Expr
{
    ExprPtr sub;

    explicit Grouping(ExprPtr sub)
        : sub{ std::move(sub) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

struct Abs : public Expr
{
    ExprPtr sub;

    explicit Abs(ExprPtr sub)
        : sub{ std::move(sub) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

struct BinaryOp : public Expr
{
    std::reference_wrapper<const BinaryOpInfo> info;
    ExprPtr lhs;
    ExprPtr rhs;

    BinaryOp(std::reference_wrapper<const BinaryOpInfo> info, ExprPtr lhs, ExprPtr rhs)
        : info{ info }
        , lhs{ std::move(lhs) }
        , rhs{ std::move(rhs) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

struct Exponent : public Expr
{
    ExprPtr base;
    ExprPtr exponent;

    Exponent(ExprPtr base, ExprPtr exponent)
        : base{ std::move(base) }
        , exponent{ std::move(exponent) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

struct Builtin : public Expr
{
    Func func;
    ExprPtr arg;

    Builtin(Func func, ExprPtr arg)
        : func{ func }
        , arg{ std::move(arg) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

// Call of a user defined or native function, resolved when evaluated.
struct Call : public Expr
{
    std::string name;
    std::vector<ExprPtr> args;

    Call(std::string name, std::vector<ExprPtr> args)
        : name{ std::move(name) }
        , args{ std::move(args) }
    {
    }

    double eval(const Context& ctx) const override;
    void print(std::ostream& os, int level) const override;
    std::string format() const override;
    bool equals(const Expr& other) const override;
};

}  // namespace expressions

}  // namespace calq

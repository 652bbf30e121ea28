#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <sstream>

#include "errors.hpp"
#include "interpreter.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

using namespace ::testing;
using namespace calq::expressions;

static double eval(std::string_view text)
{
    const calq::Interpreter interpreter{};
    const auto expr = calq::parse_expr(text);
    return interpreter.interpret_expr(*expr);
}

static calq::ExprPtr num(double v)
{
    return std::make_unique<Number>(v);
}

static calq::ExprPtr binary(calq::ExprPtr lhs, calq::TokenKind op, calq::ExprPtr rhs)
{
    return std::make_unique<BinaryOp>(std::cref(calq::binary_op_info(op)), std::move(lhs), std::move(rhs));
}

static calq::ParseError parse_error(std::string_view text)
{
    try
    {
        calq::parse(text);
    }
    catch (const calq::ParseError& ex)
    {
        return ex;
    }
    throw std::logic_error{ "no ParseError for '" + std::string{ text } + "'" };
}

TEST(parser, number_literal)
{
    const auto expr = calq::parse_expr("42.5");
    ASSERT_TRUE(*expr == *num(42.5));
}

TEST(parser, simple_add)
{
    const auto expr = calq::parse_expr("10 + 5");
    ASSERT_TRUE(*expr == *binary(num(10), calq::TokenKind::Plus, num(5)));
}

TEST(parser, grouping_is_kept_in_the_tree)
{
    const auto expr = calq::parse_expr("(1 + 2) * 5");
    const auto expected
        = binary(std::make_unique<Grouping>(binary(num(1), calq::TokenKind::Plus, num(2))), calq::TokenKind::Star, num(5));
    ASSERT_TRUE(*expr == *expected);
}

TEST(parser, negative_of_grouping)
{
    const auto expr = calq::parse_expr("-(5)/1");
    const auto expected
        = binary(std::make_unique<Negative>(std::make_unique<Grouping>(num(5))), calq::TokenKind::Slash, num(1));
    ASSERT_TRUE(*expr == *expected);
}

TEST(parser, unary_minus_chains)
{
    const auto expr = calq::parse_expr("--5");
    ASSERT_TRUE(*expr == Negative{ std::make_unique<Negative>(num(5)) });
    ASSERT_THAT(eval("--5"), DoubleEq(5));
}

TEST(parser, binary_operators)
{
    ASSERT_THAT(eval("2.1 + 3.2"), DoubleEq(5.3));
    ASSERT_THAT(eval("2.1 - 3.2"), DoubleEq(-1.1));
    ASSERT_THAT(eval("2.1 * 3.2"), DoubleEq(6.72));
    ASSERT_THAT(eval("6.3 / 2.1"), DoubleEq(3.00));
    ASSERT_THAT(eval("7 % 3"), DoubleEq(1));
    ASSERT_THAT(eval("-7 % 3"), DoubleEq(-1));
    ASSERT_THAT(eval("5.5 % 2"), DoubleEq(1.5));
}

TEST(parser, operator_precedence)
{
    ASSERT_THAT(eval("1 + 2 * 3"), DoubleEq(7));
    ASSERT_THAT(eval("(1 + 2) * 3"), DoubleEq(9));
    ASSERT_THAT(eval("(2 + 3) * (3 - 1) - 1"), DoubleEq(9));
    ASSERT_THAT(eval("2 * 10 ^ 3"), DoubleEq(2000));
    ASSERT_THAT(eval("-(1 + 3)"), DoubleEq(-4));
    ASSERT_THAT(eval("10 - 4 - 3"), DoubleEq(3));
    ASSERT_THAT(eval("64 / 4 / 2"), DoubleEq(8));
}

TEST(parser, exponent_folds_to_the_left)
{
    ASSERT_THAT(eval("2 ^ 3 ^ 2"), DoubleEq(64));
    ASSERT_THAT(eval("2 ^ (3 ^ 2)"), DoubleEq(512));

    const auto expr = calq::parse_expr("2^3^2");
    const auto expected
        = std::make_unique<Exponent>(std::make_unique<Exponent>(num(2), num(3)), num(2));
    ASSERT_TRUE(*expr == *expected);
}

TEST(parser, unary_minus_binds_tighter_than_exponent)
{
    ASSERT_THAT(eval("-2 ^ 2"), DoubleEq(4));
    ASSERT_THAT(eval("2 ^ -1"), DoubleEq(0.5));
}

TEST(parser, absolute_value)
{
    ASSERT_THAT(eval("|3 - 10|"), DoubleEq(7));
    ASSERT_THAT(eval("|-2| * |-3|"), DoubleEq(6));
    ASSERT_THAT(eval("||-2| - 5|"), DoubleEq(3));
}

TEST(parser, builtin_functions)
{
    ASSERT_THAT(eval("sin(0)"), DoubleEq(0));
    ASSERT_THAT(eval("cos(0)"), DoubleEq(1));
    ASSERT_THAT(eval("tan(0)"), DoubleEq(0));
    ASSERT_THAT(eval("ln(1)"), DoubleEq(0));
    ASSERT_THAT(eval("log2(8)"), DoubleEq(3));
    ASSERT_THAT(eval("log 10 (1000)"), DoubleEq(3));
    ASSERT_THAT(eval("sin(pi / 2)"), DoubleEq(1));
}

TEST(parser, log_base_is_part_of_the_node)
{
    const auto expr = calq::parse_expr("log2(8)");
    const auto* node = dynamic_cast<const Builtin*>(expr.get());
    ASSERT_THAT(node, NotNull());
    EXPECT_THAT(node->func.kind, Eq(calq::Func::Kind::Log));
    EXPECT_THAT(node->func.base, DoubleEq(2));
}

TEST(parser, numeric_domain_problems_are_not_errors)
{
    ASSERT_TRUE(std::isinf(eval("1 / 0")));
    ASSERT_TRUE(std::isnan(eval("0 / 0")));
    ASSERT_TRUE(std::isnan(eval("ln(-1)")));
    ASSERT_TRUE(std::isnan(eval("(-8) ^ 0.5")));
}

TEST(parser, names_become_variables_and_calls)
{
    const auto expr = calq::parse_expr("foo(1, x + 2) * bar");
    const auto* product = dynamic_cast<const BinaryOp*>(expr.get());
    ASSERT_THAT(product, NotNull());

    const auto* call = dynamic_cast<const Call*>(product->lhs.get());
    ASSERT_THAT(call, NotNull());
    EXPECT_THAT(call->name, Eq("foo"));
    ASSERT_THAT(call->args, SizeIs(2));
    EXPECT_TRUE(*call->args[1] == *binary(std::make_unique<Variable>("x"), calq::TokenKind::Plus, num(2)));

    const auto* variable = dynamic_cast<const Variable*>(product->rhs.get());
    ASSERT_THAT(variable, NotNull());
    EXPECT_THAT(variable->name, Eq("bar"));
}

TEST(parser, call_without_arguments)
{
    const auto expr = calq::parse_expr("k()");
    const auto* call = dynamic_cast<const Call*>(expr.get());
    ASSERT_THAT(call, NotNull());
    EXPECT_THAT(call->args, IsEmpty());
}

TEST(parser, assignment_statement)
{
    auto stmt = calq::parse("let foo = sqrt(144)");
    const auto* assign = std::get_if<calq::statements::Assign>(&stmt);
    ASSERT_THAT(assign, NotNull());
    EXPECT_THAT(assign->name, Eq("foo"));
    EXPECT_THAT(assign->expr->format(), Eq("sqrt(144)"));
}

TEST(parser, function_declaration)
{
    auto stmt = calq::parse("fn foo(x, y) x + y");
    const auto* fn = std::get_if<calq::statements::Fn>(&stmt);
    ASSERT_THAT(fn, NotNull());
    EXPECT_THAT(fn->name, Eq("foo"));
    EXPECT_THAT(fn->params, ElementsAre("x", "y"));
    EXPECT_TRUE(
        *fn->body == *binary(std::make_unique<Variable>("x"), calq::TokenKind::Plus, std::make_unique<Variable>("y")));
}

TEST(parser, bare_expression_statement)
{
    auto stmt = calq::parse("1 + 1");
    ASSERT_TRUE(std::holds_alternative<calq::statements::Eval>(stmt));
}

TEST(parser, empty_input_is_an_error)
{
    EXPECT_THAT(parse_error("").what(), StrEq("Expected expression"));
    EXPECT_THAT(parse_error("   ").token.kind, Eq(calq::TokenKind::End));
}

TEST(parser, missing_closing_delimiters)
{
    const auto paren = parse_error("-(5");
    EXPECT_THAT(paren.what(), StrEq("Missing closing parentheses"));
    EXPECT_THAT(paren.token.kind, Eq(calq::TokenKind::End));

    EXPECT_THAT(parse_error("|5 - 3").what(), StrEq("Missing closing pipe"));
    EXPECT_THAT(parse_error("sin(1").what(), StrEq("Missing closing parentheses"));
    EXPECT_THAT(parse_error("foo(1, 2").what(), StrEq("Missing closing parentheses"));
}

TEST(parser, log_requires_a_literal_base)
{
    EXPECT_THAT(parse_error("log(8)").what(), StrEq("Missing base for log function"));
    EXPECT_THAT(parse_error("log x(8)").what(), StrEq("Missing base for log function"));
}

TEST(parser, builtin_requires_parentheses)
{
    EXPECT_THAT(parse_error("sin 1").what(), StrEq("Missing opening parentheses"));
}

TEST(parser, errors_carry_the_offending_token)
{
    const auto error = parse_error("1 + * 2");
    EXPECT_THAT(error.what(), StrEq("Expected expression"));
    EXPECT_THAT(error.token.kind, Eq(calq::TokenKind::Star));
    EXPECT_THAT(error.token.position, Eq(4u));
}

TEST(parser, trailing_tokens_are_rejected)
{
    EXPECT_THAT(parse_error("1 2").what(), StrEq("Unexpected token"));
    EXPECT_THAT(parse_error("(1))").what(), StrEq("Unexpected token"));
}

TEST(parser, malformed_statements)
{
    EXPECT_THAT(parse_error("let = 3").what(), StrEq("Expected variable name"));
    EXPECT_THAT(parse_error("let x 3").what(), StrEq("Missing '=' in assignment"));
    EXPECT_THAT(parse_error("let sin = 3").what(), StrEq("Expected variable name"));
    EXPECT_THAT(parse_error("fn (x) x").what(), StrEq("Expected function name"));
    EXPECT_THAT(parse_error("fn f x").what(), StrEq("Missing opening parentheses"));
    EXPECT_THAT(parse_error("fn f(x, 1) x").what(), StrEq("Expected parameter name"));
    EXPECT_THAT(parse_error("fn f(x, y").what(), StrEq("Missing closing parentheses"));
    EXPECT_THAT(parse_error("fn f(x, x) x").what(), StrEq("Duplicate parameter name"));
    EXPECT_THAT(parse_error("fn f(x)").what(), StrEq("Expected expression"));
}

TEST(parser, nesting_too_deep_is_an_error)
{
    const std::string deep[] = {
        std::string(100000, '-') + "1",
        std::string(100000, '(') + "1",
        std::string(100000, '|') + "1",
        "sin(" + std::string(100000, '-') + "1)",
    };
    for (const auto& text : deep)
    {
        EXPECT_THAT(parse_error(text).what(), StrEq("Expression nested too deeply")) << text.substr(0, 8);
    }

    std::string chain = "1";
    for (int i = 0; i < 100000; ++i)
    {
        chain += "+1";
    }
    EXPECT_THAT(parse_error(chain).what(), StrEq("Expression nested too deeply"));
}

TEST(parser, nesting_below_the_limit_is_fine)
{
    const std::size_t depth = calq::max_nesting_depth - 10;
    EXPECT_THAT(eval(std::string(depth, '(') + "1" + std::string(depth, ')')), DoubleEq(1));
    EXPECT_THAT(eval(std::string(depth, '-') + "1"), DoubleEq(1));

    std::string chain = "1";
    for (std::size_t i = 0; i < depth; ++i)
    {
        chain += " + 1";
    }
    EXPECT_THAT(eval(chain), DoubleEq(depth + 1));
}

TEST(parser, letters_are_substituted_when_a_map_is_given)
{
    calq::Parser parser{ calq::tokenize("a + 3"), { { 'a', 1.0 } } };
    const auto expr = parser.parse_expr();
    ASSERT_TRUE(*expr == *binary(num(1), calq::TokenKind::Plus, num(3)));
}

TEST(parser, unknown_letter_fails_when_a_map_is_given)
{
    calq::Parser parser{ calq::tokenize("a + b"), { { 'a', 1.0 } } };
    try
    {
        parser.parse_expr();
        FAIL() << "expected ParseError";
    }
    catch (const calq::ParseError& ex)
    {
        EXPECT_THAT(ex.what(), StrEq("Unknown variable"));
        EXPECT_THAT(ex.token.text, Eq("b"));
    }
}

TEST(parser, format_parses_back_to_an_equal_tree)
{
    const char* inputs[] = {
        "1 + 2 * 3",
        "(1 + 2) * 3",
        "2^3^2",
        "2^(3^2)",
        "--5",
        "-(5) / 1",
        "1 - -2",
        "-2^-1",
        "|3 - |x|| % 4",
        "sin(x) + cos(1) * tan(2) - ln(3)",
        "log2(8) + log10.5(y)",
        "foo(1, bar(x, 2), baz()) / qux",
        "0.1 + 123456.789",
    };
    for (const char* input : inputs)
    {
        const auto expr = calq::parse_expr(input);
        const auto reparsed = calq::parse_expr(expr->format());
        EXPECT_TRUE(*expr == *reparsed) << input << " -> " << expr->format();
    }
}

TEST(parser, format_of_numbers_is_shortest_round_trip)
{
    EXPECT_THAT(calq::parse_expr("1.50")->format(), Eq("1.5"));
    EXPECT_THAT(calq::parse_expr("2")->format(), Eq("2"));
    EXPECT_THAT(calq::parse_expr("0.1")->format(), Eq("0.1"));
    EXPECT_THAT(calq::parse_expr("(1+2)*3")->format(), Eq("(1 + 2) * 3"));
}

TEST(parser, print_shows_an_indented_tree)
{
    std::ostringstream os;
    calq::parse_expr("-(1 + x)")->print(os, 0);
    ASSERT_THAT(os.str(), Eq("neg\n  ()\n    +\n      1\n      x\n"));
}

#include <gtest/gtest.h>

#include "shaderplus/expression_parser.hpp"

#include <string>

using namespace shaderplus;

namespace
{
    std::string parsed(const std::string& source)
    {
        auto r = parse_expression(source);
        EXPECT_TRUE(r.isOk()) << source << ": " << r.error().message;
        return r.isOk() ? expression_to_string(r.value()) : std::string();
    }

    ErrorCode parse_error(const std::string& source)
    {
        auto r = parse_expression(source);
        EXPECT_FALSE(r.isOk()) << source << " parsed as " << expression_to_string(r.value());
        return r.error().code;
    }

    Literal literal_of(const std::string& source)
    {
        auto r = parse_expression(source);
        EXPECT_TRUE(r.isOk()) << source << ": " << r.error().message;
        EXPECT_EQ(ExpressionKind::eLiteral, r.value().kind) << source;
        return r.value().literal;
    }
} // namespace

/* ******** Number literals ******** */

TEST(expression_parser_number, decimal)
{
    EXPECT_EQ(Literal::fromInteger(0), literal_of("0"));
    EXPECT_EQ(Literal::fromInteger(1234), literal_of("1234"));
    EXPECT_EQ(Literal::fromInteger(1000000), literal_of("1_000_000"));
}

TEST(expression_parser_number, radix_prefixes)
{
    EXPECT_EQ(Literal::fromInteger(5), literal_of("0b101"));
    EXPECT_EQ(Literal::fromInteger(255), literal_of("0b1111_1111"));
    EXPECT_EQ(Literal::fromInteger(8), literal_of("0o10"));
    EXPECT_EQ(Literal::fromInteger(511), literal_of("0o777"));
    EXPECT_EQ(Literal::fromInteger(255), literal_of("0xff"));
    EXPECT_EQ(Literal::fromInteger(0xDEADBEEF), literal_of("0xDEAD_BEEF"));
    EXPECT_EQ(Literal::fromInteger(0x1b), literal_of("0x1b"));
}

TEST(expression_parser_number, float)
{
    EXPECT_EQ(Literal::fromFloat(1.5), literal_of("1.5"));
    EXPECT_EQ(Literal::fromFloat(3.0), literal_of("3."));
    EXPECT_EQ(Literal::fromFloat(1000.25), literal_of("1_000.25"));
}

TEST(expression_parser_number, duplicate_period)
{
    EXPECT_EQ(ErrorCode::eDuplicatePeriod, parse_error("1.2.3"));
}

TEST(expression_parser_number, invalid_base)
{
    EXPECT_EQ(ErrorCode::eInvalidBase, parse_error("12x3"));
    EXPECT_EQ(ErrorCode::eInvalidBase, parse_error("0x0x1"));
    EXPECT_EQ(ErrorCode::eInvalidBase, parse_error("1b0"));
}

TEST(expression_parser_number, invalid_digits)
{
    EXPECT_EQ(ErrorCode::eParseInt, parse_error("0b102"));
    EXPECT_EQ(ErrorCode::eParseInt, parse_error("0o8"));
    EXPECT_EQ(ErrorCode::eParseInt, parse_error("0x"));
    EXPECT_EQ(ErrorCode::eParseInt, parse_error("99999999999999999999"));
}

/* ******** Terms ******** */

TEST(expression_parser_term, booleans_and_references)
{
    EXPECT_EQ(Literal::fromBool(true), literal_of("true"));
    EXPECT_EQ(Literal::fromBool(false), literal_of("false"));

    auto r = parse_expression("USE_TANGENTS");
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(ExpressionKind::eReference, r.value().kind);
    EXPECT_EQ("USE_TANGENTS", r.value().name);

    EXPECT_EQ("true_ish", parsed("true_ish"));
    EXPECT_EQ("_x1", parsed("_x1"));
}

TEST(expression_parser_term, whitespace_is_discarded)
{
    EXPECT_EQ("BIT_1", parsed("  B IT _1 "));
    EXPECT_EQ("12", parsed("1 2"));
    EXPECT_EQ("(a + b)", parsed(" a\t+ b "));
}

TEST(expression_parser_term, unary_binds_one_term)
{
    EXPECT_EQ("(-a + b)", parsed("-a + b"));
    EXPECT_EQ("!x", parsed("!x"));
    EXPECT_EQ("~-1", parsed("~-1"));
    EXPECT_EQ("-((a + b))", parsed("-(a+b)"));
}

TEST(expression_parser_term, parentheses)
{
    EXPECT_EQ("(((a - b)) - c)", parsed("(a - b) - c"));
    EXPECT_EQ("((1))", parsed("((1))"));
    EXPECT_EQ(ErrorCode::eNoClosingParenthesis, parse_error("(1+2"));
    EXPECT_EQ(ErrorCode::eNoExpression, parse_error("()"));
}

/* ******** Binary operators ******** */

TEST(expression_parser_binary, right_associative_without_precedence)
{
    EXPECT_EQ("(a - (b - c))", parsed("a - b - c"));
    EXPECT_EQ("(a * (b + c))", parsed("a * b + c"));
    EXPECT_EQ("(a + (b * c))", parsed("a + b * c"));
}

TEST(expression_parser_binary, operator_tokens)
{
    EXPECT_EQ("(a & b)", parsed("a & b"));
    EXPECT_EQ("(a && b)", parsed("a && b"));
    EXPECT_EQ("(a | b)", parsed("a | b"));
    EXPECT_EQ("(a || b)", parsed("a || b"));
    EXPECT_EQ("(a / b)", parsed("a / b"));
    EXPECT_EQ("(a < b)", parsed("a < b"));
    EXPECT_EQ("(a <= b)", parsed("a <= b"));
    EXPECT_EQ("(a > b)", parsed("a > b"));
    EXPECT_EQ("(a >= b)", parsed("a >= b"));
    EXPECT_EQ("(a == b)", parsed("a == b"));
    EXPECT_EQ("(a != b)", parsed("a != b"));
}

TEST(expression_parser_binary, logical_operators_are_comparisons)
{
    auto r = parse_expression("a && b");
    ASSERT_TRUE(r.isOk());
    EXPECT_EQ(ExpressionKind::eComparison, r.value().kind);
    EXPECT_EQ(Comparison::eAnd, r.value().comparison);

    auto b = parse_expression("a & b");
    ASSERT_TRUE(b.isOk());
    EXPECT_EQ(ExpressionKind::eOperator, b.value().kind);
    EXPECT_EQ(BinaryOperator::eBitwiseAnd, b.value().binaryOp);
}

TEST(expression_parser_binary, lone_bang_or_equals_is_leftover)
{
    EXPECT_EQ(ErrorCode::eLeftoverChars, parse_error("a = b"));
    EXPECT_EQ(ErrorCode::eLeftoverChars, parse_error("a !"));

    auto r = parse_expression("a = 1");
    ASSERT_FALSE(r.isOk());
    EXPECT_NE(std::string::npos, r.error().message.find("=1"));
}

TEST(expression_parser_binary, missing_right_operand)
{
    EXPECT_EQ(ErrorCode::eNoExpression, parse_error("1+"));
    EXPECT_EQ(ErrorCode::eNoExpression, parse_error("a &&"));
    EXPECT_EQ(ErrorCode::eNoExpression, parse_error("-"));
}

TEST(expression_parser, empty_input)
{
    EXPECT_EQ(ErrorCode::eNoExpression, parse_error(""));
    EXPECT_EQ(ErrorCode::eNoExpression, parse_error("   "));
    EXPECT_EQ(ErrorCode::eNoExpression, parse_error(")"));
}

TEST(expression_parser, leftover_chars)
{
    EXPECT_EQ(ErrorCode::eLeftoverChars, parse_error("(1))"));
    EXPECT_EQ(ErrorCode::eLeftoverChars, parse_error("a#b"));
}

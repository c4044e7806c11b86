#include <gtest/gtest.h>

#include "shaderplus/expression_parser.hpp"

#include <limits>
#include <string>

using namespace shaderplus;

namespace
{
    Result<Literal> eval(const std::string& source, const Environment& env)
    {
        auto e = parse_expression(source);
        if (!e.isOk())
            return Result<Literal>::err(e.error());
        return evaluate(e.value(), env);
    }

    Literal eval_ok(const std::string& source, const Environment& env = Environment())
    {
        auto r = eval(source, env);
        EXPECT_TRUE(r.isOk()) << source << ": " << r.error().message;
        return r.value();
    }

    ErrorCode eval_error(const std::string& source, const Environment& env = Environment())
    {
        auto r = eval(source, env);
        EXPECT_FALSE(r.isOk()) << source << " evaluated to " << literal_to_string(r.value());
        return r.error().code;
    }
} // namespace

/* ******** Arithmetic ******** */

TEST(expression_eval_arithmetic, integers)
{
    EXPECT_EQ(Literal::fromInteger(5), eval_ok("2 + 3"));
    EXPECT_EQ(Literal::fromInteger(-1), eval_ok("2 - 3"));
    EXPECT_EQ(Literal::fromInteger(6), eval_ok("2 * 3"));
    EXPECT_EQ(Literal::fromInteger(3), eval_ok("7 / 2"));
    EXPECT_EQ(Literal::fromInteger(-3), eval_ok("-7 / 2"));
}

TEST(expression_eval_arithmetic, floats)
{
    EXPECT_EQ(Literal::fromFloat(4.0), eval_ok("1.5 + 2.5"));
    EXPECT_EQ(Literal::fromFloat(3.5), eval_ok("7.0 / 2.0"));
    EXPECT_EQ(Literal::fromFloat(-0.5), eval_ok("-0.5"));
}

TEST(expression_eval_arithmetic, float_division_by_zero)
{
    const Literal l = eval_ok("1.0 / 0.0");
    ASSERT_TRUE(l.isFloat());
    EXPECT_EQ(std::numeric_limits<double>::infinity(), l.real);
}

TEST(expression_eval_arithmetic, right_associative)
{
    Environment env;
    env.setGlobalInteger("a", 5);
    env.setGlobalInteger("b", 3);
    env.setGlobalInteger("c", 1);

    EXPECT_EQ(Literal::fromInteger(3), eval_ok("a - b - c", env));
    EXPECT_EQ(Literal::fromInteger(1), eval_ok("(a - b) - c", env));
    EXPECT_EQ(Literal::fromInteger(20), eval_ok("a * b + c", env));
}

TEST(expression_eval_arithmetic, parentheses_are_transparent)
{
    Environment env;
    env.setGlobalInteger("x", 9);

    for (const std::string e : {"x - 4", "x * 2 + 1", "0x10 | 1", "true && x > 3", "1.5 * 2.0", "~x"})
    {
        const Literal plain   = eval_ok(e, env);
        const Literal wrapped = eval_ok("(" + e + ")", env);
        EXPECT_EQ(plain, wrapped) << e;
    }
}

TEST(expression_eval_arithmetic, wraps_on_overflow)
{
    Environment env;
    env.setGlobalInteger("MAX", std::numeric_limits<int64_t>::max());
    env.setGlobalInteger("MIN", std::numeric_limits<int64_t>::min());

    EXPECT_EQ(Literal::fromInteger(std::numeric_limits<int64_t>::min()), eval_ok("MAX + 1", env));
    EXPECT_EQ(Literal::fromInteger(std::numeric_limits<int64_t>::max()), eval_ok("MIN - 1", env));
    EXPECT_EQ(Literal::fromInteger(std::numeric_limits<int64_t>::min()), eval_ok("-MIN", env));
}

TEST(expression_eval_arithmetic, mixed_kinds_are_rejected)
{
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("1 + 1.0"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("true + 1"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("true * false"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("1.0 & 1.0"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("1 | true"));

    auto r = eval("1 + true", Environment());
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ("Invalid operands for '+': (integer, bool)", r.error().message);
}

/* ******** Fatal integer division ******** */

TEST(expression_eval_division_death, by_zero)
{
    const Environment env;
    auto              e = parse_expression("1 / 0");
    ASSERT_TRUE(e.isOk());
    EXPECT_DEATH((void)evaluate(e.value(), env), "integer division by zero");
}

TEST(expression_eval_division_death, overflow)
{
    Environment env;
    env.setGlobalInteger("MIN", std::numeric_limits<int64_t>::min());
    auto e = parse_expression("MIN / -1");
    ASSERT_TRUE(e.isOk());
    EXPECT_DEATH((void)evaluate(e.value(), env), "integer division overflow");
}

/* ******** Bitwise ******** */

TEST(expression_eval_bitwise, integers)
{
    EXPECT_EQ(Literal::fromInteger(0b1000), eval_ok("0b1100 & 0b1010"));
    EXPECT_EQ(Literal::fromInteger(0b1110), eval_ok("0b1100 | 0b1010"));
    EXPECT_EQ(Literal::fromInteger(-1), eval_ok("~0"));
    EXPECT_EQ(Literal::fromInteger(9), eval_ok("BIT_0 | BIT_3"));
}

TEST(expression_eval_bitwise, booleans_do_not_short_circuit)
{
    EXPECT_EQ(Literal::fromBool(false), eval_ok("true & false"));
    EXPECT_EQ(Literal::fromBool(true), eval_ok("false | true"));

    // Both sides are evaluated, so an undefined name on the right still fails.
    EXPECT_EQ(ErrorCode::eUndefinedVariable, eval_error("false & MISSING"));
    EXPECT_EQ(ErrorCode::eUndefinedVariable, eval_error("true | MISSING"));
}

/* ******** Unary ******** */

TEST(expression_eval_unary, type_rules)
{
    EXPECT_EQ(Literal::fromBool(false), eval_ok("!true"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("!1"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("~1.0"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("-true"));
}

/* ******** Comparisons ******** */

TEST(expression_eval_comparison, ordering)
{
    EXPECT_EQ(Literal::fromBool(true), eval_ok("1 < 2"));
    EXPECT_EQ(Literal::fromBool(true), eval_ok("2 <= 2"));
    EXPECT_EQ(Literal::fromBool(false), eval_ok("2 > 2"));
    EXPECT_EQ(Literal::fromBool(true), eval_ok("2.5 >= 2.5"));
    EXPECT_EQ(Literal::fromBool(true), eval_ok("false < true"));
}

TEST(expression_eval_comparison, equality_across_kinds)
{
    EXPECT_EQ(Literal::fromBool(true), eval_ok("3 == 3"));
    EXPECT_EQ(Literal::fromBool(false), eval_ok("1 == 1.0"));
    EXPECT_EQ(Literal::fromBool(true), eval_ok("1 != true"));
    EXPECT_EQ(Literal::fromBool(false), eval_ok("0 == false"));
}

TEST(expression_eval_comparison, logical_short_circuit)
{
    EXPECT_EQ(Literal::fromBool(false), eval_ok("false && MISSING"));
    EXPECT_EQ(Literal::fromBool(true), eval_ok("true || MISSING"));
    EXPECT_EQ(ErrorCode::eUndefinedVariable, eval_error("true && MISSING"));
    EXPECT_EQ(ErrorCode::eUndefinedVariable, eval_error("false || MISSING"));
}

TEST(expression_eval_comparison, logical_returns_right_side)
{
    EXPECT_EQ(Literal::fromInteger(4), eval_ok("true && 4"));
    EXPECT_EQ(Literal::fromInteger(0), eval_ok("false || 0"));
}

TEST(expression_eval_comparison, logical_requires_bool_left)
{
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("1 && true"));
    EXPECT_EQ(ErrorCode::eInvalidExpression, eval_error("0.0 || true"));
}

/* ******** References ******** */

TEST(expression_eval_reference, override_wins)
{
    Environment env;
    env.setGlobalInteger("LIGHTS", 2);
    EXPECT_EQ(Literal::fromInteger(2), eval_ok("LIGHTS", env));

    env.setOverride("LIGHTS", Literal::fromInteger(8));
    EXPECT_EQ(Literal::fromInteger(8), eval_ok("LIGHTS", env));

    env.removeOverride("LIGHTS");
    EXPECT_EQ(Literal::fromInteger(2), eval_ok("LIGHTS", env));
}

TEST(expression_eval_reference, undefined_is_an_error)
{
    auto r = eval("NOPE + 1", Environment());
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(ErrorCode::eUndefinedVariable, r.error().code);
    EXPECT_EQ("Undefined variable: NOPE", r.error().message);
}

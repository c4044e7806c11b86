#pragma once

#include "shaderplus/environment.hpp"
#include "shaderplus/literal.hpp"
#include "shaderplus/result.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace shaderplus
{
    enum class ExpressionKind : uint8_t
    {
        eLiteral = 0,
        eReference,
        eOperator,
        eUnary,
        eComparison,
        eParenthesized
    };

    enum class BinaryOperator : uint8_t
    {
        eAdd = 0,
        eSubtract,
        eMultiply,
        eDivide,
        eBitwiseAnd,
        eBitwiseOr
    };

    enum class UnaryOperator : uint8_t
    {
        eNegate = 0,
        eNot,
        eBitwiseNot
    };

    enum class Comparison : uint8_t
    {
        eEqual = 0,
        eNotEqual,
        eLessThan,
        eLessOrEqual,
        eGreaterThan,
        eGreaterOrEqual,
        eAnd,
        eOr
    };

    // ------------------------------------------------------------
    // Expression
    //
    // Strict tree; every node owns its children. Fields used per kind:
    //   eLiteral       : literal
    //   eReference     : name
    //   eOperator      : left, binaryOp, right
    //   eUnary         : unaryOp, right (operand)
    //   eComparison    : left, comparison, right
    //   eParenthesized : right (inner)
    //
    // Built once by parse_expression(), then evaluated any number of times.
    // ------------------------------------------------------------
    struct Expression
    {
        ExpressionKind kind = ExpressionKind::eLiteral;

        Literal     literal {};
        std::string name;

        BinaryOperator binaryOp   = BinaryOperator::eAdd;
        UnaryOperator  unaryOp    = UnaryOperator::eNegate;
        Comparison     comparison = Comparison::eEqual;

        std::unique_ptr<Expression> left;
        std::unique_ptr<Expression> right;

        static Expression makeLiteral(Literal value);
        static Expression makeReference(std::string refName);
        static Expression makeOperator(Expression lhs, BinaryOperator op, Expression rhs);
        static Expression makeUnary(UnaryOperator op, Expression operand);
        static Expression makeComparison(Expression lhs, Comparison cmp, Expression rhs);
        static Expression makeParenthesized(Expression inner);
    };

    // Type rules are strict: arithmetic needs (integer, integer) or (float, float),
    // & and | accept (integer, integer) or (bool, bool), && and || need a bool on the
    // left and short-circuit. Undefined references fail with eUndefinedVariable.
    //
    // Integer division by zero is not an Error: it aborts the process.
    Result<Literal> evaluate(const Expression& expr, const Environment& env);

    // Debug rendering; every binary node is wrapped in parentheses so the
    // tree shape is visible.
    std::string expression_to_string(const Expression& expr);

    const char* binary_operator_symbol(BinaryOperator op);
    const char* unary_operator_symbol(UnaryOperator op);
    const char* comparison_symbol(Comparison cmp);
} // namespace shaderplus

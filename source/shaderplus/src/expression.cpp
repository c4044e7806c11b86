#include "shaderplus/expression.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <string_view>

namespace shaderplus
{
    namespace
    {
        [[noreturn]] void fatal(std::string_view message)
        {
            std::cerr << "[shaderplus][fatal] " << message << std::endl;
            std::abort();
        }

        // Two's complement wrap-around, no signed overflow.
        int64_t wrapping_add(int64_t a, int64_t b)
        {
            return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
        }

        int64_t wrapping_sub(int64_t a, int64_t b)
        {
            return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
        }

        int64_t wrapping_mul(int64_t a, int64_t b)
        {
            return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
        }

        int64_t checked_div(int64_t a, int64_t b)
        {
            if (b == 0)
                fatal("integer division by zero");
            if (a == std::numeric_limits<int64_t>::min() && b == -1)
                fatal("integer division overflow");
            return a / b;
        }

        Error type_error(const char* symbol, const Literal& l, const Literal& r)
        {
            return {ErrorCode::eInvalidExpression,
                    std::string("Invalid operands for '") + symbol + "': (" + literal_kind_name(l.kind) + ", " +
                        literal_kind_name(r.kind) + ")"};
        }

        Result<Literal> apply_operator(BinaryOperator op, const Literal& l, const Literal& r)
        {
            const char* symbol = binary_operator_symbol(op);

            if (l.kind != r.kind)
                return Result<Literal>::err(type_error(symbol, l, r));

            switch (op)
            {
                case BinaryOperator::eAdd:
                    if (l.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(wrapping_add(l.integer, r.integer)));
                    if (l.isFloat())
                        return Result<Literal>::ok(Literal::fromFloat(l.real + r.real));
                    break;
                case BinaryOperator::eSubtract:
                    if (l.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(wrapping_sub(l.integer, r.integer)));
                    if (l.isFloat())
                        return Result<Literal>::ok(Literal::fromFloat(l.real - r.real));
                    break;
                case BinaryOperator::eMultiply:
                    if (l.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(wrapping_mul(l.integer, r.integer)));
                    if (l.isFloat())
                        return Result<Literal>::ok(Literal::fromFloat(l.real * r.real));
                    break;
                case BinaryOperator::eDivide:
                    if (l.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(checked_div(l.integer, r.integer)));
                    if (l.isFloat())
                        return Result<Literal>::ok(Literal::fromFloat(l.real / r.real));
                    break;
                case BinaryOperator::eBitwiseAnd:
                    if (l.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(l.integer & r.integer));
                    if (l.isBool())
                        return Result<Literal>::ok(Literal::fromBool(l.boolean && r.boolean));
                    break;
                case BinaryOperator::eBitwiseOr:
                    if (l.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(l.integer | r.integer));
                    if (l.isBool())
                        return Result<Literal>::ok(Literal::fromBool(l.boolean || r.boolean));
                    break;
            }

            return Result<Literal>::err(type_error(symbol, l, r));
        }

        Result<Literal> apply_unary(UnaryOperator op, const Literal& v)
        {
            switch (op)
            {
                case UnaryOperator::eNegate:
                    if (v.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(wrapping_sub(0, v.integer)));
                    if (v.isFloat())
                        return Result<Literal>::ok(Literal::fromFloat(-v.real));
                    break;
                case UnaryOperator::eNot:
                    if (v.isBool())
                        return Result<Literal>::ok(Literal::fromBool(!v.boolean));
                    break;
                case UnaryOperator::eBitwiseNot:
                    if (v.isInteger())
                        return Result<Literal>::ok(Literal::fromInteger(~v.integer));
                    break;
            }

            return Result<Literal>::err({ErrorCode::eInvalidExpression,
                                         std::string("Invalid operand for unary '") + unary_operator_symbol(op) +
                                             "': " + literal_kind_name(v.kind)});
        }

        Result<Literal> apply_comparison(const Expression& expr, const Environment& env)
        {
            auto lr = evaluate(*expr.left, env);
            if (!lr.isOk())
                return lr;
            const Literal l = lr.value();

            // && and || short-circuit on a bool left operand.
            if (expr.comparison == Comparison::eAnd || expr.comparison == Comparison::eOr)
            {
                if (!l.isBool())
                    return Result<Literal>::err({ErrorCode::eInvalidExpression,
                                                 std::string("Left operand of '") +
                                                     comparison_symbol(expr.comparison) + "' must be bool, got " +
                                                     literal_kind_name(l.kind)});

                const bool shortCircuit = (expr.comparison == Comparison::eAnd) ? !l.boolean : l.boolean;
                if (shortCircuit)
                    return Result<Literal>::ok(l);
                return evaluate(*expr.right, env);
            }

            auto rr = evaluate(*expr.right, env);
            if (!rr.isOk())
                return rr;
            const Literal r = rr.value();

            const auto ord = compare_literals(l, r);

            switch (expr.comparison)
            {
                case Comparison::eEqual:
                    return Result<Literal>::ok(Literal::fromBool(l == r));
                case Comparison::eNotEqual:
                    return Result<Literal>::ok(Literal::fromBool(!(l == r)));
                case Comparison::eLessThan:
                    return Result<Literal>::ok(Literal::fromBool(ord < 0));
                case Comparison::eLessOrEqual:
                    return Result<Literal>::ok(Literal::fromBool(ord <= 0));
                case Comparison::eGreaterThan:
                    return Result<Literal>::ok(Literal::fromBool(ord > 0));
                case Comparison::eGreaterOrEqual:
                    return Result<Literal>::ok(Literal::fromBool(ord >= 0));
                default:
                    break;
            }

            return Result<Literal>::err({ErrorCode::eInvalidExpression, "Unknown comparison."});
        }
    } // namespace

    Expression Expression::makeLiteral(Literal value)
    {
        Expression e;
        e.kind    = ExpressionKind::eLiteral;
        e.literal = value;
        return e;
    }

    Expression Expression::makeReference(std::string refName)
    {
        Expression e;
        e.kind = ExpressionKind::eReference;
        e.name = std::move(refName);
        return e;
    }

    Expression Expression::makeOperator(Expression lhs, BinaryOperator op, Expression rhs)
    {
        Expression e;
        e.kind     = ExpressionKind::eOperator;
        e.binaryOp = op;
        e.left     = std::make_unique<Expression>(std::move(lhs));
        e.right    = std::make_unique<Expression>(std::move(rhs));
        return e;
    }

    Expression Expression::makeUnary(UnaryOperator op, Expression operand)
    {
        Expression e;
        e.kind    = ExpressionKind::eUnary;
        e.unaryOp = op;
        e.right   = std::make_unique<Expression>(std::move(operand));
        return e;
    }

    Expression Expression::makeComparison(Expression lhs, Comparison cmp, Expression rhs)
    {
        Expression e;
        e.kind       = ExpressionKind::eComparison;
        e.comparison = cmp;
        e.left       = std::make_unique<Expression>(std::move(lhs));
        e.right      = std::make_unique<Expression>(std::move(rhs));
        return e;
    }

    Expression Expression::makeParenthesized(Expression inner)
    {
        Expression e;
        e.kind  = ExpressionKind::eParenthesized;
        e.right = std::make_unique<Expression>(std::move(inner));
        return e;
    }

    Result<Literal> evaluate(const Expression& expr, const Environment& env)
    {
        switch (expr.kind)
        {
            case ExpressionKind::eLiteral:
                return Result<Literal>::ok(expr.literal);

            case ExpressionKind::eReference:
            {
                auto v = env.get(expr.name);
                if (!v)
                    return Result<Literal>::err({ErrorCode::eUndefinedVariable, "Undefined variable: " + expr.name});
                return Result<Literal>::ok(*v);
            }

            case ExpressionKind::eOperator:
            {
                auto l = evaluate(*expr.left, env);
                if (!l.isOk())
                    return l;
                auto r = evaluate(*expr.right, env);
                if (!r.isOk())
                    return r;
                return apply_operator(expr.binaryOp, l.value(), r.value());
            }

            case ExpressionKind::eUnary:
            {
                auto v = evaluate(*expr.right, env);
                if (!v.isOk())
                    return v;
                return apply_unary(expr.unaryOp, v.value());
            }

            case ExpressionKind::eComparison:
                return apply_comparison(expr, env);

            case ExpressionKind::eParenthesized:
                return evaluate(*expr.right, env);
        }

        return Result<Literal>::err({ErrorCode::eInvalidExpression, "Unknown expression kind."});
    }

    std::string expression_to_string(const Expression& expr)
    {
        switch (expr.kind)
        {
            case ExpressionKind::eLiteral:
                return literal_to_string(expr.literal);
            case ExpressionKind::eReference:
                return expr.name;
            case ExpressionKind::eOperator:
                return "(" + expression_to_string(*expr.left) + " " + binary_operator_symbol(expr.binaryOp) + " " +
                       expression_to_string(*expr.right) + ")";
            case ExpressionKind::eUnary:
                return unary_operator_symbol(expr.unaryOp) + expression_to_string(*expr.right);
            case ExpressionKind::eComparison:
                return "(" + expression_to_string(*expr.left) + " " + comparison_symbol(expr.comparison) + " " +
                       expression_to_string(*expr.right) + ")";
            case ExpressionKind::eParenthesized:
                return "(" + expression_to_string(*expr.right) + ")";
        }
        return {};
    }

    const char* binary_operator_symbol(BinaryOperator op)
    {
        switch (op)
        {
            case BinaryOperator::eAdd:
                return "+";
            case BinaryOperator::eSubtract:
                return "-";
            case BinaryOperator::eMultiply:
                return "*";
            case BinaryOperator::eDivide:
                return "/";
            case BinaryOperator::eBitwiseAnd:
                return "&";
            case BinaryOperator::eBitwiseOr:
                return "|";
            default:
                return "?";
        }
    }

    const char* unary_operator_symbol(UnaryOperator op)
    {
        switch (op)
        {
            case UnaryOperator::eNegate:
                return "-";
            case UnaryOperator::eNot:
                return "!";
            case UnaryOperator::eBitwiseNot:
                return "~";
            default:
                return "?";
        }
    }

    const char* comparison_symbol(Comparison cmp)
    {
        switch (cmp)
        {
            case Comparison::eEqual:
                return "==";
            case Comparison::eNotEqual:
                return "!=";
            case Comparison::eLessThan:
                return "<";
            case Comparison::eLessOrEqual:
                return "<=";
            case Comparison::eGreaterThan:
                return ">";
            case Comparison::eGreaterOrEqual:
                return ">=";
            case Comparison::eAnd:
                return "&&";
            case Comparison::eOr:
                return "||";
            default:
                return "?";
        }
    }
} // namespace shaderplus

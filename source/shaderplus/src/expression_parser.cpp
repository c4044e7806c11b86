#include "shaderplus/expression_parser.hpp"

#include <cctype>
#include <charconv>
#include <optional>
#include <string>

namespace shaderplus
{
    namespace
    {
        // Index cursor over an immutable buffer. Forking is a copy; a fork that
        // is not assigned back never consumes anything.
        struct Cursor
        {
            std::string_view s;
            size_t           i = 0;

            bool             atEnd() const { return i >= s.size(); }
            bool             peekIs(char c) const { return i < s.size() && s[i] == c; }
            char             peek() const { return i < s.size() ? s[i] : '\0'; }
            char             next() { return s[i++]; }
            std::string_view rest() const { return s.substr(i); }
            Cursor           fork() const { return *this; }
        };

        static bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
        static bool isHexDigit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
        static bool isIdentStart(char c) { return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_'; }
        static bool isIdentChar(char c) { return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_'; }

        struct Parser
        {
            // An empty optional means "no expression starts here"; callers
            // decide whether that is an error.
            using Parsed = Result<std::optional<Expression>>;

            Cursor cur;

            Error noExpression() const
            {
                return {ErrorCode::eNoExpression, "Expected an expression at offset " + std::to_string(cur.i)};
            }

            Result<Expression> parseRequired(bool shallow)
            {
                auto r = parseOne(shallow);
                if (!r.isOk())
                    return Result<Expression>::err(r.error());
                if (!r.value())
                    return Result<Expression>::err(noExpression());
                return Result<Expression>::ok(std::move(*r.value()));
            }

            Parsed parseOne(bool shallow)
            {
                auto termR = parseTerm();
                if (!termR.isOk() || !termR.value() || shallow)
                    return termR;

                Expression single = std::move(*termR.value());

                switch (cur.peek())
                {
                    case '+':
                        cur.next();
                        return binary(std::move(single), BinaryOperator::eAdd);
                    case '-':
                        cur.next();
                        return binary(std::move(single), BinaryOperator::eSubtract);
                    case '*':
                        cur.next();
                        return binary(std::move(single), BinaryOperator::eMultiply);
                    case '/':
                        cur.next();
                        return binary(std::move(single), BinaryOperator::eDivide);
                    case '&':
                        cur.next();
                        if (cur.peekIs('&'))
                        {
                            cur.next();
                            return comparison(std::move(single), Comparison::eAnd);
                        }
                        return binary(std::move(single), BinaryOperator::eBitwiseAnd);
                    case '|':
                        cur.next();
                        if (cur.peekIs('|'))
                        {
                            cur.next();
                            return comparison(std::move(single), Comparison::eOr);
                        }
                        return binary(std::move(single), BinaryOperator::eBitwiseOr);
                    case '>':
                        cur.next();
                        if (cur.peekIs('='))
                        {
                            cur.next();
                            return comparison(std::move(single), Comparison::eGreaterOrEqual);
                        }
                        return comparison(std::move(single), Comparison::eGreaterThan);
                    case '<':
                        cur.next();
                        if (cur.peekIs('='))
                        {
                            cur.next();
                            return comparison(std::move(single), Comparison::eLessOrEqual);
                        }
                        return comparison(std::move(single), Comparison::eLessThan);
                    case '!':
                    case '=':
                    {
                        // Only "!=" and "==" continue the expression. A lone '!' or
                        // '=' is left in place for the caller to reject.
                        const Comparison cmp   = cur.peekIs('!') ? Comparison::eNotEqual : Comparison::eEqual;
                        Cursor           ahead = cur.fork();
                        ahead.next();
                        if (!ahead.peekIs('='))
                            return Parsed::ok(std::move(single));
                        ahead.next();
                        cur = ahead;
                        return comparison(std::move(single), cmp);
                    }
                    default:
                        return Parsed::ok(std::move(single));
                }
            }

            Parsed binary(Expression lhs, BinaryOperator op)
            {
                auto rhs = parseRequired(false);
                if (!rhs.isOk())
                    return Parsed::err(rhs.error());
                return Parsed::ok(Expression::makeOperator(std::move(lhs), op, std::move(rhs.value())));
            }

            Parsed comparison(Expression lhs, Comparison cmp)
            {
                auto rhs = parseRequired(false);
                if (!rhs.isOk())
                    return Parsed::err(rhs.error());
                return Parsed::ok(Expression::makeComparison(std::move(lhs), cmp, std::move(rhs.value())));
            }

            Parsed unary(UnaryOperator op)
            {
                cur.next();
                auto operand = parseRequired(true);
                if (!operand.isOk())
                    return Parsed::err(operand.error());
                return Parsed::ok(Expression::makeUnary(op, std::move(operand.value())));
            }

            Parsed parseTerm()
            {
                if (cur.atEnd())
                    return Parsed::ok(std::nullopt);

                const char c = cur.peek();

                if (c == '!')
                    return unary(UnaryOperator::eNot);
                if (c == '~')
                    return unary(UnaryOperator::eBitwiseNot);
                if (c == '-')
                    return unary(UnaryOperator::eNegate);

                if (c == '(')
                {
                    cur.next();
                    auto inner = parseRequired(false);
                    if (!inner.isOk())
                        return Parsed::err(inner.error());
                    if (!cur.peekIs(')'))
                        return Parsed::err({ErrorCode::eNoClosingParenthesis,
                                            "Expected ')' at offset " + std::to_string(cur.i)});
                    cur.next();
                    return Parsed::ok(Expression::makeParenthesized(std::move(inner.value())));
                }

                if (isDigit(c))
                {
                    auto n = parseNumber();
                    if (!n.isOk())
                        return Parsed::err(n.error());
                    return Parsed::ok(std::move(n.value()));
                }

                if (isIdentStart(c))
                    return Parsed::ok(parseIdentifier());

                return Parsed::ok(std::nullopt);
            }

            Result<Expression> parseNumber()
            {
                std::string buffer;
                buffer.push_back(cur.next());

                bool   period     = false;
                int    radix      = 10;
                size_t sliceStart = 0;

                while (!cur.atEnd())
                {
                    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(cur.peek())));

                    if (isDigit(c) || (radix == 16 && isHexDigit(c)))
                    {
                        buffer.push_back(cur.next());
                    }
                    else if (c == '_')
                    {
                        cur.next();
                    }
                    else if (c == '.')
                    {
                        buffer.push_back(cur.next());
                        if (period)
                            return Result<Expression>::err(
                                {ErrorCode::eDuplicatePeriod, "Duplicate '.' in number literal: " + buffer});
                        period = true;
                    }
                    else if (c == 'b' || c == 'o' || c == 'x')
                    {
                        if (buffer != "0")
                            return Result<Expression>::err(
                                {ErrorCode::eInvalidBase, "Invalid base prefix in number literal: " + buffer + c});
                        buffer.push_back(cur.next());
                        sliceStart = 2;
                        radix      = (c == 'b') ? 2 : (c == 'o') ? 8 : 16;
                    }
                    else
                    {
                        break;
                    }
                }

                const std::string_view digits = std::string_view(buffer).substr(sliceStart);
                const char*            first  = digits.data();
                const char*            last   = digits.data() + digits.size();

                if (period)
                {
                    double v   = 0.0;
                    auto   res = std::from_chars(first, last, v);
                    if (res.ec != std::errc() || res.ptr != last)
                        return Result<Expression>::err(
                            {ErrorCode::eParseFloat, "Invalid float literal: " + std::string(digits)});
                    return Result<Expression>::ok(Expression::makeLiteral(Literal::fromFloat(v)));
                }

                if (digits.empty())
                    return Result<Expression>::err(
                        {ErrorCode::eParseInt, "Cannot parse integer from empty digits: " + buffer});

                int64_t v   = 0;
                auto    res = std::from_chars(first, last, v, radix);
                if (res.ec == std::errc::result_out_of_range)
                    return Result<Expression>::err(
                        {ErrorCode::eParseInt, "Integer literal out of range: " + buffer});
                if (res.ec != std::errc() || res.ptr != last)
                    return Result<Expression>::err(
                        {ErrorCode::eParseInt,
                         "Invalid digit in base-" + std::to_string(radix) + " integer literal: " + buffer});

                return Result<Expression>::ok(Expression::makeLiteral(Literal::fromInteger(v)));
            }

            Expression parseIdentifier()
            {
                const size_t start = cur.i;
                cur.next();
                while (!cur.atEnd() && isIdentChar(cur.peek()))
                    cur.next();

                const std::string_view ident = cur.s.substr(start, cur.i - start);
                if (ident == "true")
                    return Expression::makeLiteral(Literal::fromBool(true));
                if (ident == "false")
                    return Expression::makeLiteral(Literal::fromBool(false));
                return Expression::makeReference(std::string(ident));
            }
        };
    } // namespace

    Result<Expression> parse_expression(std::string_view source)
    {
        std::string compact;
        compact.reserve(source.size());
        for (char c : source)
        {
            if (std::isspace(static_cast<unsigned char>(c)) == 0)
                compact.push_back(c);
        }

        Parser p {Cursor {compact, 0}};
        auto   r = p.parseOne(false);
        if (!r.isOk())
            return Result<Expression>::err(r.error());
        if (!r.value())
            return Result<Expression>::err(p.noExpression());

        // Ensure full consumption
        if (!p.cur.atEnd())
            return Result<Expression>::err(
                {ErrorCode::eLeftoverChars, "Leftover characters in expression: " + std::string(p.cur.rest())});

        return Result<Expression>::ok(std::move(*r.value()));
    }
} // namespace shaderplus

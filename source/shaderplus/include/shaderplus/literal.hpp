#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace shaderplus
{
    enum class LiteralKind : uint8_t
    {
        eInteger = 0,
        eFloat   = 1,
        eBool    = 2
    };

    // ------------------------------------------------------------
    // Literal
    //
    // Tagged value produced by expression evaluation and stored in the
    // environment. Only the field selected by `kind` is meaningful.
    // ------------------------------------------------------------
    struct Literal
    {
        LiteralKind kind    = LiteralKind::eInteger;
        int64_t     integer = 0;
        double      real    = 0.0;
        bool        boolean = false;

        static Literal fromInteger(int64_t v)
        {
            Literal l;
            l.kind    = LiteralKind::eInteger;
            l.integer = v;
            return l;
        }

        static Literal fromFloat(double v)
        {
            Literal l;
            l.kind = LiteralKind::eFloat;
            l.real = v;
            return l;
        }

        static Literal fromBool(bool v)
        {
            Literal l;
            l.kind    = LiteralKind::eBool;
            l.boolean = v;
            return l;
        }

        bool isInteger() const { return kind == LiteralKind::eInteger; }
        bool isFloat() const { return kind == LiteralKind::eFloat; }
        bool isBool() const { return kind == LiteralKind::eBool; }
    };

    // Values of different kinds are never equal. NaN is unequal to itself.
    bool operator==(const Literal& a, const Literal& b);

    // Orders by kind first (Integer < Float < Bool), then by value.
    // Floats involving NaN are unordered.
    std::partial_ordering compare_literals(const Literal& a, const Literal& b);

    // Nonzero integers, nonzero floats and `true` count as true.
    bool is_truthy(const Literal& l);

    // Integer in decimal, bool as true/false, float in shortest round-trip form
    // that always reads back as a float (1.0 renders as "1.0").
    std::string literal_to_string(const Literal& l);

    const char* literal_kind_name(LiteralKind kind);
} // namespace shaderplus

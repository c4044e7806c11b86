#include "shaderplus/literal.hpp"

#include <charconv>

namespace shaderplus
{
    bool operator==(const Literal& a, const Literal& b)
    {
        if (a.kind != b.kind)
            return false;

        switch (a.kind)
        {
            case LiteralKind::eInteger:
                return a.integer == b.integer;
            case LiteralKind::eFloat:
                return a.real == b.real;
            case LiteralKind::eBool:
                return a.boolean == b.boolean;
        }
        return false;
    }

    std::partial_ordering compare_literals(const Literal& a, const Literal& b)
    {
        if (a.kind != b.kind)
            return static_cast<uint8_t>(a.kind) <=> static_cast<uint8_t>(b.kind);

        switch (a.kind)
        {
            case LiteralKind::eInteger:
                return a.integer <=> b.integer;
            case LiteralKind::eFloat:
                return a.real <=> b.real;
            case LiteralKind::eBool:
                return a.boolean <=> b.boolean;
        }
        return std::partial_ordering::unordered;
    }

    bool is_truthy(const Literal& l)
    {
        switch (l.kind)
        {
            case LiteralKind::eInteger:
                return l.integer != 0;
            case LiteralKind::eFloat:
                return l.real != 0.0;
            case LiteralKind::eBool:
                return l.boolean;
        }
        return false;
    }

    std::string literal_to_string(const Literal& l)
    {
        switch (l.kind)
        {
            case LiteralKind::eInteger:
                return std::to_string(l.integer);
            case LiteralKind::eBool:
                return l.boolean ? "true" : "false";
            case LiteralKind::eFloat:
            {
                char buf[64];
                auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), l.real);
                if (ec != std::errc())
                    return std::to_string(l.real);

                std::string s(buf, end);
                // "inf" and "nan" contain an 'n'
                if (s.find_first_of(".eEn") == std::string::npos)
                    s += ".0";
                return s;
            }
        }
        return {};
    }

    const char* literal_kind_name(LiteralKind kind)
    {
        switch (kind)
        {
            case LiteralKind::eInteger:
                return "integer";
            case LiteralKind::eFloat:
                return "float";
            case LiteralKind::eBool:
                return "bool";
            default:
                return "unknown";
        }
    }
} // namespace shaderplus

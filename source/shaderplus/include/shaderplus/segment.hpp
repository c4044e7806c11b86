#pragma once

#include "shaderplus/environment.hpp"
#include "shaderplus/expression.hpp"
#include "shaderplus/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shaderplus
{
    // ------------------------------------------------------------
    // IncludeResolver
    //
    // Supplies the fully expanded text of an included shader. Nested includes
    // must already be resolved in the returned text.
    // ------------------------------------------------------------
    class IncludeResolver
    {
    public:
        virtual ~IncludeResolver() = default;

        virtual Result<std::string> resolve(std::string_view path) const = 0;
    };

    enum class SegmentKind : uint8_t
    {
        eText = 0,
        eInclude,
        eConstant,
        eConditional,
        eSequence
    };

    // ------------------------------------------------------------
    // Segment
    //
    // One piece of eventual output. Fields used per kind:
    //   eText        : text (raw output, newlines included)
    //   eInclude     : text (include path)
    //   eConstant    : text (environment name)
    //   eConditional : condition, ifTrue, ifFalse (may be null)
    //   eSequence    : children
    //
    // A sequence never holds two adjacent text children nor a sequence
    // child; concat() keeps it that way while the tree is being built.
    // ------------------------------------------------------------
    struct Segment
    {
        SegmentKind kind = SegmentKind::eText;
        std::string text;

        std::unique_ptr<Expression> condition;
        std::unique_ptr<Segment>    ifTrue;
        std::unique_ptr<Segment>    ifFalse;

        std::vector<Segment> children;

        static Segment makeText(std::string raw);
        static Segment makeInclude(std::string path);
        static Segment makeConstant(std::string constName);
        static Segment makeConditional(Expression cond, Segment whenTrue);
        static Segment makeConditional(Expression cond, Segment whenTrue, Segment whenFalse);
        static Segment makeSequence(std::vector<Segment> items);

        // Two text nodes, or either side already a sequence.
        bool canConcatFast(const Segment& other) const;

        // Makes this segment represent "this followed by other".
        void concat(Segment other);

        Result<void> write(std::string& out, const Environment& env, const IncludeResolver& includes) const;

        // 1 for a leaf.
        size_t depth() const;

    private:
        void appendToSequence(Segment seg);
    };
} // namespace shaderplus

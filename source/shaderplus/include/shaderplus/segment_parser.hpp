#pragma once

#include "shaderplus/result.hpp"
#include "shaderplus/segment.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shaderplus
{
    // Directive lines start with this marker followed by the operation:
    //   //:include <path>
    //   //:const <name>
    //   //:if <expression> ... [//:else ...] //:end
    inline constexpr std::string_view kDirectiveMarker = "//:";

    enum class SegmentEndReason : uint8_t
    {
        eNone = 0,
        eEndOfFile,
        eElseSeen,
        eEndSeen
    };

    // ------------------------------------------------------------
    // LineCursor
    //
    // Forward cursor over the non-empty, trimmed lines of a source text.
    // Views point into the source, which must outlive the cursor.
    // ------------------------------------------------------------
    class LineCursor
    {
    public:
        struct Line
        {
            size_t           number = 0; // 1-based line in the original source
            std::string_view text;
        };

        LineCursor() = default;
        explicit LineCursor(std::vector<Line> lines) : m_Lines(std::move(lines)) {}

        // Splits on '\n' (dropping a trailing '\r'), trims each line and
        // drops the ones left empty.
        static LineCursor fromSource(std::string_view source);

        bool        atEnd() const { return m_Index >= m_Lines.size(); }
        const Line& next() { return m_Lines[m_Index++]; }
        size_t      remainingCount() const { return m_Lines.size() - m_Index; }

        // Remaining lines joined with '\n'.
        std::string remainingText() const;

    private:
        std::vector<Line> m_Lines;
        size_t            m_Index = 0;
    };

    struct SegmentParse
    {
        Segment          segment;
        SegmentEndReason endReason = SegmentEndReason::eNone;
    };

    // Consumes lines until end of input, `//:else` or `//:end` (the directive
    // line itself is consumed) and reports which one stopped it.
    Result<SegmentParse> parse_segment(LineCursor& lines);
} // namespace shaderplus

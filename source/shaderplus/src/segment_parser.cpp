#include "shaderplus/segment_parser.hpp"
#include "shaderplus/expression_parser.hpp"

#include <cctype>

namespace shaderplus
{
    static inline std::string_view trim(std::string_view s)
    {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
            s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            s.remove_suffix(1);
        return s;
    }

    static inline bool starts_with(std::string_view s, std::string_view p)
    {
        return s.size() >= p.size() && s.substr(0, p.size()) == p;
    }

    static inline Error at_line(size_t lineNo, const Error& e)
    {
        return {e.code, "line " + std::to_string(lineNo) + ": " + e.message};
    }

    LineCursor LineCursor::fromSource(std::string_view source)
    {
        std::vector<Line> lines;

        size_t i      = 0;
        size_t lineNo = 0;
        while (i < source.size())
        {
            size_t j = source.find('\n', i);
            if (j == std::string_view::npos)
                j = source.size();
            std::string_view sv = source.substr(i, j - i);
            i                   = (j == source.size()) ? j : (j + 1);
            ++lineNo;

            // Strip CR
            if (!sv.empty() && sv.back() == '\r')
                sv.remove_suffix(1);

            sv = trim(sv);
            if (sv.empty())
                continue;

            lines.push_back({lineNo, sv});
        }

        return LineCursor(std::move(lines));
    }

    std::string LineCursor::remainingText() const
    {
        std::string out;
        for (size_t k = m_Index; k < m_Lines.size(); ++k)
        {
            if (k != m_Index)
                out.push_back('\n');
            out += m_Lines[k].text;
        }
        return out;
    }

    Result<SegmentParse> parse_segment(LineCursor& lines)
    {
        Segment segment = Segment::makeText({});

        while (!lines.atEnd())
        {
            const LineCursor::Line& line = lines.next();
            std::string_view        s    = trim(line.text);

            if (!starts_with(s, kDirectiveMarker))
            {
                std::string raw(s);
                raw.push_back('\n');
                segment.concat(Segment::makeText(std::move(raw)));
                continue;
            }

            s.remove_prefix(kDirectiveMarker.size());

            // operation [' ' parameter]; the parameter is everything after the first space.
            std::string_view operation = s;
            std::string_view parameter = {};
            const auto       sp        = s.find(' ');
            if (sp != std::string_view::npos)
            {
                operation = s.substr(0, sp);
                parameter = s.substr(sp + 1);
            }

            if (operation == "include")
            {
                segment.concat(Segment::makeInclude(std::string(parameter)));
            }
            else if (operation == "const")
            {
                segment.concat(Segment::makeConstant(std::string(parameter)));
            }
            else if (operation == "if")
            {
                const size_t ifLine = line.number;

                auto cond = parse_expression(parameter);
                if (!cond.isOk())
                    return Result<SegmentParse>::err(at_line(ifLine, cond.error()));

                auto whenTrue = parse_segment(lines);
                if (!whenTrue.isOk())
                    return whenTrue;

                switch (whenTrue.value().endReason)
                {
                    case SegmentEndReason::eElseSeen:
                    {
                        auto whenFalse = parse_segment(lines);
                        if (!whenFalse.isOk())
                            return whenFalse;

                        const auto falseEnd = whenFalse.value().endReason;
                        if (falseEnd != SegmentEndReason::eEndSeen && falseEnd != SegmentEndReason::eEndOfFile)
                            return Result<SegmentParse>::err(
                                {ErrorCode::eInvalidIfBlock,
                                 "line " + std::to_string(ifLine) + ": if block has more than one else"});

                        segment.concat(Segment::makeConditional(std::move(cond.value()),
                                                                std::move(whenTrue.value().segment),
                                                                std::move(whenFalse.value().segment)));
                        break;
                    }
                    case SegmentEndReason::eEndSeen:
                    case SegmentEndReason::eEndOfFile:
                        segment.concat(
                            Segment::makeConditional(std::move(cond.value()), std::move(whenTrue.value().segment)));
                        break;
                    default:
                        return Result<SegmentParse>::err(
                            {ErrorCode::eInvalidIfBlock, "line " + std::to_string(ifLine) + ": invalid if block"});
                }
            }
            else if (operation == "else")
            {
                return Result<SegmentParse>::ok({std::move(segment), SegmentEndReason::eElseSeen});
            }
            else if (operation == "end")
            {
                return Result<SegmentParse>::ok({std::move(segment), SegmentEndReason::eEndSeen});
            }
            else
            {
                return Result<SegmentParse>::err(
                    {ErrorCode::eUnknownOperation,
                     "line " + std::to_string(line.number) + ": unknown operation: " + std::string(operation)});
            }
        }

        return Result<SegmentParse>::ok({std::move(segment), SegmentEndReason::eEndOfFile});
    }
} // namespace shaderplus

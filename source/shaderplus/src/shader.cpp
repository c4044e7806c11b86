#include "shaderplus/shader.hpp"
#include "shaderplus/hash.hpp"
#include "shaderplus/segment_parser.hpp"

namespace shaderplus
{
    Result<Shader> Shader::parse(std::string_view source)
    {
        LineCursor lines = LineCursor::fromSource(source);

        auto r = parse_segment(lines);
        if (!r.isOk())
            return Result<Shader>::err(r.error());

        const auto reason = r.value().endReason;
        if (reason == SegmentEndReason::eElseSeen || reason == SegmentEndReason::eEndSeen)
        {
            std::string msg = reason == SegmentEndReason::eElseSeen ? "Unmatched //:else" : "Unmatched //:end";
            if (!lines.atEnd())
                msg += " before:\n" + lines.remainingText();
            return Result<Shader>::err({ErrorCode::eLeftoverLines, std::move(msg)});
        }

        if (!lines.atEnd())
            return Result<Shader>::err({ErrorCode::eLeftoverLines, "Leftover lines:\n" + lines.remainingText()});

        Shader shader;
        shader.m_Root       = std::move(r.value().segment);
        shader.m_Capacity   = source.size();
        shader.m_SourceHash = xxhash64(source);
        return Result<Shader>::ok(std::move(shader));
    }

    Result<std::string> Shader::evaluate(const Environment& env, const IncludeResolver& includes) const
    {
        std::string out;
        out.reserve(m_Capacity);

        auto r = m_Root.write(out, env, includes);
        if (!r.isOk())
            return Result<std::string>::err(r.error());

        return Result<std::string>::ok(std::move(out));
    }
} // namespace shaderplus

#pragma once

#include "shaderplus/environment.hpp"
#include "shaderplus/result.hpp"
#include "shaderplus/segment.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace shaderplus
{
    // ------------------------------------------------------------
    // Shader
    //
    // A parsed shader source: the root segment plus the source length, used
    // to pre-size the output buffer. Immutable once parsed, so one instance
    // may be evaluated from several threads as long as each caller's
    // environment and resolver are safe to read concurrently.
    // ------------------------------------------------------------
    class Shader
    {
    public:
        Shader() = default;

        // Fails with eLeftoverLines when an `//:else` or `//:end` has no
        // matching `//:if`.
        static Result<Shader> parse(std::string_view source);

        Result<std::string> evaluate(const Environment& env, const IncludeResolver& includes) const;

        const Segment& root() const { return m_Root; }
        size_t         capacityHint() const { return m_Capacity; }

        // xxHash64 of the source text this shader was parsed from.
        uint64_t sourceHash() const { return m_SourceHash; }

    private:
        Segment  m_Root;
        size_t   m_Capacity   = 0;
        uint64_t m_SourceHash = 0;
    };
} // namespace shaderplus

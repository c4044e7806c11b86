#pragma once

#include "shaderplus/environment.hpp"
#include "shaderplus/hash.hpp"
#include "shaderplus/literal.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace shaderplus
{
    struct VariantKeyEntry
    {
        uint64_t nameHash = 0;
        uint8_t  kind     = 0;
        uint64_t bits     = 0;
    };

    // ------------------------------------------------------------
    // VariantKey
    //
    // Stable 64-bit identity of "this shader resolved against these values",
    // used as the resolved-output cache key.
    //
    // key = hash(shaderPathHash, sorted sourceHashes..., sorted (nameHash, kind, value bits)...)
    // ------------------------------------------------------------
    class VariantKey
    {
    public:
        VariantKey() = default;

        void setShaderPath(std::string_view path) { m_ShaderPathHash = xxhash64(path); }

        // Mixes the content of a shader the output depends on into the key.
        void addSourceHash(uint64_t sourceHash) { m_SourceHashes.push_back(sourceHash); }

        // Captures every name visible through env.get().
        void setEnvironment(const Environment& env);

        void set(std::string_view name, const Literal& value);

        void clear()
        {
            m_Entries.clear();
            m_SourceHashes.clear();
        }

        uint64_t build() const;

    private:
        uint64_t                     m_ShaderPathHash = 0;
        std::vector<uint64_t>        m_SourceHashes;
        std::vector<VariantKeyEntry> m_Entries;
    };
} // namespace shaderplus

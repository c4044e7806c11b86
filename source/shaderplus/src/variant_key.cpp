#include "shaderplus/variant_key.hpp"

#include <algorithm>
#include <cstring>
#include <vector>

namespace shaderplus
{
    void VariantKey::setEnvironment(const Environment& env)
    {
        const auto entries = env.effectiveEntries();
        m_Entries.reserve(m_Entries.size() + entries.size());
        for (const auto& [name, value] : entries)
            set(name, value);
    }

    void VariantKey::set(std::string_view name, const Literal& value)
    {
        VariantKeyEntry e;
        e.nameHash = xxhash64(name);
        e.kind     = static_cast<uint8_t>(value.kind);

        switch (value.kind)
        {
            case LiteralKind::eInteger:
                e.bits = static_cast<uint64_t>(value.integer);
                break;
            case LiteralKind::eFloat:
                std::memcpy(&e.bits, &value.real, sizeof(double));
                break;
            case LiteralKind::eBool:
                e.bits = value.boolean ? 1u : 0u;
                break;
        }

        m_Entries.push_back(e);
    }

    uint64_t VariantKey::build() const
    {
        // Deterministic order
        std::vector<VariantKeyEntry> kvs = m_Entries;
        std::sort(kvs.begin(), kvs.end(), [](const VariantKeyEntry& a, const VariantKeyEntry& b) {
            if (a.nameHash != b.nameHash)
                return a.nameHash < b.nameHash;
            if (a.kind != b.kind)
                return a.kind < b.kind;
            return a.bits < b.bits;
        });

        std::vector<uint64_t> sources = m_SourceHashes;
        std::sort(sources.begin(), sources.end());

        std::vector<uint8_t> buf;
        buf.reserve(16 + sources.size() * 8 + kvs.size() * 20);

        auto append_u64 = [&](uint64_t v) {
            uint8_t b[8];
            std::memcpy(b, &v, 8);
            buf.insert(buf.end(), b, b + 8);
        };
        auto append_u32 = [&](uint32_t v) {
            uint8_t b[4];
            std::memcpy(b, &v, 4);
            buf.insert(buf.end(), b, b + 4);
        };

        append_u64(m_ShaderPathHash);
        append_u32(static_cast<uint32_t>(sources.size()));
        for (uint64_t h : sources)
            append_u64(h);
        append_u32(static_cast<uint32_t>(kvs.size()));
        for (const auto& kv : kvs)
        {
            append_u64(kv.nameHash);
            append_u32(kv.kind);
            append_u64(kv.bits);
        }

        return xxhash64(buf.data(), buf.size());
    }
} // namespace shaderplus

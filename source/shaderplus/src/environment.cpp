#include "shaderplus/environment.hpp"

#include <algorithm>

namespace shaderplus
{
    Environment::Environment() : Environment(true) {}

    Environment::Environment(bool predefineBits)
    {
        if (!predefineBits)
            return;

        m_Globals.reserve(64);
        for (int i = 0; i < 64; ++i)
            m_Globals["BIT_" + std::to_string(i)] = Literal::fromInteger(static_cast<int64_t>(uint64_t {1} << i));
    }

    std::optional<Literal> Environment::get(const std::string& name) const
    {
        auto it = m_Overrides.find(name);
        if (it != m_Overrides.end())
            return it->second;

        it = m_Globals.find(name);
        if (it != m_Globals.end())
            return it->second;

        return std::nullopt;
    }

    std::vector<std::pair<std::string, Literal>> Environment::effectiveEntries() const
    {
        std::unordered_map<std::string, Literal> merged = m_Globals;
        for (const auto& [name, value] : m_Overrides)
            merged[name] = value;

        std::vector<std::pair<std::string, Literal>> out(merged.begin(), merged.end());
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
        return out;
    }
} // namespace shaderplus

#pragma once

#include "shaderplus/literal.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shaderplus
{
    // ------------------------------------------------------------
    // Environment
    //
    // Two-tier name -> Literal mapping consulted by expression evaluation
    // and `//:const` expansion. Local overrides shadow globals on lookup.
    //
    // A default-constructed environment predefines BIT_0 .. BIT_63 as
    // integer globals (1 << i).
    // ------------------------------------------------------------
    class Environment
    {
    public:
        Environment();
        explicit Environment(bool predefineBits);

        // Override first, then global. std::nullopt when the name is undefined.
        std::optional<Literal> get(const std::string& name) const;

        void setGlobal(const std::string& name, Literal value) { m_Globals[name] = value; }
        void setGlobalInteger(const std::string& name, int64_t value) { setGlobal(name, Literal::fromInteger(value)); }
        void setGlobalFloat(const std::string& name, double value) { setGlobal(name, Literal::fromFloat(value)); }
        void setGlobalBool(const std::string& name, bool value) { setGlobal(name, Literal::fromBool(value)); }
        bool removeGlobal(const std::string& name) { return m_Globals.erase(name) != 0; }

        void setOverride(const std::string& name, Literal value) { m_Overrides[name] = value; }
        bool removeOverride(const std::string& name) { return m_Overrides.erase(name) != 0; }
        void clearOverrides() { m_Overrides.clear(); }

        const std::unordered_map<std::string, Literal>& globals() const { return m_Globals; }
        const std::unordered_map<std::string, Literal>& overrides() const { return m_Overrides; }

        // Every visible name with the value `get` would return, sorted by name.
        std::vector<std::pair<std::string, Literal>> effectiveEntries() const;

    private:
        std::unordered_map<std::string, Literal> m_Globals;
        std::unordered_map<std::string, Literal> m_Overrides;
    };
} // namespace shaderplus

#pragma once

#include "shaderplus/environment.hpp"
#include "shaderplus/result.hpp"
#include "shaderplus/shader.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shaderplus
{
    // ------------------------------------------------------------
    // Workspace
    //
    // Maps shader paths (relative to the workspace root, '/'-separated) to
    // parsed shaders and owns the environment they are evaluated against.
    //
    // `//:include <path>` is looked up in the same workspace and expanded
    // recursively. A shader that ends up including itself fails with
    // eIncludeCycle.
    // ------------------------------------------------------------
    class Workspace
    {
    public:
        Workspace() = default;
        explicit Workspace(std::filesystem::path root) : m_Root(std::move(root)) {}

        // shaders: (path relative to root, source)
        static Result<Workspace> fromMemory(std::filesystem::path                                   root,
                                            const std::vector<std::pair<std::string, std::string>>& shaders);

        // Loads every regular file under root (recursively) whose extension is
        // listed.
        static Result<Workspace> scan(std::filesystem::path           root,
                                      const std::vector<std::string>& extensions = {".wgsl"});

        Result<void> addShader(std::string_view path, std::string_view source);

        bool                     contains(std::string_view path) const;
        const Shader*            findShader(std::string_view path) const;
        std::vector<std::string> shaderPaths() const; // sorted

        Environment&                 environment() { return m_Environment; }
        const Environment&           environment() const { return m_Environment; }
        const std::filesystem::path& root() const { return m_Root; }

        // Fully resolved text of the shader, eNotFound if the path is unknown.
        Result<std::string> getShader(std::string_view path) const;

        // "./a/../b.wgsl" -> "b.wgsl"
        static std::string normalizePath(std::string_view path);

    private:
        class Resolver;

        Result<std::string> evaluateShader(const std::string& key, std::vector<std::string>& active) const;

        std::filesystem::path                   m_Root;
        Environment                             m_Environment;
        std::unordered_map<std::string, Shader> m_Shaders;
    };
} // namespace shaderplus

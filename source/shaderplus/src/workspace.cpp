#include "shaderplus/workspace.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace shaderplus
{
    namespace
    {
        bool read_text_file(const std::filesystem::path& path, std::string& out)
        {
            std::ifstream f(path, std::ios::binary);
            if (!f)
                return false;

            f.seekg(0, std::ios::end);
            const std::streamoff size = f.tellg();
            if (size < 0)
                return false;

            f.seekg(0, std::ios::beg);

            out.resize(static_cast<size_t>(size));
            f.read(out.data(), size);

            return static_cast<bool>(f);
        }
    } // namespace

    // Resolves includes for one getShader() call; `active` is the chain of
    // shaders currently being expanded.
    class Workspace::Resolver final : public IncludeResolver
    {
    public:
        Resolver(const Workspace& workspace, std::vector<std::string>& active) :
            m_Workspace(workspace), m_Active(active)
        {}

        Result<std::string> resolve(std::string_view path) const override
        {
            return m_Workspace.evaluateShader(Workspace::normalizePath(path), m_Active);
        }

    private:
        const Workspace&          m_Workspace;
        std::vector<std::string>& m_Active;
    };

    std::string Workspace::normalizePath(std::string_view path)
    {
        return std::filesystem::path(path).lexically_normal().generic_string();
    }

    Result<Workspace> Workspace::fromMemory(std::filesystem::path                                   root,
                                            const std::vector<std::pair<std::string, std::string>>& shaders)
    {
        Workspace ws(std::move(root));
        for (const auto& [path, source] : shaders)
        {
            auto r = ws.addShader(path, source);
            if (!r.isOk())
                return Result<Workspace>::err(r.error());
        }
        return Result<Workspace>::ok(std::move(ws));
    }

    Result<Workspace> Workspace::scan(std::filesystem::path root, const std::vector<std::string>& extensions)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec))
            return Result<Workspace>::err({ErrorCode::eIO, "Workspace root is not a directory: " + root.string()});

        Workspace ws(root);

        std::filesystem::recursive_directory_iterator it(root, ec);
        if (ec)
            return Result<Workspace>::err({ErrorCode::eIO, "Failed to scan " + root.string() + ": " + ec.message()});

        for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
                return Result<Workspace>::err(
                    {ErrorCode::eIO, "Failed to scan " + root.string() + ": " + ec.message()});

            const auto& entry = *it;
            if (!entry.is_regular_file(ec))
                continue;

            const std::string ext = entry.path().extension().string();
            if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end())
                continue;

            std::string source;
            if (!read_text_file(entry.path(), source))
                return Result<Workspace>::err({ErrorCode::eIO, "Failed to read shader: " + entry.path().string()});

            const std::string rel = entry.path().lexically_relative(root).generic_string();
            auto              r   = ws.addShader(rel, source);
            if (!r.isOk())
                return Result<Workspace>::err(r.error());
        }

        return Result<Workspace>::ok(std::move(ws));
    }

    Result<void> Workspace::addShader(std::string_view path, std::string_view source)
    {
        const std::string key = normalizePath(path);
        if (key.empty() || key == ".")
            return Result<void>::err({ErrorCode::eInvalidArgument, "Shader path must not be empty."});

        auto r = Shader::parse(source);
        if (!r.isOk())
            return Result<void>::err({r.error().code, key + ": " + r.error().message});

        m_Shaders[key] = std::move(r.value());
        return Result<void>::ok();
    }

    bool Workspace::contains(std::string_view path) const { return findShader(path) != nullptr; }

    const Shader* Workspace::findShader(std::string_view path) const
    {
        auto it = m_Shaders.find(normalizePath(path));
        return it == m_Shaders.end() ? nullptr : &it->second;
    }

    std::vector<std::string> Workspace::shaderPaths() const
    {
        std::vector<std::string> out;
        out.reserve(m_Shaders.size());
        for (const auto& [path, _] : m_Shaders)
            out.push_back(path);
        std::sort(out.begin(), out.end());
        return out;
    }

    Result<std::string> Workspace::getShader(std::string_view path) const
    {
        std::vector<std::string> active;
        return evaluateShader(normalizePath(path), active);
    }

    Result<std::string> Workspace::evaluateShader(const std::string& key, std::vector<std::string>& active) const
    {
        auto it = m_Shaders.find(key);
        if (it == m_Shaders.end())
            return Result<std::string>::err({ErrorCode::eNotFound, "Shader not found: " + key});

        if (std::find(active.begin(), active.end(), key) != active.end())
        {
            std::string chain;
            for (const auto& p : active)
                chain += p + " -> ";
            chain += key;
            return Result<std::string>::err({ErrorCode::eIncludeCycle, "Include cycle: " + chain});
        }

        active.push_back(key);
        Resolver resolver(*this, active);
        auto     out = it->second.evaluate(m_Environment, resolver);
        active.pop_back();

        return out;
    }
} // namespace shaderplus

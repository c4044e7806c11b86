#include "shaderplus/environment_file.hpp"
#include "shaderplus/expression_parser.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace shaderplus
{
    static inline void trim_inplace(std::string& s)
    {
        size_t a = 0;
        while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a])))
            ++a;
        size_t b = s.size();
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1])))
            --b;
        s = s.substr(a, b - a);
    }

    static bool is_valid_name(std::string_view name)
    {
        if (name.empty())
            return false;
        if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_'))
            return false;
        for (char c : name)
        {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
                return false;
        }
        return true;
    }

    Result<std::pair<std::string, Literal>> parse_assignment(std::string_view text, const Environment& env)
    {
        using R = Result<std::pair<std::string, Literal>>;

        std::string name(text);
        std::string rhs;

        const auto eq = text.find('=');
        if (eq != std::string_view::npos)
        {
            name = std::string(text.substr(0, eq));
            rhs  = std::string(text.substr(eq + 1));
        }
        trim_inplace(name);
        trim_inplace(rhs);

        if (!is_valid_name(name))
            return R::err({ErrorCode::eParseError, "Invalid name in assignment: '" + name + "'"});

        if (eq == std::string_view::npos)
            return R::ok({std::move(name), Literal::fromBool(true)});

        auto expr = parse_expression(rhs);
        if (!expr.isOk())
            return R::err({expr.error().code, name + ": " + expr.error().message});

        auto value = evaluate(expr.value(), env);
        if (!value.isOk())
            return R::err({value.error().code, name + ": " + value.error().message});

        return R::ok({std::move(name), value.value()});
    }

    Result<void> parse_environment_file(std::string_view text, Environment& env)
    {
        std::istringstream iss((std::string(text)));
        std::string        line;
        size_t             lineNo = 0;

        while (std::getline(iss, line))
        {
            ++lineNo;
            trim_inplace(line);
            if (line.empty() || line[0] == '#')
                continue;

            const auto  sp        = line.find_first_of(" \t");
            std::string directive = line.substr(0, sp);
            std::string rest      = (sp == std::string::npos) ? std::string() : line.substr(sp + 1);
            trim_inplace(rest);

            if (directive != "set" && directive != "override")
            {
                return Result<void>::err(
                    {ErrorCode::eParseError,
                     "spenv line " + std::to_string(lineNo) + ": unknown directive: " + directive});
            }

            if (rest.find('=') == std::string::npos)
                return Result<void>::err(
                    {ErrorCode::eParseError,
                     "spenv line " + std::to_string(lineNo) + ": " + directive + " requires NAME=EXPR"});

            auto a = parse_assignment(rest, env);
            if (!a.isOk())
                return Result<void>::err(
                    {a.error().code, "spenv line " + std::to_string(lineNo) + ": " + a.error().message});

            auto& [name, value] = a.value();
            if (directive == "set")
                env.setGlobal(name, value);
            else
                env.setOverride(name, value);
        }

        return Result<void>::ok();
    }

    Result<void> load_environment_file(const std::string& filePath, Environment& env)
    {
        std::error_code ec;
        if (std::filesystem::is_directory(filePath, ec))
            return Result<void>::err({ErrorCode::eIO, "spenv path is a directory: " + filePath});

        std::ifstream f(filePath, std::ios::binary);
        if (!f)
            return Result<void>::err({ErrorCode::eIO, "Failed to open spenv file: " + filePath});

        f.seekg(0, std::ios::end);
        const std::streamoff size = f.tellg();
        if (size < 0)
            return Result<void>::err({ErrorCode::eIO, "Failed to read spenv file: " + filePath});
        f.seekg(0, std::ios::beg);

        std::string text;
        text.resize(static_cast<size_t>(size));
        f.read(text.data(), size);
        if (!f)
            return Result<void>::err({ErrorCode::eIO, "Failed to read spenv file: " + filePath});

        return parse_environment_file(text, env);
    }
} // namespace shaderplus

#include <shaderplus/environment.hpp>
#include <shaderplus/environment_file.hpp>
#include <shaderplus/expression.hpp>
#include <shaderplus/expression_parser.hpp>
#include <shaderplus/literal.hpp>
#include <shaderplus/result.hpp>
#include <shaderplus/variant_key.hpp>
#include <shaderplus/workspace.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace shaderplus;

// ============================================================
// Logging
// ============================================================

static bool g_verbose = false;

static void log_info(const std::string& s) { std::cout << "[shaderplusc] " << s << std::endl; }

static void log_verbose(const std::string& s)
{
    if (g_verbose)
        std::cout << "[shaderplusc][verbose] " << s << std::endl;
}

static void log_error(const std::string& s) { std::cerr << "[shaderplusc][error] " << s << std::endl; }

// ============================================================
// Usage
// ============================================================

static void print_usage()
{
    std::cout <<
        R"(shaderplusc - shader source preprocessor

Usage:
  shaderplusc resolve -r <root> -s <shader> [options]
  shaderplusc check -r <root> [options]
  shaderplusc eval [options] <expression>

Options (resolve):
  -r <dir>               Workspace root
  -s <path>              Shader to resolve, relative to the root
  -o <file>              Write the resolved text to a file (default: stdout)
  -D <NAME[=EXPR]>       Set a global value (repeatable; NAME alone means true)
  -O <NAME=EXPR>         Set a local override (repeatable)
  --env-file <spenv>     Load values from an environment file before -D/-O
  --ext <.ext>           Shader file extension to load (repeatable, default: .wgsl)
  --no-cache             Disable cache
  --cache <dir>          Cache directory (default: .shaderplus_cache)
  --verbose              Verbose logging

Options (check):
  -r <dir>               Workspace root
  --ext <.ext>           Shader file extension to load (repeatable, default: .wgsl)
  --verbose              List every shader checked

Options (eval):
  -D <NAME[=EXPR]>       Set a global value (repeatable)
  -O <NAME=EXPR>         Set a local override (repeatable)
  --env-file <spenv>     Load values from an environment file

Examples:
  shaderplusc resolve -r shaders -s my-shader.wgsl -D USE_TANGENTS -o out/my-shader.wgsl
  shaderplusc check -r shaders --ext .wgsl --ext .wgsli
  shaderplusc eval -D LIGHTS=4 "LIGHTS * 2 > 6"
)";
}

// ============================================================
// Utility
// ============================================================

static bool read_text_file(const std::string& path, std::string& out)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        return false;

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

static bool write_text_file(const std::string& path, const std::string& text)
{
    const std::filesystem::path parentPath = std::filesystem::path(path).parent_path();
    if (!parentPath.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parentPath, ec);
        if (ec)
            return false;
    }

    std::ofstream f(path, std::ios::binary);
    if (!f)
        return false;
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

static inline std::string cache_path(const std::string& cacheDir, uint64_t key, const std::string& ext)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(key));
    return (std::filesystem::path(cacheDir) / (std::string(buf) + ext)).string();
}

struct Assignment
{
    bool        isOverride = false;
    std::string text;
};

// Applies --env-file first, then -D/-O in command-line order so later values
// can reference earlier ones.
static bool build_environment(const std::string&             envFile,
                              const std::vector<Assignment>& assignments,
                              Environment&                   env,
                              const char*                    cmd)
{
    if (!envFile.empty())
    {
        auto r = load_environment_file(envFile, env);
        if (!r.isOk())
        {
            log_error(std::string(cmd) + ": failed to load environment file: " + r.error().message);
            return false;
        }
        log_verbose(std::string(cmd) + ": loaded " + envFile);
    }

    for (const auto& a : assignments)
    {
        if (a.isOverride && a.text.find('=') == std::string::npos)
        {
            log_error(std::string(cmd) + ": -O requires NAME=EXPR: " + a.text);
            return false;
        }

        auto r = parse_assignment(a.text, env);
        if (!r.isOk())
        {
            log_error(std::string(cmd) + ": invalid " + (a.isOverride ? "-O" : "-D") + " value: " +
                      r.error().message);
            return false;
        }

        const auto& [name, value] = r.value();
        if (a.isOverride)
            env.setOverride(name, value);
        else
            env.setGlobal(name, value);

        log_verbose(std::string(cmd) + ": " + (a.isOverride ? "override " : "set ") + name + " = " +
                    literal_to_string(value));
    }

    return true;
}

// ============================================================
// Command: resolve
// ============================================================

static int cmd_resolve(int argc, char** argv)
{
    // shaderplusc resolve -r <root> -s <shader> [-o out] [-D ...] [-O ...] [--env-file f] [--ext e] [--cache d]
    std::string              rootDir;
    std::string              shaderPath;
    std::string              outPath;
    std::string              envFile;
    std::vector<Assignment>  assignments;
    std::vector<std::string> extensions;
    bool                     enableCache = true;
    std::string              cacheDir    = ".shaderplus_cache";
    bool                     verbose     = false;

    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage();
            return 0;
        }
        else if (a == "-r" && i + 1 < argc)
        {
            rootDir = argv[++i];
        }
        else if (a == "-s" && i + 1 < argc)
        {
            shaderPath = argv[++i];
        }
        else if (a == "-o" && i + 1 < argc)
        {
            outPath = argv[++i];
        }
        else if (a == "-D" && i + 1 < argc)
        {
            assignments.push_back({false, argv[++i]});
        }
        else if (a == "-O" && i + 1 < argc)
        {
            assignments.push_back({true, argv[++i]});
        }
        else if (a == "--env-file" && i + 1 < argc)
        {
            envFile = argv[++i];
        }
        else if (a == "--ext" && i + 1 < argc)
        {
            extensions.push_back(argv[++i]);
        }
        else if (a == "--no-cache")
        {
            enableCache = false;
        }
        else if (a == "--cache" && i + 1 < argc)
        {
            cacheDir = argv[++i];
        }
        else if (a == "--verbose")
        {
            verbose = true;
        }
        else
        {
            log_error("Unknown resolve argument: " + a);
            print_usage();
            return 2;
        }
    }

    g_verbose = verbose;

    if (rootDir.empty() || shaderPath.empty())
    {
        log_error("resolve: workspace root and shader must be specified (-r/-s)");
        return 3;
    }

    if (extensions.empty())
        extensions.push_back(".wgsl");

    auto ws = Workspace::scan(rootDir, extensions);
    if (!ws.isOk())
    {
        log_error("resolve: failed to load workspace: " + ws.error().message);
        return 4;
    }

    Workspace& workspace = ws.value();
    log_verbose("resolve: loaded " + std::to_string(workspace.shaderPaths().size()) + " shader(s) from " +
                workspace.root().string());

    if (!build_environment(envFile, assignments, workspace.environment(), "resolve"))
        return 5;

    const std::string key = Workspace::normalizePath(shaderPath);
    if (!workspace.contains(key))
    {
        log_error("resolve: shader not found in workspace: " + key);
        return 6;
    }

    std::string cached;
    std::string cacheFile;
    bool        fromCache = false;
    if (enableCache)
    {
        VariantKey vk;
        vk.setShaderPath(key);
        vk.setEnvironment(workspace.environment());
        for (const auto& p : workspace.shaderPaths())
            vk.addSourceHash(workspace.findShader(p)->sourceHash());

        const std::string ext = std::filesystem::path(key).extension().string();
        cacheFile             = cache_path(cacheDir, vk.build(), ext.empty() ? ".txt" : ext);
        fromCache             = read_text_file(cacheFile, cached);
        log_verbose("resolve: cache " + std::string(fromCache ? "hit: " : "miss: ") + cacheFile);
    }

    std::string text;
    if (fromCache)
    {
        text = std::move(cached);
    }
    else
    {
        auto start = std::chrono::steady_clock::now();
        auto r     = workspace.getShader(key);
        auto end   = std::chrono::steady_clock::now();

        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        log_verbose("resolve: getShader took " + std::to_string(ms) + " ms");

        if (!r.isOk())
        {
            log_error("resolve: " + std::string(error_code_name(r.error().code)) + ": " + r.error().message);
            return 7;
        }
        text = std::move(r.value());

        if (enableCache && !write_text_file(cacheFile, text))
            log_verbose("resolve: failed to write cache file: " + cacheFile);
    }

    if (outPath.empty())
    {
        std::cout << text;
        std::cout.flush();
        return 0;
    }

    if (!write_text_file(outPath, text))
    {
        log_error("resolve: failed to write output: " + outPath);
        return 8;
    }

    log_info("resolve: OK wrote " + outPath + (fromCache ? " (cache)" : ""));
    return 0;
}

// ============================================================
// Command: check
// ============================================================

static int cmd_check(int argc, char** argv)
{
    // shaderplusc check -r <root> [--ext e]... [--verbose]
    std::string              rootDir;
    std::vector<std::string> extensions;
    bool                     verbose = false;

    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage();
            return 0;
        }
        else if (a == "-r" && i + 1 < argc)
        {
            rootDir = argv[++i];
        }
        else if (a == "--ext" && i + 1 < argc)
        {
            extensions.push_back(argv[++i]);
        }
        else if (a == "--verbose")
        {
            verbose = true;
        }
        else
        {
            log_error("Unknown check argument: " + a);
            print_usage();
            return 2;
        }
    }

    g_verbose = verbose;

    if (rootDir.empty())
    {
        log_error("check: workspace root must be specified (-r)");
        return 3;
    }

    if (extensions.empty())
        extensions.push_back(".wgsl");

    std::error_code ec;
    if (!std::filesystem::is_directory(rootDir, ec))
    {
        log_error("check: not a directory: " + rootDir);
        return 4;
    }

    // Parse each file on its own so every failure is reported, not just the first.
    size_t checked = 0;
    size_t failed  = 0;

    std::filesystem::recursive_directory_iterator it(rootDir, ec);
    for (std::filesystem::recursive_directory_iterator end; !ec && it != end; it.increment(ec))
    {
        if (!it->is_regular_file(ec))
            continue;

        const std::string ext   = it->path().extension().string();
        bool              match = false;
        for (const auto& e : extensions)
            match = match || e == ext;
        if (!match)
            continue;

        const std::string rel = it->path().lexically_relative(rootDir).generic_string();
        ++checked;

        std::string src;
        if (!read_text_file(it->path().string(), src))
        {
            log_error("check: " + rel + ": failed to read");
            ++failed;
            continue;
        }

        auto r = Shader::parse(src);
        if (!r.isOk())
        {
            log_error("check: " + rel + ": " + error_code_name(r.error().code) + ": " + r.error().message);
            ++failed;
            continue;
        }

        log_verbose("check: " + rel + " OK (depth " + std::to_string(r.value().root().depth()) + ")");
    }

    if (ec)
    {
        log_error("check: failed to scan " + rootDir + ": " + ec.message());
        return 5;
    }

    log_info("check: " + std::to_string(checked) + " shader(s), " + std::to_string(failed) + " failed");
    return failed == 0 ? 0 : 6;
}

// ============================================================
// Command: eval
// ============================================================

static int cmd_eval(int argc, char** argv)
{
    // shaderplusc eval [--env-file f] [-D ...] [-O ...] <expression>
    std::string             envFile;
    std::vector<Assignment> assignments;
    std::string             exprText;
    bool                    haveExpr = false;

    for (int i = 2; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage();
            return 0;
        }
        else if (a == "-D" && i + 1 < argc)
        {
            assignments.push_back({false, argv[++i]});
        }
        else if (a == "-O" && i + 1 < argc)
        {
            assignments.push_back({true, argv[++i]});
        }
        else if (a == "--env-file" && i + 1 < argc)
        {
            envFile = argv[++i];
        }
        else if (a == "--verbose")
        {
            g_verbose = true;
        }
        else if (!haveExpr)
        {
            exprText = a;
            haveExpr = true;
        }
        else
        {
            log_error("Unknown eval argument: " + a);
            print_usage();
            return 2;
        }
    }

    if (!haveExpr)
    {
        log_error("eval: an expression must be specified");
        return 3;
    }

    Environment env;
    if (!build_environment(envFile, assignments, env, "eval"))
        return 4;

    auto expr = parse_expression(exprText);
    if (!expr.isOk())
    {
        log_error("eval: " + std::string(error_code_name(expr.error().code)) + ": " + expr.error().message);
        return 5;
    }

    log_verbose("eval: parsed " + expression_to_string(expr.value()));

    auto value = evaluate(expr.value(), env);
    if (!value.isOk())
    {
        log_error("eval: " + std::string(error_code_name(value.error().code)) + ": " + value.error().message);
        return 6;
    }

    std::cout << literal_to_string(value.value()) << " (" << literal_kind_name(value.value().kind) << ")"
              << std::endl;
    return 0;
}

int main(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage();
        return 1;
    }

    const std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help")
    {
        print_usage();
        return 0;
    }

    if (cmd == "resolve")
        return cmd_resolve(argc, argv);

    if (cmd == "check")
        return cmd_check(argc, argv);

    if (cmd == "eval")
        return cmd_eval(argc, argv);

    log_error("Unknown command: " + cmd);
    print_usage();
    return 1;
}

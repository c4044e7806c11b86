#include <gtest/gtest.h>

#include "shaderplus/shader.hpp"

#include <string>

using namespace shaderplus;

namespace
{
    class NoIncludes final : public IncludeResolver
    {
    public:
        Result<std::string> resolve(std::string_view path) const override
        {
            return Result<std::string>::err({ErrorCode::eNotFound, "Shader not found: " + std::string(path)});
        }
    };

    Result<std::string> resolve(const std::string& source, const Environment& env)
    {
        auto shader = Shader::parse(source);
        if (!shader.isOk())
            return Result<std::string>::err(shader.error());
        return shader.value().evaluate(env, NoIncludes());
    }

    std::string resolve_ok(const std::string& source, const Environment& env = Environment())
    {
        auto r = resolve(source, env);
        EXPECT_TRUE(r.isOk()) << r.error().message;
        return r.value();
    }
} // namespace

TEST(shader, conditional_scenario)
{
    const std::string source = "//:if USE_TANGENTS\nA\n//:else\nB\n//:end\n";

    Environment env;
    env.setGlobalBool("USE_TANGENTS", false);
    EXPECT_EQ("B\n", resolve_ok(source, env));

    env.setGlobalBool("USE_TANGENTS", true);
    EXPECT_EQ("A\n", resolve_ok(source, env));
}

TEST(shader, constant_scenario)
{
    Environment env;
    env.setGlobalInteger("FOO", 7);
    EXPECT_EQ("const FOO = 7;\n", resolve_ok("//:const FOO\n", env));
}

TEST(shader, undefined_constant)
{
    auto r = resolve("//:const FOO\n", Environment());
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(ErrorCode::eUndefinedVariable, r.error().code);
}

TEST(shader, undefined_condition_reference)
{
    auto r = resolve("//:if FOO\nx\n//:end\n", Environment());
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(ErrorCode::eUndefinedVariable, r.error().code);
}

TEST(shader, plain_text_round_trip)
{
    const std::string source = "struct A {\nx: f32,\n}\nfn main() {\nreturn;\n}\n";
    EXPECT_EQ(source, resolve_ok(source));
}

TEST(shader, lines_are_trimmed_and_blank_lines_dropped)
{
    EXPECT_EQ("fn f() {\nreturn;\n}\n", resolve_ok("fn f() {\r\n\n    return;\r\n}"));
}

TEST(shader, empty_source)
{
    EXPECT_EQ("", resolve_ok(""));
    EXPECT_EQ("", resolve_ok("\n  \n"));
}

TEST(shader, override_shadows_global)
{
    Environment env;
    env.setGlobalInteger("N", 1);
    env.setOverride("N", Literal::fromFloat(0.5));
    EXPECT_EQ("const N = 0.5;\n", resolve_ok("//:const N", env));
}

TEST(shader, bit_mask_condition)
{
    Environment env;
    env.setGlobalInteger("FLAGS", 0b101);
    const std::string source = "//:if FLAGS & BIT_1\none\n//:end\n//:if FLAGS & BIT_2\ntwo\n//:end\n";
    EXPECT_EQ("two\n", resolve_ok(source, env));
}

TEST(shader, stray_end_is_leftover)
{
    auto r = Shader::parse("a\n//:end\nb\n");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(ErrorCode::eLeftoverLines, r.error().code);
    EXPECT_NE(std::string::npos, r.error().message.find("\nb"));
}

TEST(shader, stray_else_is_leftover)
{
    auto r = Shader::parse("//:else\n");
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(ErrorCode::eLeftoverLines, r.error().code);
}

TEST(shader, include_without_resolver_entry)
{
    auto r = resolve("//:include missing.wgsl\n", Environment());
    ASSERT_FALSE(r.isOk());
    EXPECT_EQ(ErrorCode::eNotFound, r.error().code);
}

TEST(shader, capacity_and_source_hash)
{
    const std::string source = "a\nb\n";
    auto              a      = Shader::parse(source);
    auto              b      = Shader::parse("a\nc\n");
    ASSERT_TRUE(a.isOk());
    ASSERT_TRUE(b.isOk());

    EXPECT_EQ(source.size(), a.value().capacityHint());
    EXPECT_NE(a.value().sourceHash(), b.value().sourceHash());
}

#include <gtest/gtest.h>

#include "shaderplus/variant_key.hpp"

using namespace shaderplus;

namespace
{
    uint64_t key_of(const char* path, const Environment& env)
    {
        VariantKey vk;
        vk.setShaderPath(path);
        vk.setEnvironment(env);
        return vk.build();
    }
} // namespace

TEST(variant_key, deterministic)
{
    Environment a;
    a.setGlobalInteger("X", 1);
    a.setGlobalBool("Y", true);

    Environment b;
    b.setGlobalBool("Y", true);
    b.setGlobalInteger("X", 1);

    EXPECT_EQ(key_of("s.wgsl", a), key_of("s.wgsl", b));
}

TEST(variant_key, depends_on_path)
{
    Environment env;
    EXPECT_NE(key_of("a.wgsl", env), key_of("b.wgsl", env));
}

TEST(variant_key, depends_on_value_and_kind)
{
    Environment a;
    a.setGlobalInteger("X", 1);

    Environment b;
    b.setGlobalInteger("X", 2);

    Environment c;
    c.setGlobalBool("X", true);

    EXPECT_NE(key_of("s.wgsl", a), key_of("s.wgsl", b));
    EXPECT_NE(key_of("s.wgsl", a), key_of("s.wgsl", c));
}

TEST(variant_key, uses_effective_values)
{
    Environment a;
    a.setGlobalInteger("X", 1);
    a.setOverride("X", Literal::fromInteger(5));

    Environment b;
    b.setGlobalInteger("X", 5);

    EXPECT_EQ(key_of("s.wgsl", a), key_of("s.wgsl", b));
}

TEST(variant_key, source_hashes_order_independent)
{
    VariantKey a;
    a.setShaderPath("s.wgsl");
    a.addSourceHash(1);
    a.addSourceHash(2);

    VariantKey b;
    b.setShaderPath("s.wgsl");
    b.addSourceHash(2);
    b.addSourceHash(1);

    VariantKey c;
    c.setShaderPath("s.wgsl");
    c.addSourceHash(3);

    EXPECT_EQ(a.build(), b.build());
    EXPECT_NE(a.build(), c.build());

    a.clear();
    VariantKey empty;
    empty.setShaderPath("s.wgsl");
    EXPECT_EQ(empty.build(), a.build());
}

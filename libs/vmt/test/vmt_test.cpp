#include "srctools/vmt.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace srctools::vmt;

TEST(VmtTest, ParsesPlainMaterial) {
    auto m = parse_bytes(R"(
"VertexLitGeneric"
{
    "$BaseTexture" "metal/crate"
    "$bumpmap"     "metal/crate_normal"
    "$surfaceprop" "metal"
    "$basetexture" "ignored/duplicate"
    "Proxies" { "Sine" { "resultVar" "$alpha" } }
}
)");
    ASSERT_FALSE(is_patch(m));
    const auto& plain = std::get<PlainMaterial>(m);
    EXPECT_EQ(plain.shader, "VertexLitGeneric");
    ASSERT_EQ(plain.params.size(), 3u);
    EXPECT_EQ(plain.params[0].first, "$basetexture");
    EXPECT_EQ(*find_param(plain.params, "$BASETEXTURE"), "metal/crate");
    EXPECT_EQ(*find_param(plain.params, "$bumpmap"), "metal/crate_normal");
    EXPECT_EQ(find_param(plain.params, "proxies"), nullptr);
}

TEST(VmtTest, ParsesPatchMaterial) {
    auto m = parse_bytes(R"(
patch
{
    include "materials/metal/base.vmt"
    insert  { "$detail" "detail/noise" }
    replace { "$basetexture" "metal/rusty" }
}
)");
    ASSERT_TRUE(is_patch(m));
    const auto& patch = std::get<PatchMaterial>(m);
    EXPECT_EQ(patch.include, "materials/metal/base.vmt");
    ASSERT_EQ(patch.insert.size(), 1u);
    EXPECT_EQ(patch.insert[0].second, "detail/noise");
    ASSERT_EQ(patch.replace.size(), 1u);
    EXPECT_EQ(patch.replace[0].first, "$basetexture");
}

TEST(VmtTest, PatchOverridesWin) {
    Parameters base = {{"$basetexture", "metal/base"}, {"$bumpmap", "metal/base_n"}};
    PatchMaterial patch;
    patch.include = "materials/metal/base.vmt";
    patch.insert = {{"$detail", "detail/noise"}};
    patch.replace = {{"$basetexture", "metal/rusty"}};

    auto eff = apply_patch(base, patch);
    ASSERT_EQ(eff.size(), 3u);
    EXPECT_EQ(*find_param(eff, "$basetexture"), "metal/rusty");
    EXPECT_EQ(*find_param(eff, "$bumpmap"), "metal/base_n");
    EXPECT_EQ(*find_param(eff, "$detail"), "detail/noise");
}

TEST(VmtTest, SkipsConsoleOnlyParameters) {
    auto m = parse_bytes(R"("LightmappedGeneric" { "$envmap" "env_cubemap" [$X360] "$basetexture" "a/b" })");
    const auto& plain = std::get<PlainMaterial>(m);
    EXPECT_EQ(find_param(plain.params, "$envmap"), nullptr);
    EXPECT_NE(find_param(plain.params, "$basetexture"), nullptr);
}

TEST(VmtTest, TextureParameterSet) {
    EXPECT_EQ(texture_parameters().size(), 20u);
    EXPECT_TRUE(is_texture_parameter("$BaseTexture"));
    EXPECT_TRUE(is_texture_parameter("$envmapmask"));
    EXPECT_FALSE(is_texture_parameter("$surfaceprop"));
    EXPECT_FALSE(is_texture_parameter("$bottommaterial"));
}

TEST(VmtTest, RejectsDocumentsWithoutShader) {
    EXPECT_THROW(parse_bytes(R"("$basetexture" "a")"), std::runtime_error);
    EXPECT_THROW(parse_bytes(R"(patch { insert { "$a" "b" } })"), std::runtime_error);
}

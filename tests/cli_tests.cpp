#include <gtest/gtest.h>

#include "support/fixture_tree.h"
#include "support/mdl_builder.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using srctools::testing::FixtureTree;

namespace {

std::string shell_quote(const fs::path& p) {
    std::string s = p.string();
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

int run_command(const std::string& cmd) {
    return std::system(cmd.c_str());
}

fs::path tool_path(const std::string& name) {
#ifdef _WIN32
    return fs::path(SRCTOOLS_BINARY_DIR) / "tools" / name / (name + ".exe");
#else
    return fs::path(SRCTOOLS_BINARY_DIR) / "tools" / name / name;
#endif
}

json read_json(const fs::path& p) {
    std::ifstream f(p);
    EXPECT_TRUE(f.is_open()) << p;
    json j;
    f >> j;
    return j;
}

void write_crate(const FixtureTree& tree) {
    srctools::testing::MdlContents c;
    c.textures = {"crate"};
    c.cdmaterials = {"metal/"};
    tree.write("src/models/props/crate.mdl", srctools::testing::build_mdl(c));
    tree.write("src/models/props/crate.dx90.vtx", "vtx");
    tree.write("src/models/props/crate.vvd", "vvd");
    tree.write("src/materials/metal/crate.vmt", R"("VertexLitGeneric" { "$basetexture" "metal/crate" })");
    tree.write("src/materials/metal/crate.vtf", "vtf");
}

} // namespace

TEST(collect_content_cli, collects_model_given_by_path) {
    FixtureTree tree("cli_model");
    write_crate(tree);
    const auto out = tree.path("out");
    const auto report = tree.path("report.json");

    const auto cmd = shell_quote(tool_path("collect_content")) + " --no-game --json -o " + shell_quote(out) +
                     " " + shell_quote(tree.path("src/models/props/crate.mdl")) + " > " + shell_quote(report);
    EXPECT_EQ(run_command(cmd), 0);

    EXPECT_TRUE(fs::is_regular_file(out / "models/props/crate.mdl"));
    EXPECT_TRUE(fs::is_regular_file(out / "models/props/crate.vvd"));
    EXPECT_TRUE(fs::is_regular_file(out / "materials/metal/crate.vtf"));
    EXPECT_FALSE(fs::exists(out / "models/props/crate.phy"));

    const auto doc = read_json(report);
    EXPECT_EQ(doc["filesCopied"], 5);
    ASSERT_EQ(doc["entries"].size(), 3u);
    EXPECT_EQ(doc["entries"][0]["kind"], "model");
    EXPECT_EQ(doc["entries"][0]["status"], "found");
    ASSERT_EQ(doc["diagnostics"].size(), 1u);
    EXPECT_EQ(doc["diagnostics"][0]["kind"], "missing_optional_file");
}

TEST(collect_content_cli, collects_map_from_source_roots) {
    FixtureTree tree("cli_map");
    write_crate(tree);
    tree.write("maps/test.vmf", R"(
world
{
    "id" "1"
    "classname" "worldspawn"
    solid { "id" "2" side { "id" "1" "material" "METAL/CRATE" } side { "id" "2" "material" "dev/missing" } }
}
entity { "id" "3" "classname" "prop_static" "model" "models/props/crate.mdl" }
)");
    const auto out = tree.path("out");

    const auto cmd = shell_quote(tool_path("collect_content")) + " --no-game -s " + shell_quote(tree.path("src")) +
                     " -o " + shell_quote(out) + " " + shell_quote(tree.path("maps/test.vmf"));
    EXPECT_EQ(run_command(cmd), 0);
    EXPECT_TRUE(fs::is_regular_file(out / "materials/metal/crate.vmt"));
    EXPECT_TRUE(fs::is_regular_file(out / "models/props/crate.dx90.vtx"));
}

TEST(collect_content_cli, source_roots_outrank_model_folder) {
    FixtureTree tree("cli_priority");
    write_crate(tree);
    const auto override_vmt = std::string(R"("VertexLitGeneric" { "$basetexture" "metal/crate_new" })");
    tree.write("override/materials/metal/crate.vmt", override_vmt);
    tree.write("override/materials/metal/crate_new.vtf", "vtf2");
    const auto out = tree.path("out");

    const auto cmd = shell_quote(tool_path("collect_content")) + " --no-game -s " +
                     shell_quote(tree.path("override")) + " -s " + shell_quote(tree.path("src")) + " -o " +
                     shell_quote(out) + " " + shell_quote(tree.path("src/models/props/crate.mdl"));
    EXPECT_EQ(run_command(cmd), 0);

    EXPECT_EQ(FixtureTree::read(out / "materials/metal/crate.vmt"), override_vmt);
    EXPECT_TRUE(fs::is_regular_file(out / "materials/metal/crate_new.vtf"));
    EXPECT_FALSE(fs::exists(out / "materials/metal/crate.vtf"));
    EXPECT_TRUE(fs::is_regular_file(out / "models/props/crate.mdl"));
}

TEST(collect_content_cli, relative_source_matching_model_folder_is_listed_once) {
    FixtureTree tree("cli_relative_root");
    write_crate(tree);
    const auto report = tree.path("report.json");

    const auto cmd = "cd " + shell_quote(tree.root()) + " && " + shell_quote(tool_path("collect_content")) +
                     " --no-game --json -s src -o out src/models/props/crate.mdl > " + shell_quote(report);
    EXPECT_EQ(run_command(cmd), 0);

    const auto doc = read_json(report);
    ASSERT_EQ(doc["roots"].size(), 1u);
    EXPECT_EQ(doc["roots"][0], "src");
    EXPECT_EQ(doc["filesCopied"], 5);
}

TEST(collect_content_cli, usage_and_fatal_errors_exit_nonzero) {
    FixtureTree tree("cli_errors");
    write_crate(tree);
    const auto tool = shell_quote(tool_path("collect_content"));

    // no output directory
    EXPECT_NE(run_command(tool + " --no-game " + shell_quote(tree.path("src/models/props/crate.mdl"))), 0);
    // unreadable source root; the output directory is never created
    EXPECT_NE(run_command(tool + " --no-game -s " + shell_quote(tree.path("absent")) + " -o " +
                          shell_quote(tree.path("out")) + " " + shell_quote(tree.path("src/models/props/crate.mdl"))),
              0);
    EXPECT_FALSE(fs::exists(tree.path("out")));
    // unsupported root asset
    EXPECT_NE(run_command(tool + " --no-game -o " + shell_quote(tree.path("out")) + " " +
                          shell_quote(tree.path("src/materials/metal/crate.vmt"))),
              0);
}

TEST(vmf_info_cli, prints_json_stats) {
    FixtureTree tree("cli_vmf_info");
    tree.write("test.vmf", R"(
versioninfo { "mapversion" "7" }
world { "id" "1" "classname" "worldspawn" solid { "id" "2" side { "id" "1" "material" "a" } } }
entity { "id" "3" "classname" "light" }
entity { "id" "4" "classname" "light" }
)");
    const auto report = tree.path("stats.json");

    const auto cmd = shell_quote(tool_path("vmf_info")) + " --json " + shell_quote(tree.path("test.vmf")) + " > " +
                     shell_quote(report);
    EXPECT_EQ(run_command(cmd), 0);

    const auto doc = read_json(report);
    EXPECT_EQ(doc["version"]["mapVersion"], 7);
    EXPECT_EQ(doc["worldSolids"], 1);
    EXPECT_EQ(doc["entities"], 2);
    EXPECT_EQ(doc["classes"]["light"], 2);
}

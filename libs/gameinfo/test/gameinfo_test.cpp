#include "srctools/gameinfo.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace srctools::gameinfo;
namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream(p, std::ios::binary) << content;
}

constexpr const char* kGameInfo = R"(
"GameInfo"
{
    game    "Garry's Mod"
    title   ""
    FileSystem
    {
        SteamAppId  4000
        SearchPaths
        {
            mod+mod_write+default_write_path    |gameinfo_path|.
            game+mod                garrysmod/addons/*
            game+mod                garrysmod/garrysmod.vpk
            game+mod                |gameinfo_path|download
            game+game_write         |gameinfo_path|.
            gamebin                 |gameinfo_path|bin
            platform                |all_source_engine_paths|platform/platform_misc.vpk
            game                    |all_source_engine_paths|sourceengine/hl2_textures.vpk
            game                    |gameinfo_path|console [$X360]
        }
    }
}
)";

} // namespace

TEST(GameInfoTest, ExpandsGameSearchPaths) {
    auto install = fs::temp_directory_path() / "srctools_gameinfo_test" / "GarrysMod";
    fs::remove_all(install.parent_path());
    auto game_dir = install / "garrysmod";
    write_file(game_dir / "gameinfo.txt", kGameInfo);
    fs::create_directories(game_dir / "addons" / "zeta");
    fs::create_directories(game_dir / "addons" / "alpha");
    write_file(game_dir / "addons" / "legacy.gma", "x");

    auto info = read(game_dir / "gameinfo.txt");
    EXPECT_EQ(info.game, "Garry's Mod");
    EXPECT_EQ(info.app_id, 4000);

    ASSERT_EQ(info.search_paths.size(), 6u);
    EXPECT_EQ(info.search_paths[0].path, game_dir / "addons" / "alpha");
    EXPECT_EQ(info.search_paths[1].path, game_dir / "addons" / "zeta");
    EXPECT_FALSE(info.search_paths[1].vpk);

    EXPECT_EQ(info.search_paths[2].path, game_dir / "garrysmod.vpk");
    EXPECT_TRUE(info.search_paths[2].vpk);
    EXPECT_EQ(info.search_paths[3].path, game_dir / "download");
    EXPECT_EQ(info.search_paths[4].path, game_dir);
    EXPECT_EQ(info.search_paths[4].keys, "game+game_write");
    EXPECT_EQ(info.search_paths[5].path, install / "sourceengine" / "hl2_textures.vpk");

    fs::remove_all(install.parent_path());
}

TEST(GameInfoTest, RejectsMissingBlocks) {
    auto doc = srctools::keyvalues::parse_bytes(R"("GameInfo" { game "x" })");
    EXPECT_THROW(parse(doc, "/tmp/x"), std::runtime_error);
    EXPECT_THROW(read(fs::temp_directory_path() / "srctools_no_such_dir" / "gameinfo.txt"), std::runtime_error);
}

TEST(GameInfoTest, FindsAppThroughLibraryFolders) {
    auto root = fs::temp_directory_path() / "srctools_steam_test";
    fs::remove_all(root);
    auto steam = root / "Steam";
    auto library = root / "Library2";

    write_file(steam / "steamapps" / "libraryfolders.vdf", R"(
"libraryfolders"
{
    "0"
    {
        "path"  ")" + steam.generic_string() + R"("
        "apps" { "220" "1234" }
    }
    "1"
    {
        "path"  ")" + library.generic_string() + R"("
        "apps" { "4000" "5678" }
    }
}
)");
    write_file(library / "steamapps" / "appmanifest_4000.acf", R"(
"AppState"
{
    "appid"      "4000"
    "name"       "Garry's Mod"
    "installdir" "GarrysMod"
}
)");
    fs::create_directories(library / "steamapps" / "common" / "GarrysMod");

    auto libs = library_folders(steam);
    ASSERT_EQ(libs.size(), 2u);
    EXPECT_EQ(libs[0], steam);
    EXPECT_EQ(libs[1], library);

    auto install = find_app_install(steam, 4000);
    ASSERT_TRUE(install.has_value());
    EXPECT_EQ(*install, library / "steamapps" / "common" / "GarrysMod");

    EXPECT_FALSE(find_app_install(steam, 220).has_value());

    fs::remove_all(root);
}

TEST(GameInfoTest, LibraryFoldersWithoutManifest) {
    auto steam = fs::temp_directory_path() / "srctools_steam_empty";
    fs::remove_all(steam);
    fs::create_directories(steam);
    auto libs = library_folders(steam);
    ASSERT_EQ(libs.size(), 1u);
    EXPECT_EQ(libs[0], steam);
    fs::remove_all(steam);
}

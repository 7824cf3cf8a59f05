#pragma once

#include "srctools/keyvalues.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace srctools::gameinfo {

// SearchPath is one content location from gameinfo.txt FileSystem/SearchPaths,
// with path variables substituted and wildcards expanded.
struct SearchPath {
    std::string keys;           // e.g. "game+mod"
    std::filesystem::path path; // loose directory or .vpk package as written
    bool vpk = false;
};

struct GameInfo {
    std::string game;                // "game" value, e.g. "Garry's Mod"
    int app_id = 0;                  // FileSystem/SteamAppId
    std::filesystem::path game_dir;  // directory holding gameinfo.txt
    std::vector<SearchPath> search_paths; // entries with a "game" key only, in file order
};

// read parses <game_dir>/gameinfo.txt. Throws std::runtime_error when the file
// is absent or malformed.
GameInfo read(const std::filesystem::path& gameinfo_txt);

// parse extracts game info from a parsed document. game_dir is the directory
// the file was read from; |gameinfo_path| expands to it and
// |all_source_engine_paths| (and relative paths) to its parent.
GameInfo parse(const keyvalues::Document& doc, const std::filesystem::path& game_dir);

// default_steam_dirs lists the usual Steam install locations for the current
// user, most likely first. Entries are not checked for existence.
std::vector<std::filesystem::path> default_steam_dirs();

// library_folders returns steam_dir followed by the extra library folders
// listed in steamapps/libraryfolders.vdf. A missing file yields steam_dir only.
std::vector<std::filesystem::path> library_folders(const std::filesystem::path& steam_dir);

// find_app_install locates steamapps/common/<installdir> for app_id through the
// appmanifest_<app_id>.acf files of every library folder.
std::optional<std::filesystem::path> find_app_install(const std::filesystem::path& steam_dir, int app_id);

} // namespace srctools::gameinfo

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace srctools::settings {

// Settings holds defaults for the command-line tools. Flags given on the
// command line always win.
struct Settings {
    std::string steam_dir;
    std::string game_dir;
    std::string game = "garrysmod";
    int app_id = 4000;
    std::vector<std::string> source_paths; // appended after -s roots
    int tool_verbosity_level = 0;
};

// Returns config.json beside the executable if present, otherwise
// ~/.config/srctools/config.json.
std::filesystem::path settings_path();

// load_settings reads path. A missing file yields defaults; a malformed one
// yields defaults and sets error.
Settings load_settings(const std::filesystem::path& path, std::string& error);

} // namespace srctools::settings

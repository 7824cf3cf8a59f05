#include "settings.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace srctools::settings {

namespace fs = std::filesystem;
using json = nlohmann::json;

static fs::path exe_dir() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.parent_path();
    return fs::current_path(ec);
}

fs::path settings_path() {
    auto beside = exe_dir() / "config.json";
    std::error_code ec;
    if (fs::exists(beside, ec)) return beside;

    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home) / ".config" / "srctools" / "config.json";
    return beside;
}

Settings load_settings(const fs::path& path, std::string& error) {
    Settings s;
    std::ifstream f(path);
    if (!f.is_open()) return s;

    try {
        json j = json::parse(f);
        Settings loaded;
        if (j.contains("steam_dir")) j.at("steam_dir").get_to(loaded.steam_dir);
        if (j.contains("game_dir")) j.at("game_dir").get_to(loaded.game_dir);
        if (j.contains("game")) j.at("game").get_to(loaded.game);
        if (j.contains("app_id")) j.at("app_id").get_to(loaded.app_id);
        if (j.contains("source_paths")) j.at("source_paths").get_to(loaded.source_paths);
        if (j.contains("tool_verbosity_level"))
            loaded.tool_verbosity_level = std::clamp(j.at("tool_verbosity_level").get<int>(), 0, 2);
        s = std::move(loaded);
    } catch (const json::exception& e) {
        error = "config parse error in " + path.string() + ": " + e.what();
    }
    return s;
}

} // namespace srctools::settings

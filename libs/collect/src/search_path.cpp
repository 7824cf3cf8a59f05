#include "srctools/collect/search_path.h"
#include "srctools/collect/asset.h"
#include "srctools/srcpath.h"

#include <format>
#include <stdexcept>
#include <system_error>

namespace srctools::collect {

namespace fs = std::filesystem;

std::string_view status_name(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::Found: return "found";
        case ResolutionStatus::FoundInGame: return "in_game";
        case ResolutionStatus::Missing: return "missing";
    }
    return "unknown";
}

// --- GameContent ---

void GameContent::add_directory(const fs::path& dir) {
    directories_.push_back(dir);
}

void GameContent::add_archive(const fs::path& dir_vpk) {
    archives_.push_back({dir_vpk, vpk::read(dir_vpk)});
}

GameContent GameContent::from_gameinfo(const gameinfo::GameInfo& info, std::vector<std::string>& warnings) {
    GameContent content;
    for (const auto& sp : info.search_paths) {
        std::error_code ec;
        if (!sp.vpk) {
            if (fs::is_directory(sp.path, ec)) content.add_directory(sp.path);
            continue;
        }

        auto dir_file = vpk::dir_file_path(sp.path);
        if (!fs::is_regular_file(dir_file, ec)) continue;
        try {
            content.add_archive(dir_file);
        } catch (const std::exception& e) {
            warnings.push_back(std::format("skipping game package {}: {}", dir_file.string(), e.what()));
        }
    }
    return content;
}

std::optional<std::string> GameContent::locate(const std::string& rel_path) const {
    for (const auto& dir : directories_) {
        if (auto p = srcpath::find_file_ci(dir, rel_path)) return p->string();
    }
    for (const auto& archive : archives_) {
        if (vpk::find(archive.tree, rel_path))
            return std::format("{}:{}", archive.path.filename().string(), srcpath::to_slash_lower(rel_path));
    }
    return std::nullopt;
}

GameContent discover_game_content(const GameLookup& lookup, std::vector<std::string>& warnings) {
    std::error_code ec;
    std::optional<fs::path> install = lookup.install_dir;

    if (!install) {
        std::vector<fs::path> steam_dirs;
        if (lookup.steam_dir) steam_dirs.push_back(*lookup.steam_dir);
        else steam_dirs = gameinfo::default_steam_dirs();

        for (const auto& steam : steam_dirs) {
            if (!fs::is_directory(steam, ec)) continue;
            try {
                install = gameinfo::find_app_install(steam, lookup.app_id);
            } catch (const std::exception& e) {
                warnings.push_back(std::format("cannot read Steam libraries in {}: {}", steam.string(), e.what()));
            }
            if (install) break;
        }
        if (!install) {
            warnings.push_back(std::format("game with app id {} not found in any Steam library; "
                                           "game content fallback disabled", lookup.app_id));
            return {};
        }
    }

    // --game-dir may name the install or the game folder inside it.
    auto gameinfo_txt = *install / lookup.game / "gameinfo.txt";
    if (!fs::is_regular_file(gameinfo_txt, ec) && fs::is_regular_file(*install / "gameinfo.txt", ec))
        gameinfo_txt = *install / "gameinfo.txt";

    try {
        auto info = gameinfo::read(gameinfo_txt);
        return GameContent::from_gameinfo(info, warnings);
    } catch (const std::exception& e) {
        warnings.push_back(std::format("{}; game content fallback disabled", e.what()));
    }
    return {};
}

// --- SearchPathIndex ---

SearchPathIndex::SearchPathIndex(const std::vector<fs::path>& roots, GameContent game)
    : game_(std::move(game)) {
    for (const auto& dir : roots) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
            throw FatalIOError(std::format("source root {} is not a directory", dir.string()));
        fs::directory_iterator it(dir, ec);
        if (ec)
            throw FatalIOError(std::format("source root {} is not readable: {}", dir.string(), ec.message()));
        roots_.push_back({roots_.size(), dir});
    }
}

const Resolution& SearchPathIndex::resolve(const std::string& relative_path) {
    auto key = srcpath::to_slash_lower(relative_path);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;
    return cache_.emplace(key, lookup(key)).first->second;
}

Resolution SearchPathIndex::lookup(const std::string& key) const {
    Resolution res;
    if (!srcpath::is_safe_relative(key)) return res;

    for (const auto& root : roots_) {
        auto found = srcpath::find_file_ci(root.dir, key);
        if (!found) continue;
        res.status = ResolutionStatus::Found;
        res.root_index = root.index;
        res.absolute_path = *found;
        res.relative_path = found->lexically_relative(root.dir).generic_string();
        return res;
    }

    if (auto where = game_.locate(key)) {
        res.status = ResolutionStatus::FoundInGame;
        res.game_location = std::move(*where);
    }
    return res;
}

} // namespace srctools::collect

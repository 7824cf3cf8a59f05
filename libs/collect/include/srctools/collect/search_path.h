#pragma once

#include "srctools/gameinfo.h"
#include "srctools/vpk.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace srctools::collect {

enum class ResolutionStatus { Found, FoundInGame, Missing };

std::string_view status_name(ResolutionStatus status);

// Resolution is the outcome of looking up one relative path.
// Found: root_index, absolute_path and relative_path (the on-disk spelling
// relative to the root, forward slashes) are set.
// FoundInGame: game_location describes where the game has it.
struct Resolution {
    ResolutionStatus status = ResolutionStatus::Missing;
    size_t root_index = 0;
    std::filesystem::path absolute_path;
    std::string relative_path;
    std::string game_location;

    bool found() const { return status == ResolutionStatus::Found; }
    bool missing() const { return status == ResolutionStatus::Missing; }
};

struct SearchRoot {
    size_t index = 0;
    std::filesystem::path dir;
};

// GameContent answers existence queries against the game's shipped content:
// loose directories first, then VPK directory trees, each in the order added.
// Nothing is ever read from it.
class GameContent {
public:
    void add_directory(const std::filesystem::path& dir);

    // add_archive reads a "_dir.vpk" tree. Throws std::runtime_error.
    void add_archive(const std::filesystem::path& dir_vpk);

    // from_gameinfo loads every existing search path of info. Unreadable
    // packages are skipped with a message appended to warnings.
    static GameContent from_gameinfo(const gameinfo::GameInfo& info, std::vector<std::string>& warnings);

    // locate returns a description of where the game holds rel_path.
    std::optional<std::string> locate(const std::string& rel_path) const;

    bool empty() const { return directories_.empty() && archives_.empty(); }
    size_t directory_count() const { return directories_.size(); }
    size_t archive_count() const { return archives_.size(); }

private:
    struct Archive {
        std::filesystem::path path;
        vpk::Directory tree;
    };

    std::vector<std::filesystem::path> directories_;
    std::vector<Archive> archives_;
};

// GameLookup selects the game install used as the content fallback.
struct GameLookup {
    std::optional<std::filesystem::path> steam_dir;
    std::optional<std::filesystem::path> install_dir; // skips Steam discovery
    std::string game = "garrysmod";
    int app_id = 4000;
};

// discover_game_content finds the game install (explicit directory or Steam
// libraries), reads <install>/<game>/gameinfo.txt and loads its search paths.
// Any failure leaves the result empty and is reported through warnings.
GameContent discover_game_content(const GameLookup& lookup, std::vector<std::string>& warnings);

// SearchPathIndex resolves relative paths against the user source roots in
// priority order (index 0 first), then against the game content.
// Results are memoized for the lifetime of the index.
class SearchPathIndex {
public:
    // Throws FatalIOError when a root is not a readable directory.
    SearchPathIndex(const std::vector<std::filesystem::path>& roots, GameContent game);

    const Resolution& resolve(const std::string& relative_path);

    const std::vector<SearchRoot>& roots() const { return roots_; }
    const GameContent& game() const { return game_; }

private:
    Resolution lookup(const std::string& key) const;

    std::vector<SearchRoot> roots_;
    GameContent game_;
    std::unordered_map<std::string, Resolution> cache_;
};

} // namespace srctools::collect

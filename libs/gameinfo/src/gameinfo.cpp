#include "srctools/gameinfo.h"
#include "srctools/srcpath.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <system_error>

namespace srctools::gameinfo {

namespace fs = std::filesystem;
namespace kv = srctools::keyvalues;

namespace {

constexpr std::string_view kGameInfoPath = "|gameinfo_path|";
constexpr std::string_view kAllSourceEnginePaths = "|all_source_engine_paths|";

int to_int(const std::string& s) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    (void)ptr;
    return ec == std::errc{} ? v : 0;
}

// has_game_key reports whether a "+"-separated search path key list names
// the "game" path ID.
bool has_game_key(const std::string& keys) {
    size_t start = 0;
    while (start <= keys.size()) {
        auto end = keys.find('+', start);
        if (end == std::string::npos) end = keys.size();
        if (kv::iequals(std::string_view(keys).substr(start, end - start), "game")) return true;
        start = end + 1;
    }
    return false;
}

// Steam's VDF writer escapes backslashes in paths.
std::string unescape_vdf(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && s[i + 1] == '\\') ++i;
        out += s[i];
    }
    return out;
}

std::string substitute(std::string value, std::string_view var, const fs::path& dir) {
    auto it = std::search(value.begin(), value.end(), var.begin(), var.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
    if (it == value.end()) return value;
    value.replace(static_cast<size_t>(it - value.begin()), var.size(), dir.generic_string() + "/");
    return value;
}

fs::path expand_path(const std::string& raw, const fs::path& game_dir, const fs::path& base_dir) {
    std::string v = substitute(raw, kGameInfoPath, game_dir);
    v = substitute(v, kAllSourceEnginePaths, base_dir);
    std::replace(v.begin(), v.end(), '\\', '/');

    fs::path p(v);
    if (p.is_relative()) p = base_dir / p;
    p = p.lexically_normal();
    // "dir/." normalizes to "dir/"
    if (!p.has_filename() && p.has_parent_path()) p = p.parent_path();
    return p;
}

void add_search_path(GameInfo& info, const std::string& keys, const fs::path& p) {
    auto name = p.filename().string();
    if (name == "*") {
        std::error_code ec;
        std::vector<fs::path> subdirs;
        for (const auto& entry : fs::directory_iterator(p.parent_path(), ec)) {
            if (entry.is_directory(ec)) subdirs.push_back(entry.path());
        }
        std::sort(subdirs.begin(), subdirs.end());
        for (auto& d : subdirs) info.search_paths.push_back({keys, std::move(d), false});
        return;
    }
    info.search_paths.push_back({keys, p, srcpath::ends_with_ci(name, ".vpk")});
}

} // namespace

GameInfo parse(const kv::Document& doc, const fs::path& game_dir) {
    auto* root = kv::get_block(doc.root, "GameInfo");
    if (!root) throw std::runtime_error("gameinfo: missing GameInfo block");

    GameInfo info;
    info.game = kv::get_string(*root, "game");
    info.game_dir = game_dir;

    auto* filesystem = kv::get_block(*root, "FileSystem");
    if (!filesystem) throw std::runtime_error("gameinfo: missing FileSystem block");
    info.app_id = to_int(kv::get_string(*filesystem, "SteamAppId"));

    auto* paths = kv::get_block(*filesystem, "SearchPaths");
    if (!paths) throw std::runtime_error("gameinfo: missing SearchPaths block");

    auto base_dir = game_dir.parent_path();
    for (const auto& p : paths->pairs) {
        auto* value = kv::as_string(p);
        if (!value || value->empty()) continue;
        if (!kv::condition_applies(p.condition)) continue;
        if (!has_game_key(p.key)) continue;
        add_search_path(info, p.key, expand_path(*value, game_dir, base_dir));
    }

    return info;
}

GameInfo read(const fs::path& gameinfo_txt) {
    std::error_code ec;
    if (!fs::is_regular_file(gameinfo_txt, ec))
        throw std::runtime_error(std::format("gameinfo: {} not found", gameinfo_txt.string()));
    auto dir = fs::absolute(gameinfo_txt, ec).parent_path();
    if (ec) dir = gameinfo_txt.parent_path();
    return parse(kv::parse(gameinfo_txt), dir);
}

std::vector<fs::path> default_steam_dirs() {
    std::vector<fs::path> out;
    if (const char* home = std::getenv("HOME"); home && *home) {
        fs::path h(home);
        out.push_back(h / ".steam" / "steam");
        out.push_back(h / ".local" / "share" / "Steam");
        out.push_back(h / ".var" / "app" / "com.valvesoftware.Steam" / ".local" / "share" / "Steam");
    }
    out.emplace_back("C:/Program Files (x86)/Steam");
    return out;
}

std::vector<fs::path> library_folders(const fs::path& steam_dir) {
    std::vector<fs::path> out{steam_dir};

    auto vdf = steam_dir / "steamapps" / "libraryfolders.vdf";
    std::error_code ec;
    if (!fs::is_regular_file(vdf, ec)) return out;

    auto doc = kv::parse(vdf);
    auto* root = kv::get_block(doc.root, "libraryfolders");
    if (!root) throw std::runtime_error(std::format("gameinfo: {} has no libraryfolders block", vdf.string()));

    for (const auto& p : root->pairs) {
        std::string path;
        if (auto* block = kv::as_block(p)) {
            path = kv::get_string(*block, "path");
        } else if (auto* value = kv::as_string(p); value && !p.key.empty() &&
                   std::all_of(p.key.begin(), p.key.end(), [](unsigned char c) { return std::isdigit(c); })) {
            path = *value; // pre-2021 format: "1" "D:\\SteamLibrary"
        }
        if (path.empty()) continue;

        fs::path lib(unescape_vdf(path));
        if (fs::equivalent(lib, steam_dir, ec)) continue;
        if (std::find(out.begin(), out.end(), lib) == out.end()) out.push_back(std::move(lib));
    }
    return out;
}

std::optional<fs::path> find_app_install(const fs::path& steam_dir, int app_id) {
    for (const auto& lib : library_folders(steam_dir)) {
        auto manifest = lib / "steamapps" / std::format("appmanifest_{}.acf", app_id);
        std::error_code ec;
        if (!fs::is_regular_file(manifest, ec)) continue;

        auto doc = kv::parse(manifest);
        auto* state = kv::get_block(doc.root, "AppState");
        if (!state) continue;
        auto installdir = kv::get_string(*state, "installdir");
        if (installdir.empty()) continue;

        auto dir = lib / "steamapps" / "common" / unescape_vdf(installdir);
        if (fs::is_directory(dir, ec)) return dir;
    }
    return std::nullopt;
}

} // namespace srctools::gameinfo

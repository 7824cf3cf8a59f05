#include "srctools/collect/collector.h"
#include "srctools/collect/manifest.h"
#include "srctools/collect/search_path.h"
#include "srctools/collect/walker.h"
#include "srctools/srcpath.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/settings.h"

namespace fs = std::filesystem;
namespace collect = srctools::collect;
using json = nlohmann::ordered_json;

struct Options {
    std::vector<std::string> roots;
    std::vector<std::string> sources;
    std::string output;
    std::string game_dir;
    std::string steam_dir;
    std::string game;
    int app_id = 0;
    bool no_game = false;
    bool json_stdout = false;
    bool pretty = false;
    int verbosity = 0;
};

static json resolution_json(const collect::Resolution& res) {
    json j = {{"status", std::string(collect::status_name(res.status))}};
    if (res.found()) {
        j["root"] = res.root_index;
        j["file"] = res.relative_path;
    } else if (res.status == collect::ResolutionStatus::FoundInGame) {
        j["gameLocation"] = res.game_location;
    }
    return j;
}

static json build_json(const collect::CollectionManifest& manifest, const collect::SearchPathIndex& index,
                       const collect::CopyResult& copied, const fs::path& output) {
    json roots = json::array();
    for (const auto& r : index.roots()) roots.push_back(r.dir.string());

    json entries = json::array();
    for (const auto& e : manifest.entries()) {
        json entry = {
            {"kind", std::string(collect::kind_name(e.ref.kind))},
            {"path", e.ref.path},
            {"referencedBy", e.ref.referenced_by},
        };
        entry.update(resolution_json(e.resolution));
        if (!e.siblings.empty()) {
            json sibs = json::array();
            for (const auto& s : e.siblings) {
                json sj = {{"suffix", s.suffix}};
                sj.update(resolution_json(s.resolution));
                sibs.push_back(sj);
            }
            entry["siblings"] = sibs;
        }
        entries.push_back(entry);
    }

    json diagnostics = json::array();
    for (const auto& d : manifest.diagnostics()) {
        diagnostics.push_back({
            {"kind", std::string(collect::diagnostic_name(d.kind))},
            {"asset", d.asset},
            {"message", d.message},
        });
    }

    return {
        {"schemaVersion", 1},
        {"output", output.string()},
        {"roots", roots},
        {"gameDirectories", index.game().directory_count()},
        {"gameArchives", index.game().archive_count()},
        {"filesCopied", copied.copied},
        {"entries", entries},
        {"diagnostics", diagnostics},
    };
}

static void print_summary(const collect::CollectionManifest& manifest, const collect::CopyResult& copied) {
    using srctools::cli::log_plain;
    using srctools::cli::marker;

    auto groups = manifest.grouped_diagnostics();
    if (!groups.empty()) {
        log_plain("");
        log_plain("Problems:");
        for (const auto& [asset, diags] : groups) {
            log_plain(std::format("  {}", asset));
            for (const auto* d : diags)
                log_plain(std::format("    {} {}: {}", marker("✖", "-"), collect::diagnostic_name(d->kind),
                                      d->message));
        }
    }

    log_plain("");
    log_plain("Content summary:");
    for (auto kind : {collect::AssetKind::Material, collect::AssetKind::Texture, collect::AssetKind::Model}) {
        auto c = manifest.counts(kind);
        log_plain(std::format("  {} {:<9} {} found, {} in game, {} missing",
                              marker(c.missing ? "✖" : "✔", c.missing ? "[!!]" : "[ok]"),
                              std::string(collect::kind_name(kind)) + "s", c.found, c.in_game, c.missing));
    }
    log_plain(std::format("  files copied: {}", copied.copied));
}

static void print_usage() {
    using srctools::cli::print;
    print("Usage: collect_content [flags] <root.vmf|root.mdl>...");
    print("Collects the materials, textures and models a map or model uses from the");
    print("source directories and copies them into the output directory.");
    print("");
    print("Flags:");
    print("  -s, --source <dir>   Source directory (repeatable, first = highest priority)");
    print("  -o, --output <dir>   Output directory (created if absent)");
    print("  --game-dir <dir>     Game install directory (skips Steam discovery)");
    print("  --steam-dir <dir>    Steam directory used to find the game");
    print("  --game <name>        Game folder inside the install (default garrysmod)");
    print("  --app-id <id>        Steam app id of the game (default 4000)");
    print("  --no-game            Do not fall back to the game's content");
    print("  --json               Print the collection manifest as JSON to stdout");
    print("  --pretty             Pretty-print JSON output");
    print("  -v, --verbose / -vv, --debug");
}

static bool flag_value(int argc, char* argv[], int& i, std::string& out) {
    if (i + 1 >= argc) {
        LOGE("missing value for", argv[i]);
        return false;
    }
    out = argv[++i];
    return true;
}

// parse_args returns an exit code when the program should stop.
static std::optional<int> parse_args(int argc, char* argv[], Options& opt) {
    for (int i = 1; i < argc; i++) {
        const char* a = argv[i];
        bool ok = true;
        if (std::strcmp(a, "-s") == 0 || std::strcmp(a, "--source") == 0) {
            std::string v;
            ok = flag_value(argc, argv, i, v);
            if (ok) opt.sources.push_back(v);
        } else if (std::strcmp(a, "-o") == 0 || std::strcmp(a, "--output") == 0) {
            ok = flag_value(argc, argv, i, opt.output);
        } else if (std::strcmp(a, "--game-dir") == 0) {
            ok = flag_value(argc, argv, i, opt.game_dir);
        } else if (std::strcmp(a, "--steam-dir") == 0) {
            ok = flag_value(argc, argv, i, opt.steam_dir);
        } else if (std::strcmp(a, "--game") == 0) {
            ok = flag_value(argc, argv, i, opt.game);
        } else if (std::strcmp(a, "--app-id") == 0) {
            std::string v;
            ok = flag_value(argc, argv, i, v);
            if (ok) {
                opt.app_id = std::atoi(v.c_str());
                if (opt.app_id <= 0) {
                    LOGE("invalid app id", v);
                    ok = false;
                }
            }
        } else if (std::strcmp(a, "--no-game") == 0) {
            opt.no_game = true;
        } else if (std::strcmp(a, "--json") == 0) {
            opt.json_stdout = true;
        } else if (std::strcmp(a, "--pretty") == 0) {
            opt.pretty = true;
        } else if (std::strcmp(a, "-v") == 0 || std::strcmp(a, "--verbose") == 0) {
            opt.verbosity = std::min(opt.verbosity + 1, 2);
        } else if (std::strcmp(a, "-vv") == 0 || std::strcmp(a, "--debug") == 0) {
            opt.verbosity = 2;
        } else if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            print_usage();
            return 0;
        } else if (a[0] == '-' && a[1] != '\0') {
            LOGE("unknown flag", a);
            ok = false;
        } else {
            opt.roots.push_back(a);
        }
        if (!ok) {
            print_usage();
            return 1;
        }
    }

    if (opt.roots.empty() || opt.output.empty()) {
        if (opt.roots.empty()) LOGE("no root asset given");
        if (opt.output.empty()) LOGE("no output directory given (-o)");
        print_usage();
        return 1;
    }
    return std::nullopt;
}

static void apply_settings(Options& opt, const srctools::settings::Settings& s) {
    if (opt.game_dir.empty()) opt.game_dir = s.game_dir;
    if (opt.steam_dir.empty()) opt.steam_dir = s.steam_dir;
    if (opt.game.empty()) opt.game = s.game;
    if (opt.app_id == 0) opt.app_id = s.app_id;
    for (const auto& p : s.source_paths) opt.sources.push_back(p);
    opt.verbosity = std::max(opt.verbosity, s.tool_verbosity_level);
}

static int run(const Options& opt) {
    std::vector<fs::path> model_roots;
    std::vector<collect::RootModel> models;
    std::vector<fs::path> maps;

    for (const auto& r : opt.roots) {
        if (srctools::srcpath::ends_with_ci(r, ".vmf")) {
            maps.emplace_back(r);
        } else if (srctools::srcpath::ends_with_ci(r, ".mdl")) {
            auto model = collect::root_model_from_file(r);
            if (std::find(model_roots.begin(), model_roots.end(), model.source_root) == model_roots.end())
                model_roots.push_back(model.source_root);
            models.push_back(std::move(model));
        } else {
            LOGE("unsupported root asset (expected .vmf or .mdl):", r);
            return 1;
        }
    }

    // -s and settings roots keep their order; the folders holding root models
    // come last so they never shadow an explicit source.
    std::vector<fs::path> roots;
    std::vector<fs::path> seen;
    auto add_root = [&](const fs::path& p) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(p, ec);
        if (ec) canonical = fs::absolute(p, ec).lexically_normal();
        if (std::find(seen.begin(), seen.end(), canonical) != seen.end()) return;
        seen.push_back(canonical);
        roots.push_back(p);
    };
    for (const auto& s : opt.sources) add_root(fs::path(s));
    for (const auto& m : model_roots) add_root(m);

    collect::GameContent game;
    if (!opt.no_game) {
        collect::GameLookup lookup;
        if (!opt.game_dir.empty()) lookup.install_dir = fs::path(opt.game_dir);
        if (!opt.steam_dir.empty()) lookup.steam_dir = fs::path(opt.steam_dir);
        lookup.game = opt.game;
        lookup.app_id = opt.app_id;

        std::vector<std::string> warnings;
        game = collect::discover_game_content(lookup, warnings);
        for (const auto& w : warnings) LOGW(w);
        LOGI(std::format("Game content: {} directories, {} packages", game.directory_count(),
                         game.archive_count()));
    }

    // Roots and maps are checked before the output directory is touched.
    collect::SearchPathIndex index(roots, std::move(game));
    for (const auto& r : index.roots()) LOGI(std::format("Source root {}: {}", r.index, r.dir.string()));

    collect::CollectionWalker walker(index);
    for (const auto& m : maps) {
        LOGI("Reading map", m.string());
        walker.add_map(collect::load_root_map(m), m.filename().string());
    }

    fs::path output(opt.output);
    collect::prepare_output(output);
    for (const auto& m : models) {
        LOGI("Adding model", m.ref.path);
        walker.add_root(m.ref);
    }
    walker.set_progress([](const collect::ManifestEntry& e) {
        LOGD(collect::kind_name(e.ref.kind), e.ref.path, "->", collect::status_name(e.resolution.status));
    });

    auto manifest = walker.walk();
    LOGI(std::format("Resolved {} assets", manifest.entries().size()));

    collect::Collector collector(output);
    auto copied = collector.copy(manifest);
    LOGI(std::format("Copied {} files to {}", copied.copied, output.string()));

    print_summary(manifest, copied);

    if (opt.json_stdout) {
        auto doc = build_json(manifest, index, copied, output);
        if (opt.pretty)
            std::cout << std::setw(2) << doc << '\n';
        else
            std::cout << doc << '\n';
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Options opt;
    if (auto code = parse_args(argc, argv, opt)) return *code;

    std::string settings_error;
    auto settings = srctools::settings::load_settings(srctools::settings::settings_path(), settings_error);
    apply_settings(opt, settings);
    srctools::cli::set_verbosity(opt.verbosity);
    if (!settings_error.empty()) LOGW(settings_error);

    try {
        return run(opt);
    } catch (const collect::FatalIOError& e) {
        LOGE(e.what());
    } catch (const std::exception& e) {
        LOGE("unexpected error:", e.what());
    }
    return 1;
}

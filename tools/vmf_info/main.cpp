#include "srctools/vmf.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

static json build_json(const srctools::vmf::Map& map, const srctools::vmf::MapStats& st,
                       const std::string& filename) {
    json classes = json::object();
    for (const auto& [name, count] : st.class_counts) classes[name] = count;

    return {
        {"schemaVersion", 1},
        {"filename", filename},
        {"version", {
            {"editorVersion", map.version.editor_version},
            {"editorBuild", map.version.editor_build},
            {"mapVersion", map.version.map_version},
            {"formatVersion", map.version.format_version},
            {"prefab", map.version.prefab},
        }},
        {"worldSolids", st.world_solids},
        {"worldFaces", st.world_faces},
        {"entities", st.entities},
        {"entitySolids", st.entity_solids},
        {"entityFaces", st.entity_faces},
        {"materials", st.distinct_materials},
        {"models", st.distinct_models},
        {"classes", classes},
    };
}

static void print_text(const srctools::vmf::Map& map, const srctools::vmf::MapStats& st,
                       const std::string& filename) {
    using srctools::cli::print;
    print(std::format("Map:            {}", filename));
    print(std::format("Editor:         version {} build {}", map.version.editor_version,
                      map.version.editor_build));
    print(std::format("Map version:    {}{}", map.version.map_version, map.version.prefab ? " (prefab)" : ""));
    print(std::format("World solids:   {}", st.world_solids));
    print(std::format("World faces:    {}", st.world_faces));
    print(std::format("Entities:       {}", st.entities));
    print(std::format("Entity solids:  {}", st.entity_solids));
    print(std::format("Entity faces:   {}", st.entity_faces));
    print(std::format("Materials:      {}", st.distinct_materials));
    print(std::format("Models:         {}", st.distinct_models));

    if (st.class_counts.empty()) return;

    std::vector<std::pair<std::string, int>> classes(st.class_counts.begin(), st.class_counts.end());
    std::stable_sort(classes.begin(), classes.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    print("");
    print("Entity classes:");
    for (const auto& [name, count] : classes) print(std::format("  {:>6}  {}", count, name));
}

static void print_usage() {
    srctools::cli::print("Usage: vmf_info [flags] <map.vmf>");
    srctools::cli::print("Prints brush, entity and content statistics of a Hammer map.");
    srctools::cli::print("");
    srctools::cli::print("Flags:");
    srctools::cli::print("  --json     Write JSON to stdout instead of a text summary");
    srctools::cli::print("  --pretty   Pretty-print JSON output");
    srctools::cli::print("  -v, --verbose / -vv, --debug");
}

int main(int argc, char* argv[]) {
    bool pretty = false;
    bool json_stdout = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_stdout = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            LOGE("unknown flag", argv[i]);
            print_usage();
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    srctools::cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        print_usage();
        return 1;
    }

    const auto& input = positional[0];
    LOGI("Reading", input);

    try {
        auto map = srctools::vmf::parse(fs::path(input));
        auto st = srctools::vmf::compute_stats(map);
        auto filename = fs::path(input).filename().string();
        LOGD("Parsed", map.entities.size(), "entities");

        if (json_stdout) {
            auto doc = build_json(map, st, filename);
            if (pretty)
                std::cout << std::setw(2) << doc << '\n';
            else
                std::cout << doc << '\n';
        } else {
            print_text(map, st, filename);
        }
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    return 0;
}

#pragma once

#include "srctools/keyvalues.h"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace srctools::vmf {

struct Side {
    int id = -1;
    std::string material;
};

struct Solid {
    int id = -1;
    std::vector<Side> sides;
};

struct Entity {
    int id = -1;
    std::string class_name;
    std::vector<std::pair<std::string, std::string>> properties;
    std::vector<Solid> solids;

    // property returns the value of key (case-insensitive) or nullptr.
    const std::string* property(std::string_view key) const;
};

struct VersionInfo {
    int editor_version = 0;
    int editor_build = 0;
    int map_version = 0;
    int format_version = 0;
    bool prefab = false;
};

// Map holds the parts of a Hammer map that reference content. Brushes inside
// "hidden" blocks are not compiled into the map and are not read.
struct Map {
    VersionInfo version;
    Entity world;
    std::vector<Entity> entities;
};

// parse reads a VMF file from disk.
Map parse(const std::filesystem::path& path);

// parse_bytes reads a VMF from an in-memory buffer.
Map parse_bytes(std::string_view data);

// parse extracts the map from a parsed KeyValues document.
Map parse(const keyvalues::Document& doc);

enum class ReferenceKind { Material, Model };

// Reference is one content reference found in a map. path is already in
// standard form: "materials/<name>.vmt" or the extension-less model base path.
struct Reference {
    ReferenceKind kind = ReferenceKind::Material;
    std::string path;
    std::string context;
};

// extract_references lists every material and model referenced by brush
// faces and entity keys ("material", "texture", "model"), in map order.
// Sprite entities name a material through "model". Brush model names ("*12")
// and empty values are skipped.
std::vector<Reference> extract_references(const Map& map);

struct MapStats {
    int world_solids = 0;
    int world_faces = 0;
    int entities = 0;
    int entity_solids = 0;
    int entity_faces = 0;
    int distinct_materials = 0;
    int distinct_models = 0;
    std::map<std::string, int> class_counts;
};

// compute_stats summarizes brush, entity and reference counts.
MapStats compute_stats(const Map& map);

} // namespace srctools::vmf

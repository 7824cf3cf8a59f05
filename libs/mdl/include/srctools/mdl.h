#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace srctools::mdl {

// Model holds the content-relevant parts of a studio model header (.mdl).
// Geometry, animation and bone data are not read.
struct Model {
    int version = 0;  // 44-49
    int32_t checksum = 0;
    std::string name; // name stored in the header, e.g. "props/crate.mdl"
    int32_t length = 0;
    int32_t flags = 0;
    float mass = 0.0f;
    std::string surface_prop;
    std::vector<std::string> textures;    // material names without directory
    std::vector<std::string> cdmaterials; // material search directories, in order
    std::vector<std::vector<int16_t>> skin_families; // [family][slot] -> texture index
    std::vector<std::string> include_models;         // $includemodel paths ("models/...mdl")
};

// read parses a studio model header from r.
Model read(std::istream& r);

// read_bytes parses a studio model from an in-memory buffer.
Model read_bytes(std::string_view data);

// read reads and parses a studio model file from disk.
Model read(const std::filesystem::path& path);

// MaterialRef is one material the model may render with. candidates holds the
// standardized material paths in cdmaterials order; the engine uses the first
// one that exists.
struct MaterialRef {
    std::string name;
    std::vector<std::string> candidates;
};

// material_references lists the texture-table entries referenced by any skin
// family (every entry when the model has no skin table), with their
// candidate material paths.
std::vector<MaterialRef> material_references(const Model& model);

} // namespace srctools::mdl

#pragma once

#include "srctools/keyvalues.h"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace srctools::vmt {

// Parameters holds shader parameters in file order with lowercased keys.
// Only scalar values of the shader block are kept; nested blocks such as
// Proxies or shader fallbacks are skipped.
using Parameters = std::vector<std::pair<std::string, std::string>>;

struct PlainMaterial {
    std::string shader;
    Parameters params;
};

// PatchMaterial inherits the material named by `include` and overrides keys
// through its insert and replace blocks.
struct PatchMaterial {
    std::string include;
    Parameters insert;
    Parameters replace;
};

using Material = std::variant<PlainMaterial, PatchMaterial>;

// parse reads a VMT file from disk.
Material parse(const std::filesystem::path& path);

// parse_bytes reads a VMT from an in-memory buffer.
Material parse_bytes(std::string_view data);

// parse extracts the material from a parsed KeyValues document.
Material parse(const keyvalues::Document& doc);

inline bool is_patch(const Material& m) { return std::holds_alternative<PatchMaterial>(m); }

// find_param returns the value of key (case-insensitive) or nullptr.
const std::string* find_param(const Parameters& params, std::string_view key);

// set_param adds key or overwrites its value in place.
void set_param(Parameters& params, const std::string& key, const std::string& value);

// apply_patch returns base with the patch's insert and replace entries
// applied on top; patch values always win.
Parameters apply_patch(const Parameters& base, const PatchMaterial& patch);

// texture_parameters lists the shader parameters whose value is a texture path.
std::span<const std::string_view> texture_parameters();

bool is_texture_parameter(std::string_view key);

// Parameters whose value names another material rather than a texture.
inline constexpr std::string_view bottom_material_parameter = "$bottommaterial";

// Value of $envmap that asks the engine for the nearest built cubemap.
inline constexpr std::string_view engine_cubemap = "env_cubemap";

} // namespace srctools::vmt

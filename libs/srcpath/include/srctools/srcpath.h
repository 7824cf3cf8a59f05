#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace srctools::srcpath {

// to_slash converts backslashes to forward slashes, drops empty and "."
// segments (so leading "/" and trailing "/" go too) and folds "dir/.." pairs.
std::string to_slash(std::string p);

// to_slash_lower is like to_slash but also lowercases the result.
inline std::string to_slash_lower(const std::string& p) {
    std::string s = to_slash(p);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// to_os converts a game path to OS-native separators.
inline std::filesystem::path to_os(const std::string& p) {
    return std::filesystem::path(to_slash(p)).make_preferred();
}

// ends_with_ci reports whether path ends with suffix, ignoring ASCII case.
bool ends_with_ci(std::string_view path, std::string_view suffix);

// is_safe_relative is false for empty paths, absolute paths (including
// drive letters) and paths with ".." components. Run it on to_slash output,
// where ".." only survives when the path climbs above its root.
bool is_safe_relative(std::string_view normalized);

// find_file_ci resolves a game-style relative path under root using
// case-insensitive matching for each path component.
std::optional<std::filesystem::path> find_file_ci(const std::filesystem::path& root,
                                                   const std::string& rel_path);

// make_material_path builds "materials/<name>.vmt" from a material name as
// written in maps, models and $bottommaterial values.
std::string make_material_path(const std::string& material_name);

// make_texture_path builds "materials/<name>.vtf" from a texture parameter value.
std::string make_texture_path(const std::string& texture_name);

// make_model_path returns the extension-less model base path, e.g.
// "models/props/crate" for "Models\Props\crate.mdl".
std::string make_model_path(const std::string& model_name);

} // namespace srctools::srcpath

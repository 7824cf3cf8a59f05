#include "srctools/srcpath.h"

#include <cctype>
#include <sstream>
#include <system_error>
#include <vector>

namespace srctools::srcpath {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string with_prefix(std::string p, std::string_view prefix) {
    if (!p.starts_with(prefix)) p.insert(0, prefix);
    return p;
}

std::string with_extension(std::string p, std::string_view ext) {
    if (!p.ends_with(ext)) p += ext;
    return p;
}

} // namespace

std::string to_slash(std::string p) {
    std::replace(p.begin(), p.end(), '\\', '/');

    // Segments are resolved lexically. ".." that would climb above the start
    // is kept so is_safe_relative can reject it.
    std::vector<std::string_view> parts;
    std::string_view view(p);
    size_t start = 0;
    while (start <= view.size()) {
        auto end = view.find('/', start);
        if (end == std::string_view::npos) end = view.size();
        auto part = view.substr(start, end - start);
        start = end + 1;

        if (part.empty() || part == ".") continue;
        if (part == ".." && !parts.empty() && parts.back() != "..") {
            parts.pop_back();
            continue;
        }
        parts.push_back(part);
    }

    std::string out;
    out.reserve(p.size());
    for (const auto& part : parts) {
        if (!out.empty()) out += '/';
        out += part;
    }
    return out;
}

bool ends_with_ci(std::string_view path, std::string_view suffix) {
    if (suffix.size() > path.size()) return false;
    auto tail = path.substr(path.size() - suffix.size());
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i])) !=
            std::tolower(static_cast<unsigned char>(suffix[i])))
            return false;
    }
    return true;
}

bool is_safe_relative(std::string_view normalized) {
    if (normalized.empty()) return false;
    if (normalized.front() == '/') return false;
    if (normalized.size() >= 2 && normalized[1] == ':') return false;

    size_t start = 0;
    while (start <= normalized.size()) {
        auto end = normalized.find('/', start);
        if (end == std::string_view::npos) end = normalized.size();
        if (normalized.substr(start, end - start) == "..") return false;
        start = end + 1;
    }
    return true;
}

std::optional<std::filesystem::path> find_file_ci(const std::filesystem::path& root,
                                                   const std::string& rel_path) {
    std::string normalized = to_slash(rel_path);
    if (!is_safe_relative(normalized)) return std::nullopt;

    std::error_code ec;
    auto direct = root / std::filesystem::path(normalized);
    if (std::filesystem::is_regular_file(direct, ec)) return direct;

    std::istringstream ss(normalized);
    std::string part;
    std::filesystem::path cur = root;

    while (std::getline(ss, part, '/')) {
        if (part.empty() || part == ".") continue;
        std::string lower_part = lower(part);

        // Several case variants may exist; the smallest name wins so the
        // result does not depend on directory iteration order.
        std::optional<std::filesystem::path> best;
        for (const auto& entry : std::filesystem::directory_iterator(cur, ec)) {
            auto name = entry.path().filename().string();
            if (lower(name) != lower_part) continue;
            if (!best || name < best->filename().string()) best = entry.path();
        }
        if (!best) return std::nullopt;
        cur = *best;
    }

    if (!std::filesystem::is_regular_file(cur, ec)) return std::nullopt;
    return cur;
}

std::string make_material_path(const std::string& material_name) {
    auto p = to_slash_lower(material_name);
    return with_extension(with_prefix(std::move(p), "materials/"), ".vmt");
}

std::string make_texture_path(const std::string& texture_name) {
    auto p = to_slash_lower(texture_name);
    return with_extension(with_prefix(std::move(p), "materials/"), ".vtf");
}

std::string make_model_path(const std::string& model_name) {
    auto p = with_prefix(to_slash_lower(model_name), "models/");
    if (p.ends_with(".mdl")) p.resize(p.size() - 4);
    return p;
}

} // namespace srctools::srcpath

#include "srctools/vmt.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace srctools::vmt {

namespace {

constexpr std::array<std::string_view, 20> kTextureParameters = {
    "$basetexture",
    "$basetexture2",
    "$detail",
    "$detail1",
    "$detail2",
    "$bumpmap",
    "$bumpmap2",
    "$bumpmask",
    "$selfillummask",
    "$selfillumtexture",
    "$ambientoccltexture",
    "$lightmap",
    "$phongexponenttexture",
    "$phongwarptexture",
    "$envmap",
    "$envmapmask",
    "$tintmasktexture",
    "$blendmodulatetexture",
    "$normalmap",
    "$lightwarptexture",
};

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Parameters read_parameters(const keyvalues::Block& block) {
    Parameters out;
    for (const auto& p : block.pairs) {
        auto* value = keyvalues::as_string(p);
        if (!value) continue;
        if (!keyvalues::condition_applies(p.condition)) continue;
        auto key = to_lower_ascii(p.key);
        if (find_param(out, key)) continue;
        out.emplace_back(std::move(key), *value);
    }
    return out;
}

} // namespace

const std::string* find_param(const Parameters& params, std::string_view key) {
    for (const auto& [k, v] : params) {
        if (keyvalues::iequals(k, key)) return &v;
    }
    return nullptr;
}

void set_param(Parameters& params, const std::string& key, const std::string& value) {
    auto lower = to_lower_ascii(key);
    for (auto& [k, v] : params) {
        if (k == lower) {
            v = value;
            return;
        }
    }
    params.emplace_back(std::move(lower), value);
}

Parameters apply_patch(const Parameters& base, const PatchMaterial& patch) {
    Parameters out = base;
    for (const auto& [k, v] : patch.insert) set_param(out, k, v);
    for (const auto& [k, v] : patch.replace) set_param(out, k, v);
    return out;
}

std::span<const std::string_view> texture_parameters() {
    return kTextureParameters;
}

bool is_texture_parameter(std::string_view key) {
    return std::any_of(kTextureParameters.begin(), kTextureParameters.end(),
                       [&](std::string_view p) { return keyvalues::iequals(p, key); });
}

Material parse(const keyvalues::Document& doc) {
    const keyvalues::Pair* shader = nullptr;
    for (const auto& p : doc.root.pairs) {
        if (keyvalues::as_block(p)) {
            shader = &p;
            break;
        }
    }
    if (!shader) throw std::runtime_error("vmt: missing shader block");

    const auto& body = *keyvalues::as_block(*shader);

    if (keyvalues::iequals(shader->key, "patch")) {
        PatchMaterial patch;
        patch.include = keyvalues::get_string(body, "include");
        if (patch.include.empty()) throw std::runtime_error("vmt: patch material without include");
        if (auto* insert = keyvalues::get_block(body, "insert")) patch.insert = read_parameters(*insert);
        if (auto* replace = keyvalues::get_block(body, "replace")) patch.replace = read_parameters(*replace);
        return patch;
    }

    PlainMaterial mat;
    mat.shader = shader->key;
    mat.params = read_parameters(body);
    return mat;
}

Material parse_bytes(std::string_view data) {
    return parse(keyvalues::parse_bytes(data));
}

Material parse(const std::filesystem::path& path) {
    return parse(keyvalues::parse(path));
}

} // namespace srctools::vmt

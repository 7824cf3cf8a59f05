#pragma once

// Builds minimal studio model files in memory for tests. Only the header
// fields read by srctools::mdl are filled in.

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace srctools::testing {

struct MdlContents {
    int version = 48;
    std::string name = "test.mdl";
    std::vector<std::string> textures;
    std::vector<std::string> cdmaterials;
    std::vector<std::vector<int16_t>> skin_families;
    std::vector<std::string> include_models;
    std::string surface_prop;
};

inline std::string build_mdl(const MdlContents& c) {
    std::string buf(408, '\0');
    auto put_i32 = [&](size_t off, int32_t v) { std::memcpy(&buf[off], &v, 4); };
    auto put_i16 = [&](size_t off, int16_t v) { std::memcpy(&buf[off], &v, 2); };
    auto append_string = [&](const std::string& s) {
        auto off = buf.size();
        buf += s;
        buf.push_back('\0');
        return off;
    };

    put_i32(0, 0x54534449); // IDST
    put_i32(4, c.version);
    put_i32(8, 0x1234);
    std::memcpy(&buf[12], c.name.data(), std::min<size_t>(c.name.size(), 63));
    put_i32(152, 0);

    size_t texture_index = buf.size();
    buf.resize(buf.size() + c.textures.size() * 64, '\0');
    size_t cd_index = buf.size();
    buf.resize(buf.size() + c.cdmaterials.size() * 4, '\0');
    size_t num_skin_ref = c.skin_families.empty() ? 0 : c.skin_families.front().size();
    size_t skin_index = buf.size();
    buf.resize(buf.size() + c.skin_families.size() * num_skin_ref * 2, '\0');
    size_t include_index = buf.size();
    buf.resize(buf.size() + c.include_models.size() * 8, '\0');

    put_i32(204, static_cast<int32_t>(c.textures.size()));
    put_i32(208, static_cast<int32_t>(texture_index));
    put_i32(212, static_cast<int32_t>(c.cdmaterials.size()));
    put_i32(216, static_cast<int32_t>(cd_index));
    put_i32(220, static_cast<int32_t>(num_skin_ref));
    put_i32(224, static_cast<int32_t>(c.skin_families.size()));
    put_i32(228, static_cast<int32_t>(skin_index));
    put_i32(336, static_cast<int32_t>(c.include_models.size()));
    put_i32(340, static_cast<int32_t>(include_index));

    for (size_t f = 0; f < c.skin_families.size(); ++f) {
        for (size_t s = 0; s < num_skin_ref; ++s)
            put_i16(skin_index + (f * num_skin_ref + s) * 2, c.skin_families[f][s]);
    }

    for (size_t i = 0; i < c.textures.size(); ++i) {
        size_t base = texture_index + i * 64;
        auto off = append_string(c.textures[i]);
        put_i32(base, static_cast<int32_t>(off - base));
    }
    for (size_t i = 0; i < c.cdmaterials.size(); ++i) {
        auto off = append_string(c.cdmaterials[i]);
        put_i32(cd_index + i * 4, static_cast<int32_t>(off));
    }
    for (size_t i = 0; i < c.include_models.size(); ++i) {
        size_t base = include_index + i * 8;
        auto off = append_string(c.include_models[i]);
        put_i32(base + 4, static_cast<int32_t>(off - base));
    }
    if (!c.surface_prop.empty())
        put_i32(308, static_cast<int32_t>(append_string(c.surface_prop)));

    put_i32(76, static_cast<int32_t>(buf.size()));
    return buf;
}

} // namespace srctools::testing

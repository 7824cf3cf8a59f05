#include "srctools/vmf.h"
#include "srctools/srcpath.h"

#include <charconv>
#include <format>
#include <set>
#include <stdexcept>

namespace srctools::vmf {

namespace {

namespace kv = srctools::keyvalues;

int to_int(const std::string& s) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    (void)ptr;
    if (ec != std::errc{}) return 0;
    return v;
}

Solid read_solid(const kv::Block& block) {
    Solid solid;
    solid.id = to_int(kv::get_string(block, "id"));
    for (const auto& p : block.pairs) {
        if (!kv::iequals(p.key, "side")) continue;
        auto* side_block = kv::as_block(p);
        if (!side_block) continue;
        Side side;
        side.id = to_int(kv::get_string(*side_block, "id"));
        side.material = kv::get_string(*side_block, "material");
        solid.sides.push_back(std::move(side));
    }
    return solid;
}

Entity read_entity(const kv::Block& block) {
    Entity ent;
    for (const auto& p : block.pairs) {
        if (auto* value = kv::as_string(p)) {
            if (kv::iequals(p.key, "id")) ent.id = to_int(*value);
            else if (kv::iequals(p.key, "classname")) ent.class_name = *value;
            ent.properties.emplace_back(p.key, *value);
        } else if (kv::iequals(p.key, "solid")) {
            ent.solids.push_back(read_solid(*kv::as_block(p)));
        }
    }
    return ent;
}

bool is_sprite_class(const std::string& class_name) {
    return kv::iequals(class_name, "env_sprite") || kv::iequals(class_name, "env_sprite_oriented") ||
           kv::iequals(class_name, "env_glow");
}

std::string describe(const Entity& ent) {
    return std::format("entity {} ({})", ent.id, ent.class_name);
}

void add_solid_materials(const Solid& solid, const std::string& owner, std::vector<Reference>& out) {
    for (const auto& side : solid.sides) {
        if (side.material.empty()) continue;
        out.push_back({ReferenceKind::Material, srcpath::make_material_path(side.material),
                       std::format("{}solid {} side {}", owner, solid.id, side.id)});
    }
}

} // namespace

const std::string* Entity::property(std::string_view key) const {
    for (const auto& [k, v] : properties) {
        if (kv::iequals(k, key)) return &v;
    }
    return nullptr;
}

Map parse(const kv::Document& doc) {
    Map map;
    bool have_world = false;

    for (const auto& p : doc.root.pairs) {
        auto* block = kv::as_block(p);
        if (!block) continue;

        if (kv::iequals(p.key, "versioninfo")) {
            map.version.editor_version = to_int(kv::get_string(*block, "editorversion"));
            map.version.editor_build = to_int(kv::get_string(*block, "editorbuild"));
            map.version.map_version = to_int(kv::get_string(*block, "mapversion"));
            map.version.format_version = to_int(kv::get_string(*block, "formatversion"));
            map.version.prefab = kv::get_string(*block, "prefab") == "1";
        } else if (kv::iequals(p.key, "world")) {
            map.world = read_entity(*block);
            have_world = true;
        } else if (kv::iequals(p.key, "entity")) {
            map.entities.push_back(read_entity(*block));
        }
    }

    if (!have_world) throw std::runtime_error("vmf: missing world block");
    return map;
}

Map parse_bytes(std::string_view data) {
    return parse(kv::parse_bytes(data));
}

Map parse(const std::filesystem::path& path) {
    return parse(kv::parse(path));
}

std::vector<Reference> extract_references(const Map& map) {
    std::vector<Reference> out;

    for (const auto& solid : map.world.solids) add_solid_materials(solid, "world ", out);

    for (const auto& ent : map.entities) {
        auto owner = describe(ent) + " ";
        for (const auto& solid : ent.solids) add_solid_materials(solid, owner, out);

        for (const char* key : {"material", "texture"}) {
            auto* value = ent.property(key);
            if (!value || value->empty()) continue;
            out.push_back({ReferenceKind::Material, srcpath::make_material_path(*value),
                           std::format("{} \"{}\" key", describe(ent), key)});
        }

        auto* model = ent.property("model");
        if (!model || model->empty() || model->front() == '*') continue;

        if (is_sprite_class(ent.class_name) || srcpath::ends_with_ci(*model, ".vmt")) {
            out.push_back({ReferenceKind::Material, srcpath::make_material_path(*model),
                           std::format("sprite material of {}", describe(ent))});
        } else {
            out.push_back({ReferenceKind::Model, srcpath::make_model_path(*model), describe(ent)});
        }
    }

    return out;
}

MapStats compute_stats(const Map& map) {
    MapStats st;
    st.world_solids = static_cast<int>(map.world.solids.size());
    for (const auto& s : map.world.solids) st.world_faces += static_cast<int>(s.sides.size());

    st.entities = static_cast<int>(map.entities.size());
    for (const auto& ent : map.entities) {
        st.class_counts[ent.class_name]++;
        st.entity_solids += static_cast<int>(ent.solids.size());
        for (const auto& s : ent.solids) st.entity_faces += static_cast<int>(s.sides.size());
    }

    std::set<std::string> materials;
    std::set<std::string> models;
    for (const auto& ref : extract_references(map)) {
        if (ref.kind == ReferenceKind::Material) materials.insert(ref.path);
        else models.insert(ref.path);
    }
    st.distinct_materials = static_cast<int>(materials.size());
    st.distinct_models = static_cast<int>(models.size());
    return st;
}

} // namespace srctools::vmf

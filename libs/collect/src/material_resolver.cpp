#include "srctools/collect/material_resolver.h"
#include "srctools/keyvalues.h"
#include "srctools/srcpath.h"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace srctools::collect {

namespace {

std::string format_chain(const std::vector<std::string>& chain, const std::string& closing) {
    std::string out;
    for (const auto& p : chain) {
        out += p;
        out += " -> ";
    }
    return out + closing;
}

} // namespace

MaterialResolver::CachedMaterial& MaterialResolver::load(const std::string& path) {
    auto key = srcpath::to_slash_lower(path);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;

    CachedMaterial m;
    m.resolution = index_.resolve(key);
    if (m.resolution.found()) {
        try {
            m.document = vmt::parse(m.resolution.absolute_path);
        } catch (const std::exception& e) {
            m.parse_error = e.what();
        }
    }
    return cache_.emplace(std::move(key), std::move(m)).first->second;
}

const vmt::Parameters* MaterialResolver::effective(const std::string& path, std::vector<std::string>& chain,
                                                   std::vector<Diagnostic>& diagnostics) {
    auto& m = load(path);
    if (m.effective) return &*m.effective;
    if (!m.document) return nullptr;

    if (auto* plain = std::get_if<vmt::PlainMaterial>(&*m.document)) {
        m.effective = plain->params;
        return &*m.effective;
    }

    const auto& patch = std::get<vmt::PatchMaterial>(*m.document);
    auto key = srcpath::to_slash_lower(path);
    auto base = srcpath::make_material_path(patch.include);

    vmt::Parameters inherited;
    if (std::find(chain.begin(), chain.end(), base) != chain.end() || base == key) {
        m.circular_include = true;
        chain.push_back(key);
        diagnostics.push_back({DiagnosticKind::CircularPatchReference,
                               make_reference(AssetKind::Material, key).key(),
                               std::format("patch include cycle {}", format_chain(chain, base))});
        chain.pop_back();
    } else {
        chain.push_back(key);
        if (auto* base_params = effective(base, chain, diagnostics)) inherited = *base_params;
        chain.pop_back();
    }

    m.effective = vmt::apply_patch(inherited, patch);
    return &*m.effective;
}

const vmt::Parameters* MaterialResolver::effective_parameters(const std::string& path,
                                                              std::vector<Diagnostic>& diagnostics) {
    std::vector<std::string> chain;
    return effective(path, chain, diagnostics);
}

ResolveOutcome MaterialResolver::resolve(const AssetReference& ref) {
    ResolveOutcome out;
    auto& m = load(ref.path);
    out.resolution = m.resolution;

    if (m.resolution.missing()) {
        out.diagnostics.push_back({DiagnosticKind::MissingAsset, ref.key(),
                                   std::format("material not found (referenced by {})", ref.referenced_by)});
        return out;
    }
    if (!m.resolution.found()) return out;

    if (!m.document) {
        out.diagnostics.push_back({DiagnosticKind::MalformedAsset, ref.key(),
                                   std::format("cannot parse {}: {}", m.resolution.absolute_path.string(),
                                               m.parse_error)});
        out.resolution = Resolution{};
        return out;
    }

    auto* params = effective_parameters(ref.path, out.diagnostics);

    if (auto* patch = std::get_if<vmt::PatchMaterial>(&*m.document); patch && !m.circular_include) {
        out.discovered.push_back(make_reference(AssetKind::Material, srcpath::make_material_path(patch->include),
                                                std::format("patch {}", ref.path)));
    }
    if (!params) return out;

    for (const auto& [key, value] : *params) {
        if (value.empty()) continue;
        if (vmt::is_texture_parameter(key)) {
            if (key == "$envmap" && keyvalues::iequals(value, vmt::engine_cubemap)) continue;
            out.discovered.push_back(make_reference(AssetKind::Texture, srcpath::make_texture_path(value),
                                                    std::format("material {} ({})", ref.path, key)));
        } else if (key == vmt::bottom_material_parameter) {
            out.discovered.push_back(make_reference(AssetKind::Material, srcpath::make_material_path(value),
                                                    std::format("material {} ({})", ref.path, key)));
        }
    }
    return out;
}

} // namespace srctools::collect

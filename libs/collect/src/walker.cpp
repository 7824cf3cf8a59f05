#include "srctools/collect/walker.h"
#include "srctools/keyvalues.h"
#include "srctools/srcpath.h"

#include <format>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace srctools::collect {

namespace fs = std::filesystem;

CollectionWalker::CollectionWalker(SearchPathIndex& index)
    : index_(index), materials_(index), models_(index) {}

void CollectionWalker::add_root(AssetReference ref) {
    queue_.push_back(std::move(ref));
}

void CollectionWalker::add_map(const vmf::Map& map, const std::string& map_name) {
    for (const auto& r : vmf::extract_references(map)) {
        auto kind = r.kind == vmf::ReferenceKind::Model ? AssetKind::Model : AssetKind::Material;
        queue_.push_back(make_reference(kind, r.path, std::format("{} {}", map_name, r.context)));
    }
}

ResolveOutcome CollectionWalker::resolve_texture(const AssetReference& ref) {
    ResolveOutcome out;
    out.resolution = index_.resolve(ref.path);
    if (out.resolution.missing()) {
        out.diagnostics.push_back({DiagnosticKind::MissingAsset, ref.key(),
                                   std::format("texture not found (referenced by {})", ref.referenced_by)});
    }
    return out;
}

CollectionManifest CollectionWalker::walk() {
    CollectionManifest manifest;
    std::unordered_set<std::string> skipped;

    while (!queue_.empty()) {
        auto ref = std::move(queue_.front());
        queue_.pop_front();

        if (!srcpath::is_safe_relative(ref.path)) {
            if (skipped.insert(ref.key()).second) {
                manifest.add_diagnostic({DiagnosticKind::SkippedReference, ref.key(),
                                         std::format("unusable path \"{}\" (referenced by {})", ref.path,
                                                     ref.referenced_by)});
            }
            continue;
        }

        auto [idx, inserted] = manifest.try_insert(ref);
        if (!inserted) continue;

        ResolveOutcome out;
        switch (ref.kind) {
            case AssetKind::Material: out = materials_.resolve(ref); break;
            case AssetKind::Model: out = models_.resolve(ref); break;
            case AssetKind::Texture: out = resolve_texture(ref); break;
        }

        auto& entry = manifest.at(idx);
        entry.resolution = std::move(out.resolution);
        entry.siblings = std::move(out.siblings);
        for (auto& d : out.diagnostics) manifest.add_diagnostic(std::move(d));
        for (auto& next : out.discovered) {
            if (!manifest.contains(next)) queue_.push_back(std::move(next));
        }

        if (progress_) progress_(manifest.entries()[idx]);
    }

    return manifest;
}

RootModel root_model_from_file(const fs::path& mdl_file) {
    std::error_code ec;
    auto abs = fs::absolute(mdl_file, ec);
    if (ec || !fs::is_regular_file(abs, ec))
        throw FatalIOError(std::format("cannot read model {}", mdl_file.string()));
    if (!std::ifstream(abs, std::ios::binary))
        throw FatalIOError(std::format("cannot open model {}", mdl_file.string()));

    abs = abs.lexically_normal();
    for (auto dir = abs.parent_path(); dir.has_relative_path(); dir = dir.parent_path()) {
        if (!keyvalues::iequals(dir.filename().string(), "models")) continue;
        auto rel = abs.lexically_relative(dir.parent_path()).generic_string();
        return {make_reference(AssetKind::Model, srcpath::make_model_path(rel), "command line"), dir.parent_path()};
    }
    throw FatalIOError(std::format("model {} is not inside a \"models\" directory", mdl_file.string()));
}

vmf::Map load_root_map(const fs::path& vmf_file) {
    std::error_code ec;
    if (!fs::is_regular_file(vmf_file, ec))
        throw FatalIOError(std::format("cannot read map {}", vmf_file.string()));
    try {
        return vmf::parse(vmf_file);
    } catch (const std::runtime_error& e) {
        throw FatalIOError(std::format("cannot parse map {}: {}", vmf_file.string(), e.what()));
    }
}

} // namespace srctools::collect

#include "srctools/collect/manifest.h"

#include <algorithm>

namespace srctools::collect {

std::string_view diagnostic_name(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::MissingAsset: return "missing_asset";
        case DiagnosticKind::MissingOptionalFile: return "missing_optional_file";
        case DiagnosticKind::CircularPatchReference: return "circular_patch_reference";
        case DiagnosticKind::MalformedAsset: return "malformed_asset";
        case DiagnosticKind::SkippedReference: return "skipped_reference";
    }
    return "unknown";
}

std::pair<size_t, bool> CollectionManifest::try_insert(const AssetReference& ref) {
    auto [it, inserted] = index_.try_emplace(ref.key(), entries_.size());
    if (inserted) entries_.push_back({ref, {}, {}});
    return {it->second, inserted};
}

bool CollectionManifest::contains(const AssetReference& ref) const {
    return index_.count(ref.key()) != 0;
}

const ManifestEntry* CollectionManifest::find(const AssetReference& ref) const {
    auto it = index_.find(ref.key());
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

size_t CollectionManifest::diagnostic_count(DiagnosticKind kind) const {
    return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
                                             [&](const Diagnostic& d) { return d.kind == kind; }));
}

CollectionManifest::Counts CollectionManifest::counts(AssetKind kind) const {
    Counts c;
    for (const auto& e : entries_) {
        if (e.ref.kind != kind) continue;
        switch (e.resolution.status) {
            case ResolutionStatus::Found: ++c.found; break;
            case ResolutionStatus::FoundInGame: ++c.in_game; break;
            case ResolutionStatus::Missing: ++c.missing; break;
        }
    }
    return c;
}

std::vector<std::pair<std::string, std::vector<const Diagnostic*>>>
CollectionManifest::grouped_diagnostics() const {
    std::vector<std::pair<std::string, std::vector<const Diagnostic*>>> out;
    std::unordered_map<std::string, size_t> group_index;
    for (const auto& d : diagnostics_) {
        auto [it, inserted] = group_index.try_emplace(d.asset, out.size());
        if (inserted) out.push_back({d.asset, {}});
        out[it->second].second.push_back(&d);
    }
    return out;
}

} // namespace srctools::collect

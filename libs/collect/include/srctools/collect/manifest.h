#pragma once

#include "srctools/collect/asset.h"
#include "srctools/collect/search_path.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace srctools::collect {

enum class DiagnosticKind {
    MissingAsset,
    MissingOptionalFile,
    CircularPatchReference,
    MalformedAsset,
    SkippedReference,
};

std::string_view diagnostic_name(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::MissingAsset;
    std::string asset; // AssetReference::key() of the asset concerned
    std::string message;
};

// SiblingFile is one companion file of a model (.phy, .dx90.vtx, .vvd).
struct SiblingFile {
    std::string suffix;
    std::string path;
    Resolution resolution;
    bool required = false;
};

struct ManifestEntry {
    AssetReference ref;
    Resolution resolution;
    std::vector<SiblingFile> siblings;
};

// ResolveOutcome is what a resolver reports for one reference.
struct ResolveOutcome {
    Resolution resolution;
    std::vector<SiblingFile> siblings;
    std::vector<AssetReference> discovered;
    std::vector<Diagnostic> diagnostics;
};

// CollectionManifest records each asset reference once, in discovery order,
// together with its resolution, plus the diagnostics of the run.
class CollectionManifest {
public:
    // try_insert adds ref unless an entry with the same identity exists.
    // Returns the entry index and whether it was inserted.
    std::pair<size_t, bool> try_insert(const AssetReference& ref);

    bool contains(const AssetReference& ref) const;
    const ManifestEntry* find(const AssetReference& ref) const;

    ManifestEntry& at(size_t index) { return entries_.at(index); }
    const std::vector<ManifestEntry>& entries() const { return entries_; }

    void add_diagnostic(Diagnostic d) { diagnostics_.push_back(std::move(d)); }
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    size_t diagnostic_count(DiagnosticKind kind) const;

    struct Counts {
        size_t found = 0;
        size_t in_game = 0;
        size_t missing = 0;
    };
    Counts counts(AssetKind kind) const;

    // grouped_diagnostics groups diagnostics by asset, in order of first appearance.
    std::vector<std::pair<std::string, std::vector<const Diagnostic*>>> grouped_diagnostics() const;

private:
    std::vector<ManifestEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace srctools::collect

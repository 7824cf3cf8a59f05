#pragma once

#include "srctools/collect/manifest.h"
#include "srctools/collect/material_resolver.h"
#include "srctools/collect/model_resolver.h"
#include "srctools/collect/search_path.h"
#include "srctools/vmf.h"

#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

namespace srctools::collect {

// CollectionWalker computes the resolution closure of its root assets
// breadth-first. Every reference is resolved at most once; failures become
// diagnostics and never stop the walk.
class CollectionWalker {
public:
    using ProgressFunc = std::function<void(const ManifestEntry&)>;

    explicit CollectionWalker(SearchPathIndex& index);

    void add_root(AssetReference ref);

    // add_map queues every material and model the map references.
    void add_map(const vmf::Map& map, const std::string& map_name);

    void set_progress(ProgressFunc fn) { progress_ = std::move(fn); }

    CollectionManifest walk();

private:
    ResolveOutcome resolve_texture(const AssetReference& ref);

    SearchPathIndex& index_;
    MaterialResolver materials_;
    ModelResolver models_;
    std::deque<AssetReference> queue_;
    ProgressFunc progress_;
};

// RootModel locates a model file given on the command line: the reference
// relative to its nearest "models" ancestor, and that ancestor's parent as a
// source root.
struct RootModel {
    AssetReference ref;
    std::filesystem::path source_root;
};

// root_model_from_file throws FatalIOError when the file is unreadable or
// not inside a "models" directory.
RootModel root_model_from_file(const std::filesystem::path& mdl_file);

// load_root_map parses a map given on the command line. Throws FatalIOError.
vmf::Map load_root_map(const std::filesystem::path& vmf_file);

} // namespace srctools::collect

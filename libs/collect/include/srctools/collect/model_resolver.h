#pragma once

#include "srctools/collect/manifest.h"
#include "srctools/collect/search_path.h"

#include <array>
#include <string_view>

namespace srctools::collect {

// Files that make up one compiled model. Only the .mdl is required.
inline constexpr std::array<std::string_view, 4> kModelSuffixes = {".mdl", ".phy", ".dx90.vtx", ".vvd"};

// ModelResolver resolves a model base path, probes its companion files and
// reports the materials and include models the .mdl header references.
class ModelResolver {
public:
    explicit ModelResolver(SearchPathIndex& index) : index_(index) {}

    ResolveOutcome resolve(const AssetReference& ref);

private:
    SearchPathIndex& index_;
};

} // namespace srctools::collect

#pragma once

#include "srctools/collect/manifest.h"
#include "srctools/collect/search_path.h"
#include "srctools/vmt.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace srctools::collect {

// MaterialResolver resolves material references and reports the textures and
// materials they depend on. Patch materials are followed through their
// include chain; a chain that loops back on itself is reported once and cut
// at the repeated link.
class MaterialResolver {
public:
    explicit MaterialResolver(SearchPathIndex& index) : index_(index) {}

    ResolveOutcome resolve(const AssetReference& ref);

    // effective_parameters returns the merged parameters of a material path,
    // or nullptr when it is not a readable source material.
    const vmt::Parameters* effective_parameters(const std::string& path, std::vector<Diagnostic>& diagnostics);

private:
    struct CachedMaterial {
        Resolution resolution;
        std::optional<vmt::Material> document;
        std::string parse_error;
        std::optional<vmt::Parameters> effective;
        bool circular_include = false;
    };

    CachedMaterial& load(const std::string& path);
    const vmt::Parameters* effective(const std::string& path, std::vector<std::string>& chain,
                                     std::vector<Diagnostic>& diagnostics);

    SearchPathIndex& index_;
    std::unordered_map<std::string, CachedMaterial> cache_;
};

} // namespace srctools::collect

#include "srctools/collect/model_resolver.h"
#include "srctools/mdl.h"
#include "srctools/srcpath.h"

#include <format>
#include <stdexcept>

namespace srctools::collect {

ResolveOutcome ModelResolver::resolve(const AssetReference& ref) {
    ResolveOutcome out;
    auto mdl_path = ref.path + std::string(kModelSuffixes[0]);
    out.resolution = index_.resolve(mdl_path);

    if (out.resolution.missing()) {
        out.diagnostics.push_back({DiagnosticKind::MissingAsset, ref.key(),
                                   std::format("model {} not found (referenced by {})", mdl_path,
                                               ref.referenced_by)});
        return out;
    }
    // Game models ship their own materials; they are not opened.
    if (!out.resolution.found()) return out;

    mdl::Model model;
    try {
        model = mdl::read(out.resolution.absolute_path);
    } catch (const std::exception& e) {
        out.diagnostics.push_back({DiagnosticKind::MalformedAsset, ref.key(),
                                   std::format("cannot read {}: {}", out.resolution.absolute_path.string(),
                                               e.what())});
        out.resolution = Resolution{};
        return out;
    }

    for (size_t i = 1; i < kModelSuffixes.size(); ++i) {
        SiblingFile sib;
        sib.suffix = std::string(kModelSuffixes[i]);
        sib.path = ref.path + sib.suffix;
        sib.resolution = index_.resolve(sib.path);
        if (sib.resolution.missing()) {
            out.diagnostics.push_back({DiagnosticKind::MissingOptionalFile, ref.key(),
                                       std::format("optional file {} not found", sib.path)});
        }
        out.siblings.push_back(std::move(sib));
    }

    for (const auto& mat : mdl::material_references(model)) {
        if (mat.candidates.empty()) continue;
        const std::string* chosen = &mat.candidates.front();
        for (const auto& candidate : mat.candidates) {
            if (!index_.resolve(candidate).missing()) {
                chosen = &candidate;
                break;
            }
        }
        out.discovered.push_back(make_reference(AssetKind::Material, *chosen,
                                                std::format("model {} (texture {})", ref.path, mat.name)));
    }

    for (const auto& inc : model.include_models) {
        out.discovered.push_back(make_reference(AssetKind::Model, srcpath::make_model_path(inc),
                                                std::format("include model of {}", ref.path)));
    }

    return out;
}

} // namespace srctools::collect

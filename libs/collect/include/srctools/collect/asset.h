#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace srctools::collect {

enum class AssetKind { Material, Texture, Model };

std::string_view kind_name(AssetKind kind);

// AssetReference identifies one asset by kind and normalized relative path
// (lowercase, forward slashes, "materials/" or "models/" prefix; models have
// no extension). referenced_by only feeds diagnostics and is not part of the
// identity.
struct AssetReference {
    AssetKind kind = AssetKind::Material;
    std::string path;
    std::string referenced_by;

    std::string key() const;

    bool operator==(const AssetReference& o) const { return kind == o.kind && path == o.path; }
};

// make_reference normalizes path and builds a reference. Callers pass paths
// already built by the srcpath helpers; only case and separators change.
AssetReference make_reference(AssetKind kind, std::string_view path, std::string referenced_by = {});

// FatalIOError aborts a collection run: unreadable source roots or root
// assets, and output directories that cannot be created or written.
class FatalIOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace srctools::collect

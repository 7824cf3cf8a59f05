#include "srctools/collect/asset.h"
#include "srctools/srcpath.h"

namespace srctools::collect {

std::string_view kind_name(AssetKind kind) {
    switch (kind) {
        case AssetKind::Material: return "material";
        case AssetKind::Texture: return "texture";
        case AssetKind::Model: return "model";
    }
    return "unknown";
}

std::string AssetReference::key() const {
    std::string k(kind_name(kind));
    k += ':';
    k += path;
    return k;
}

AssetReference make_reference(AssetKind kind, std::string_view path, std::string referenced_by) {
    AssetReference ref;
    ref.kind = kind;
    ref.path = srcpath::to_slash_lower(std::string(path));
    ref.referenced_by = std::move(referenced_by);
    return ref;
}

} // namespace srctools::collect

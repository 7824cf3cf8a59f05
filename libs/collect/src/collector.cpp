#include "srctools/collect/collector.h"
#include "srctools/srcpath.h"

#include <format>
#include <system_error>

namespace srctools::collect {

namespace fs = std::filesystem;

void prepare_output(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw FatalIOError(std::format("cannot create output directory {}: {}", dir.string(), ec.message()));
    if (!fs::is_directory(dir, ec))
        throw FatalIOError(std::format("output path {} is not a directory", dir.string()));
}

void Collector::copy_file(const Resolution& res, CopyResult& result) {
    if (!res.found()) return;

    if (!copied_.insert(srcpath::to_slash_lower(res.relative_path)).second) {
        ++result.duplicates;
        return;
    }

    auto dest = output_dir_ / srcpath::to_os(res.relative_path);
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec)
        throw FatalIOError(
            std::format("cannot create directory {}: {}", dest.parent_path().string(), ec.message()));

    fs::copy_file(res.absolute_path, dest, fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw FatalIOError(std::format("cannot copy {} to {}: {}", res.absolute_path.string(), dest.string(),
                                       ec.message()));

    ++result.copied;
    result.files.push_back(std::move(dest));
}

CopyResult Collector::copy(const CollectionManifest& manifest) {
    CopyResult result;
    for (const auto& entry : manifest.entries()) {
        copy_file(entry.resolution, result);
        for (const auto& sib : entry.siblings) copy_file(sib.resolution, result);
    }
    return result;
}

} // namespace srctools::collect

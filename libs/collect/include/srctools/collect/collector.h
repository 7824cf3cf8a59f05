#pragma once

#include "srctools/collect/manifest.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace srctools::collect {

struct CopyResult {
    size_t copied = 0;
    size_t duplicates = 0; // Found entries whose file was already copied
    std::vector<std::filesystem::path> files;
};

// prepare_output creates the output directory if needed and checks that it
// is a directory. Throws FatalIOError.
void prepare_output(const std::filesystem::path& dir);

// Collector copies the Found entries of a manifest, and the Found companion
// files of models, into an output directory at their on-disk relative paths.
// Existing files are overwritten. Game content and missing entries are never
// copied.
class Collector {
public:
    explicit Collector(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

    // copy throws FatalIOError when a directory or file cannot be written.
    CopyResult copy(const CollectionManifest& manifest);

private:
    void copy_file(const Resolution& res, CopyResult& result);

    std::filesystem::path output_dir_;
    std::unordered_set<std::string> copied_;
};

} // namespace srctools::collect

#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <unordered_map>

namespace srctools::vpk {

// Entry describes one file stored in a VPK package.
struct Entry {
    uint32_t crc = 0;
    uint16_t preload_size = 0;
    uint16_t archive_index = 0; // kDirArchive: data follows the tree in the _dir file
    uint32_t offset = 0;
    uint32_t length = 0;
};

constexpr uint16_t kDirArchive = 0x7fff;

// Directory is the file tree of a VPK "_dir.vpk" file. Paths are keyed
// lowercase with forward slashes, e.g. "materials/metal/crate.vmt".
struct Directory {
    uint32_t version = 0; // 1 or 2
    uint32_t tree_size = 0;
    std::unordered_map<std::string, Entry> entries;
};

// read parses a VPK directory tree. File data and archive files are not read.
Directory read(std::istream& r);

// read opens and parses a "_dir.vpk" file from disk.
Directory read(const std::filesystem::path& path);

// find looks up a game path (any case or separator style) in the tree.
const Entry* find(const Directory& dir, const std::string& path);

// dir_file_path maps a package name as written in gameinfo.txt
// ("garrysmod/garrysmod.vpk") to its directory file ("garrysmod/garrysmod_dir.vpk").
// Paths already naming a "_dir.vpk" are returned unchanged.
std::filesystem::path dir_file_path(const std::filesystem::path& vpk);

} // namespace srctools::vpk

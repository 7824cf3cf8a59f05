#include "srctools/vpk.h"
#include "srctools/binutil.h"
#include "srctools/srcpath.h"

#include <format>
#include <fstream>
#include <stdexcept>

namespace srctools::vpk {

namespace {

constexpr uint32_t kSignature = 0x55aa1234;
constexpr uint16_t kEntryTerminator = 0xffff;

std::string join_tree_path(const std::string& dir, const std::string& name, const std::string& ext) {
    std::string p;
    // A single space stands for the package root or an empty extension.
    if (dir != " " && !dir.empty()) p = dir + "/";
    p += name;
    if (ext != " " && !ext.empty()) p += "." + ext;
    return srcpath::to_slash_lower(p);
}

} // namespace

Directory read(std::istream& r) {
    Directory dir;

    auto sig = binutil::read_u32(r);
    if (sig != kSignature)
        throw std::runtime_error(std::format("vpk: bad signature 0x{:08x}", sig));

    dir.version = binutil::read_u32(r);
    if (dir.version != 1 && dir.version != 2)
        throw std::runtime_error(std::format("vpk: unsupported version {}", dir.version));
    dir.tree_size = binutil::read_u32(r);
    if (dir.version == 2) {
        // file data, archive md5, other md5 and signature section sizes
        binutil::skip(r, 16);
    }

    for (;;) {
        auto ext = binutil::read_asciiz(r);
        if (ext.empty()) break;
        for (;;) {
            auto path = binutil::read_asciiz(r);
            if (path.empty()) break;
            for (;;) {
                auto name = binutil::read_asciiz(r);
                if (name.empty()) break;

                Entry e;
                e.crc = binutil::read_u32(r);
                e.preload_size = binutil::read_u16(r);
                e.archive_index = binutil::read_u16(r);
                e.offset = binutil::read_u32(r);
                e.length = binutil::read_u32(r);
                auto term = binutil::read_u16(r);
                if (term != kEntryTerminator)
                    throw std::runtime_error(
                        std::format("vpk: bad entry terminator 0x{:04x} for {}/{}.{}", term, path, name, ext));
                binutil::skip(r, e.preload_size);

                dir.entries.insert_or_assign(join_tree_path(path, name, ext), e);
            }
        }
    }

    return dir;
}

Directory read(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw std::runtime_error(std::format("vpk: cannot open {}", path.string()));
    return read(f);
}

const Entry* find(const Directory& dir, const std::string& path) {
    auto it = dir.entries.find(srcpath::to_slash_lower(path));
    if (it == dir.entries.end()) return nullptr;
    return &it->second;
}

std::filesystem::path dir_file_path(const std::filesystem::path& vpk) {
    auto stem = vpk.stem().string();
    if (stem.ends_with("_dir")) return vpk;
    auto out = vpk;
    out.replace_filename(stem + "_dir.vpk");
    return out;
}

} // namespace srctools::vpk

#include "srctools/vpk.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace srctools::vpk;

namespace {

// Builds a version 2 VPK directory with three files:
//   materials/metal/crate.vmt  (archive 0, 4 preload bytes)
//   materials/metal/crate.vtf  (archive 0)
//   readme.txt                 (stored in the dir file, path " ")
std::string build_test_vpk(uint16_t terminator = 0xffff) {
    std::ostringstream tree;
    auto write_asciiz = [&](const std::string& s) {
        tree.write(s.data(), static_cast<std::streamsize>(s.size()));
        tree.put('\0');
    };
    auto write_u16 = [&](uint16_t v) { tree.write(reinterpret_cast<const char*>(&v), 2); };
    auto write_u32 = [&](uint32_t v) { tree.write(reinterpret_cast<const char*>(&v), 4); };
    auto write_entry = [&](uint16_t preload, uint16_t archive, uint32_t offset, uint32_t length) {
        write_u32(0xdeadbeef);
        write_u16(preload);
        write_u16(archive);
        write_u32(offset);
        write_u32(length);
        write_u16(terminator);
        for (uint16_t i = 0; i < preload; ++i) tree.put('p');
    };

    write_asciiz("vmt");
    write_asciiz("materials/METAL");
    write_asciiz("crate");
    write_entry(4, 0, 0, 120);
    write_asciiz("");
    write_asciiz("");

    write_asciiz("vtf");
    write_asciiz("materials/metal");
    write_asciiz("crate");
    write_entry(0, 0, 120, 4096);
    write_asciiz("");
    write_asciiz("");

    write_asciiz("txt");
    write_asciiz(" ");
    write_asciiz("readme");
    write_entry(0, kDirArchive, 0, 10);
    write_asciiz("");
    write_asciiz("");

    write_asciiz("");

    auto tree_bytes = tree.str();
    std::ostringstream out;
    auto put_u32 = [&](uint32_t v) { out.write(reinterpret_cast<const char*>(&v), 4); };
    put_u32(0x55aa1234);
    put_u32(2);
    put_u32(static_cast<uint32_t>(tree_bytes.size()));
    for (int i = 0; i < 4; ++i) put_u32(0);
    out << tree_bytes;
    return out.str();
}

} // namespace

TEST(VpkTest, ReadsDirectoryTree) {
    std::istringstream in(build_test_vpk());
    auto dir = read(in);

    EXPECT_EQ(dir.version, 2u);
    EXPECT_EQ(dir.entries.size(), 3u);

    auto* vtf = find(dir, "materials/metal/crate.vtf");
    ASSERT_NE(vtf, nullptr);
    EXPECT_EQ(vtf->offset, 120u);
    EXPECT_EQ(vtf->length, 4096u);

    auto* vmt = find(dir, "Materials\\Metal\\Crate.VMT");
    ASSERT_NE(vmt, nullptr);
    EXPECT_EQ(vmt->preload_size, 4);

    auto* readme = find(dir, "readme.txt");
    ASSERT_NE(readme, nullptr);
    EXPECT_EQ(readme->archive_index, kDirArchive);

    EXPECT_EQ(find(dir, "materials/metal/missing.vtf"), nullptr);
}

TEST(VpkTest, RejectsBadInput) {
    std::istringstream bad_sig(std::string("\x00\x00\x00\x00\x01\x00\x00\x00", 8));
    EXPECT_THROW(read(bad_sig), std::runtime_error);

    std::istringstream bad_term(build_test_vpk(0x1234));
    EXPECT_THROW(read(bad_term), std::runtime_error);

    auto truncated = build_test_vpk();
    truncated.resize(truncated.size() - 10);
    std::istringstream trunc(truncated);
    EXPECT_THROW(read(trunc), std::runtime_error);
}

TEST(VpkTest, DirFilePath) {
    EXPECT_EQ(dir_file_path("garrysmod/garrysmod.vpk"), std::filesystem::path("garrysmod/garrysmod_dir.vpk"));
    EXPECT_EQ(dir_file_path("hl2/hl2_textures_dir.vpk"), std::filesystem::path("hl2/hl2_textures_dir.vpk"));
}

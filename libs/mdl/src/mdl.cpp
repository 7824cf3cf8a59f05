#include "srctools/mdl.h"
#include "srctools/binutil.h"
#include "srctools/srcpath.h"

#include <format>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

namespace srctools::mdl {

namespace {

constexpr uint32_t kStudioMagic = 0x54534449; // "IDST"

// studiohdr_t field offsets.
constexpr size_t kOffVersion = 4;
constexpr size_t kOffChecksum = 8;
constexpr size_t kOffName = 12;
constexpr size_t kNameSize = 64;
constexpr size_t kOffLength = 76;
constexpr size_t kOffFlags = 152;
constexpr size_t kOffNumTextures = 204;
constexpr size_t kOffTextureIndex = 208;
constexpr size_t kOffNumCdTextures = 212;
constexpr size_t kOffCdTextureIndex = 216;
constexpr size_t kOffNumSkinRef = 220;
constexpr size_t kOffNumSkinFamilies = 224;
constexpr size_t kOffSkinIndex = 228;
constexpr size_t kOffSurfacePropIndex = 308;
constexpr size_t kOffMass = 328;
constexpr size_t kOffNumIncludeModels = 336;
constexpr size_t kOffIncludeModelIndex = 340;
constexpr size_t kHeaderSize = 408;

constexpr size_t kTextureStructSize = 64;   // mstudiotexture_t
constexpr size_t kModelGroupStructSize = 8; // mstudiomodelgroup_t

constexpr int32_t kMaxTableCount = 1 << 16;

int32_t read_count(std::string_view data, size_t offset, const char* what) {
    auto n = binutil::read_i32_at(data, offset);
    if (n < 0 || n > kMaxTableCount)
        throw std::runtime_error(std::format("mdl: invalid {} count {}", what, n));
    return n;
}

size_t read_index(std::string_view data, size_t offset, const char* what) {
    auto idx = binutil::read_i32_at(data, offset);
    if (idx < 0 || static_cast<size_t>(idx) > data.size())
        throw std::runtime_error(std::format("mdl: {} offset {} out of range", what, idx));
    return static_cast<size_t>(idx);
}

std::string fixed_string(std::string_view data, size_t offset, size_t size) {
    auto field = data.substr(offset, size);
    auto end = field.find('\0');
    return std::string(field.substr(0, end));
}

std::string join_material_dir(const std::string& dir, const std::string& name) {
    auto d = srcpath::to_slash(dir);
    if (!d.empty() && d.back() != '/') d += '/';
    return d + srcpath::to_slash(name);
}

} // namespace

Model read_bytes(std::string_view data) {
    if (data.size() < kHeaderSize)
        throw std::runtime_error(
            std::format("mdl: file too small ({} bytes) for a studio header", data.size()));

    if (binutil::read_at<uint32_t>(data, 0) != kStudioMagic)
        throw std::runtime_error("mdl: not a studio model (missing IDST signature)");

    Model m;
    m.version = binutil::read_i32_at(data, kOffVersion);
    if (m.version < 44 || m.version > 49)
        throw std::runtime_error(std::format("mdl: unsupported version {}", m.version));

    m.checksum = binutil::read_i32_at(data, kOffChecksum);
    m.name = fixed_string(data, kOffName, kNameSize);
    m.length = binutil::read_i32_at(data, kOffLength);
    if (m.length < static_cast<int32_t>(kHeaderSize) || static_cast<size_t>(m.length) > data.size())
        throw std::runtime_error(
            std::format("mdl: header length {} does not match file size {}", m.length, data.size()));
    data = data.substr(0, static_cast<size_t>(m.length));

    m.flags = binutil::read_i32_at(data, kOffFlags);
    m.mass = binutil::read_at<float>(data, kOffMass);

    // Texture table: names are relative to each mstudiotexture_t.
    auto num_textures = read_count(data, kOffNumTextures, "texture");
    auto texture_index = read_index(data, kOffTextureIndex, "texture table");
    m.textures.reserve(static_cast<size_t>(num_textures));
    for (int32_t i = 0; i < num_textures; ++i) {
        size_t base = texture_index + static_cast<size_t>(i) * kTextureStructSize;
        auto rel = binutil::read_i32_at(data, base);
        m.textures.push_back(binutil::read_asciiz_at(data, base + static_cast<size_t>(rel)));
    }

    // cdmaterials: an array of absolute string offsets.
    auto num_cd = read_count(data, kOffNumCdTextures, "cdmaterials");
    auto cd_index = read_index(data, kOffCdTextureIndex, "cdmaterials table");
    for (int32_t i = 0; i < num_cd; ++i) {
        auto off = read_index(data, cd_index + static_cast<size_t>(i) * 4, "cdmaterials string");
        m.cdmaterials.push_back(binutil::read_asciiz_at(data, off));
    }

    auto num_skin_ref = read_count(data, kOffNumSkinRef, "skin reference");
    auto num_families = read_count(data, kOffNumSkinFamilies, "skin family");
    auto skin_index = read_index(data, kOffSkinIndex, "skin table");
    m.skin_families.resize(static_cast<size_t>(num_families));
    for (int32_t f = 0; f < num_families; ++f) {
        auto& family = m.skin_families[static_cast<size_t>(f)];
        family.reserve(static_cast<size_t>(num_skin_ref));
        for (int32_t s = 0; s < num_skin_ref; ++s) {
            size_t off = skin_index + (static_cast<size_t>(f) * static_cast<size_t>(num_skin_ref) +
                                       static_cast<size_t>(s)) * 2;
            family.push_back(binutil::read_i16_at(data, off));
        }
    }

    auto surface_prop = binutil::read_i32_at(data, kOffSurfacePropIndex);
    if (surface_prop > 0)
        m.surface_prop = binutil::read_asciiz_at(data, static_cast<size_t>(surface_prop));

    auto num_includes = read_count(data, kOffNumIncludeModels, "include model");
    auto include_index = read_index(data, kOffIncludeModelIndex, "include model table");
    for (int32_t i = 0; i < num_includes; ++i) {
        size_t base = include_index + static_cast<size_t>(i) * kModelGroupStructSize;
        auto rel = binutil::read_i32_at(data, base + 4);
        auto name = binutil::read_asciiz_at(data, base + static_cast<size_t>(rel));
        if (!name.empty()) m.include_models.push_back(std::move(name));
    }

    return m;
}

Model read(std::istream& r) {
    std::string data{std::istreambuf_iterator<char>(r), std::istreambuf_iterator<char>()};
    if (r.bad()) throw std::runtime_error("mdl: failed to read stream");
    return read_bytes(data);
}

Model read(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw std::runtime_error(std::format("mdl: cannot open {}", path.string()));
    return read(f);
}

std::vector<MaterialRef> material_references(const Model& model) {
    std::set<size_t> used;
    if (model.skin_families.empty()) {
        for (size_t i = 0; i < model.textures.size(); ++i) used.insert(i);
    } else {
        for (const auto& family : model.skin_families) {
            for (auto idx : family) {
                if (idx >= 0 && static_cast<size_t>(idx) < model.textures.size())
                    used.insert(static_cast<size_t>(idx));
            }
        }
    }

    std::vector<MaterialRef> out;
    out.reserve(used.size());
    for (auto idx : used) {
        MaterialRef ref;
        ref.name = model.textures[idx];
        if (model.cdmaterials.empty()) {
            ref.candidates.push_back(srcpath::make_material_path(ref.name));
        } else {
            for (const auto& dir : model.cdmaterials)
                ref.candidates.push_back(srcpath::make_material_path(join_material_dir(dir, ref.name)));
        }
        out.push_back(std::move(ref));
    }
    return out;
}

} // namespace srctools::mdl

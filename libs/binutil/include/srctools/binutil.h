#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace srctools::binutil {

// Source engine formats are little-endian. Fail at compile time otherwise.
static_assert(std::endian::native == std::endian::little,
              "srctools requires a little-endian platform");

// --- Stream read helpers (throw on failure) ---

inline uint16_t read_u16(std::istream& r) {
    uint16_t v;
    if (!r.read(reinterpret_cast<char*>(&v), 2))
        throw std::runtime_error("binutil: failed to read u16");
    return v;
}

inline uint32_t read_u32(std::istream& r) {
    uint32_t v;
    if (!r.read(reinterpret_cast<char*>(&v), 4))
        throw std::runtime_error("binutil: failed to read u32");
    return v;
}

inline std::string read_asciiz(std::istream& r) {
    std::string s;
    char c;
    while (r.read(&c, 1)) {
        if (c == '\0') return s;
        s += c;
    }
    throw std::runtime_error("binutil: unexpected end of stream reading asciiz");
}

inline void skip(std::istream& r, size_t n) {
    if (n == 0) return;
    if (!r.seekg(static_cast<std::streamoff>(n), std::ios::cur))
        throw std::runtime_error("binutil: failed to skip bytes");
}

// --- Offset helpers over an in-memory buffer (throw when out of range) ---
// MDL headers address their tables by absolute or struct-relative offsets, so
// the whole file is read once and indexed rather than streamed.

template <typename T>
T read_at(std::string_view data, size_t offset) {
    if (offset > data.size() || data.size() - offset < sizeof(T))
        throw std::runtime_error(
            std::format("binutil: read of {} bytes at offset {} past end ({})",
                        sizeof(T), offset, data.size()));
    T v;
    std::memcpy(&v, data.data() + offset, sizeof(T));
    return v;
}

inline int32_t read_i32_at(std::string_view data, size_t offset) {
    return read_at<int32_t>(data, offset);
}

inline int16_t read_i16_at(std::string_view data, size_t offset) {
    return read_at<int16_t>(data, offset);
}

inline std::string read_asciiz_at(std::string_view data, size_t offset) {
    if (offset >= data.size())
        throw std::runtime_error(
            std::format("binutil: string offset {} past end ({})", offset, data.size()));
    auto end = data.find('\0', offset);
    if (end == std::string_view::npos)
        throw std::runtime_error(
            std::format("binutil: unterminated string at offset {}", offset));
    return std::string(data.substr(offset, end - offset));
}

} // namespace srctools::binutil

#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace srctools::keyvalues {

struct Block;

struct BlockOwned {
    std::unique_ptr<Block> block;
};

using Value = std::variant<std::string, BlockOwned>;

// Pair is one `key value` or `key { ... }` entry. Keys keep their original
// case; lookups are case-insensitive. condition holds a trailing platform
// conditional such as "[$X360]" when present.
struct Pair {
    std::string key;
    Value value;
    std::string condition;
};

struct Block {
    std::vector<Pair> pairs;
};

// Document is the implicit top-level block of a KeyValues file. VMT and
// gameinfo files have one root pair, VMF files have many.
struct Document {
    Block root;
};

// parse_text parses KeyValues text (VMT, VMF, gameinfo.txt, VDF, ACF).
Document parse_text(std::istream& r);

// parse_bytes parses KeyValues text from an in-memory buffer.
Document parse_bytes(std::string_view data);

// parse reads and parses a KeyValues file from disk.
Document parse(const std::filesystem::path& path);

// condition_applies evaluates a platform conditional for a desktop build:
// $WIN32, $WINDOWS, $LINUX, $POSIX are true, console and $OSX terms false,
// unknown terms true. "!" negates.
bool condition_applies(std::string_view condition);

// --- Lookup helpers (case-insensitive, first match wins) ---

const Pair* find(const Block& block, std::string_view key);
const std::string* as_string(const Pair& pair);
const Block* as_block(const Pair& pair);
std::string get_string(const Block& block, std::string_view key);
const Block* get_block(const Block& block, std::string_view key);

// iequals compares two keys ignoring ASCII case.
bool iequals(std::string_view a, std::string_view b);

} // namespace srctools::keyvalues

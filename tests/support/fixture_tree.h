#pragma once

// Temporary directory trees for tests. Each tree is removed on destruction.

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

namespace srctools::testing {

class FixtureTree {
public:
    explicit FixtureTree(const std::string& name) {
        std::random_device rd;
        root_ = std::filesystem::temp_directory_path() /
                ("srctools_" + name + "_" + std::to_string(rd()));
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        std::filesystem::create_directories(root_);
    }

    ~FixtureTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    FixtureTree(const FixtureTree&) = delete;
    FixtureTree& operator=(const FixtureTree&) = delete;

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path path(const std::string& rel) const { return root_ / rel; }

    std::filesystem::path write(const std::string& rel, const std::string& content) const {
        auto p = root_ / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }

    std::filesystem::path mkdir(const std::string& rel) const {
        auto p = root_ / rel;
        std::filesystem::create_directories(p);
        return p;
    }

    static std::string read(const std::filesystem::path& p) {
        std::ifstream f(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    }

private:
    std::filesystem::path root_;
};

} // namespace srctools::testing

//! # Test Fixtures
//!
//! Temporary source trees for tests that touch the filesystem.

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace strata::testing {

namespace fs = std::filesystem;

/// A directory under the system temp dir, removed on destruction.
class TempTree {
public:
    explicit TempTree(const std::string& tag = "tree") {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("strata_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    /// Writes `content` to `rel`, creating parent directories.
    void write(const std::string& rel, const std::string& content) const {
        auto path = root_ / rel;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    const fs::path& root() const {
        return root_;
    }

private:
    fs::path root_;
};

} // namespace strata::testing

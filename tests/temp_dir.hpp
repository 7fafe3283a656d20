#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace sshcopy::testing {

// RAII temp directory
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() / ("sshcopy_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write_file(const std::string& rel, const std::string& content = "x") {
        std::filesystem::path full = path / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }

    // Root with '/' separators, the form the copy engine works with.
    std::string root() const { return path.generic_string(); }
};

} // namespace sshcopy::testing

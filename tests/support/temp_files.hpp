#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace tus::testing {

namespace fs = std::filesystem;

inline fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = static_cast<uint64_t>(timestamp) ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("tus_client_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

/// Deterministic payload so uploaded bytes can be compared position by position.
inline std::string make_payload(std::size_t size) {
    std::string payload(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<char>('a' + (i % 26));
    }
    return payload;
}

/// Fixture owning a scratch directory removed after each test.
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }
    }

    fs::path make_file(const std::string& name, const std::string& content) {
        const fs::path path = root_ / name;
        write_file(path, content);
        return path;
    }

    fs::path root_;
};

} // namespace tus::testing

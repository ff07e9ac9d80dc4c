/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for file-sanitizer tests
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "models/WipeTypes.hpp"
#include "util/SecureRandom.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief RAII temporary directory, removed recursively on destruction
 */
class TempDir {
public:
    TempDir() {
        auto pattern =
            (std::filesystem::temp_directory_path() / "file-sanitizer-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    auto operator/(const std::string& name) const -> std::filesystem::path { return path_ / name; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Helpers for creating and inspecting test files
 */
struct TestFiles {
    static void write(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }

    static void write_pattern(const std::filesystem::path& path, size_t size, uint8_t value) {
        write(path, std::vector<uint8_t>(size, value));
    }

    static void write_random(const std::filesystem::path& path, size_t size) {
        std::vector<uint8_t> data(size);
        if (!util::SecureRandom::fill(data)) {
            throw std::runtime_error("random fill failed");
        }
        write(path, data);
    }

    static void write_text(const std::filesystem::path& path, const std::string& text) {
        write(path, std::vector<uint8_t>(text.begin(), text.end()));
    }

    static auto read(const std::filesystem::path& path) -> std::vector<uint8_t> {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static auto all_equal(const std::vector<uint8_t>& data, uint8_t value) -> bool {
        return std::all_of(data.begin(), data.end(), [value](uint8_t b) { return b == value; });
    }
};

/**
 * @brief Holds an exclusive flock on a file for the lifetime of the object
 */
class HeldLock {
public:
    explicit HeldLock(const std::filesystem::path& path)
        : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
        if (fd_ < 0 || ::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            throw std::runtime_error("could not lock " + path.string());
        }
    }

    ~HeldLock() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    HeldLock(const HeldLock&) = delete;
    HeldLock& operator=(const HeldLock&) = delete;

private:
    int fd_;
};

/**
 * @brief Fixture with a scratch directory and thread-safe progress capture
 */
class SanitizerTestFixture : public ::testing::Test {
protected:
    TempDir temp_dir;
    std::vector<ProgressEvent> captured_progress;
    std::mutex progress_mutex;

    ProgressCallback CreateCapturingCallback() {
        return [this](const ProgressEvent& event) {
            std::lock_guard lock(progress_mutex);
            captured_progress.push_back(event);
        };
    }
};

/**
 * @file temp_resource.cpp
 * @brief Scoped temporary files and directories
 *
 * @date 2025
 */

#include "codesmarty/utils/temp_resource.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

#ifdef _WIN32
#include <process.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

namespace codesmarty {
namespace utils {

namespace {

void WriteContents(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot create temporary file: " + path.string());
    }
    out << contents;
    out.close();
    if (!out) {
        throw std::runtime_error("Cannot write temporary file: " + path.string());
    }
}

} // anonymous namespace

std::string UniqueName(const std::string& prefix) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now().time_since_epoch()).count();

    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream oss;
    oss << prefix << getpid() << "_" << ns << "_" << std::hex << dist(gen);
    return oss.str();
}

// ============================================================================
// TempDirectory
// ============================================================================

TempDirectory::TempDirectory(const std::string& prefix)
    : path_(std::filesystem::temp_directory_path() / UniqueName(prefix)) {
    std::filesystem::create_directories(path_);
    spdlog::debug("Created temp directory {}", path_.string());
}

TempDirectory::~TempDirectory() {
    Remove();
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

std::filesystem::path TempDirectory::WriteFile(const std::string& name,
                                               const std::string& contents) const {
    auto file_path = path_ / name;
    WriteContents(file_path, contents);
    return file_path;
}

void TempDirectory::Remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp directory {}: {}", path_.string(), ec.message());
    } else {
        spdlog::debug("Removed temp directory {}", path_.string());
    }
    path_.clear();
}

// ============================================================================
// TempFile
// ============================================================================

TempFile::TempFile(const std::string& contents, const std::string& suffix)
    : path_(std::filesystem::temp_directory_path() / (UniqueName("codesmarty_") + suffix)) {
    WriteContents(path_, contents);
}

TempFile::~TempFile() {
    Remove();
}

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempFile::Remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::warn("Failed to remove temp file {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

} // namespace utils
} // namespace codesmarty

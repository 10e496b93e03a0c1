/**
 * FileSystem.cpp
 *
 * std::filesystem backed file system access.
 */

#include "FileSystem.hpp"

#include <system_error>

namespace ftpget::utils {

bool LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFileSystem::isDirectory(const fs::path& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

void LocalFileSystem::createDirectories(const fs::path& path) {
    fs::create_directories(path);
}

std::unique_ptr<std::ofstream> LocalFileSystem::openForWrite(const fs::path& path, bool binary) {
    auto mode = std::ios::out | std::ios::trunc;
    if (binary) mode |= std::ios::binary;

    auto file = std::make_unique<std::ofstream>(path, mode);
    if (!file->is_open()) {
        throw fs::filesystem_error("cannot open file for writing", path,
                                   std::make_error_code(std::errc::io_error));
    }
    file->exceptions(std::ios::badbit | std::ios::failbit);
    return file;
}

bool LocalFileSystem::remove(const fs::path& path) noexcept {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::shared_ptr<FileSystem> LocalFileSystem::instance() {
    static std::shared_ptr<FileSystem> inst = std::make_shared<LocalFileSystem>();
    return inst;
}

} // namespace ftpget::utils

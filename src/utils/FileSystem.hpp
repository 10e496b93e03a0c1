// ftpget - File System Access
// Local file system operations needed by a transfer

#pragma once

#include <filesystem>
#include <fstream>
#include <memory>

namespace ftpget::utils {

namespace fs = std::filesystem;

/**
 * @brief File system operations used by a transfer's worker
 *
 * Failures are reported by throwing std::filesystem::filesystem_error
 * (or std::ios_base::failure for streams), except remove() which
 * reports through its return value.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const fs::path& path) const = 0;
    virtual bool isDirectory(const fs::path& path) const = 0;

    /**
     * Create path and every missing parent
     */
    virtual void createDirectories(const fs::path& path) = 0;

    /**
     * Open (create or truncate) a file for writing. The caller closes it
     * and checks the stream state to see whether the last bytes reached
     * the disk.
     * @param binary false enables platform newline translation
     */
    virtual std::unique_ptr<std::ofstream> openForWrite(const fs::path& path, bool binary) = 0;

    /**
     * Delete a file
     * @return true if a file was removed
     */
    virtual bool remove(const fs::path& path) noexcept = 0;
};

/**
 * @brief FileSystem backed by std::filesystem and std::ofstream
 */
class LocalFileSystem : public FileSystem {
public:
    bool exists(const fs::path& path) const override;
    bool isDirectory(const fs::path& path) const override;
    void createDirectories(const fs::path& path) override;
    std::unique_ptr<std::ofstream> openForWrite(const fs::path& path, bool binary) override;
    bool remove(const fs::path& path) noexcept override;

    /**
     * Shared process-wide instance
     */
    static std::shared_ptr<FileSystem> instance();
};

} // namespace ftpget::utils

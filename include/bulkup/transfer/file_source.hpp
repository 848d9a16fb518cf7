#pragma once

#include "bulkup/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bulkup::transfer {

/**
 * @brief Random-access byte source for one file being uploaded
 *
 * Implementations must allow read() from any thread; the uploader reads
 * chunks sequentially but archive sources delegate to wrapped sources.
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual std::uint64_t size() const = 0;

    /**
     * @brief Read up to length bytes starting at offset
     *
     * Returns fewer bytes only when the range runs past the end.
     */
    virtual Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) = 0;
};

/**
 * @brief File on local disk, read with a single std::ifstream
 */
class DiskFileSource : public FileSource {
public:
    static Result<std::unique_ptr<DiskFileSource>> open(const std::filesystem::path& path);
    static Result<std::unique_ptr<DiskFileSource>> open(const std::filesystem::path& path, std::string name);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::uint64_t size() const override { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) override;

private:
    DiskFileSource(std::filesystem::path path, std::string name, std::uint64_t size);

    std::filesystem::path path_;
    std::string name_;
    std::uint64_t size_ = 0;
    std::mutex mutex_;
    std::ifstream stream_;
};

/**
 * @brief In-memory buffer exposed as a file
 */
class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string name, std::vector<std::uint8_t> data);

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::uint64_t size() const override { return data_.size(); }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) override;

private:
    std::string name_;
    std::vector<std::uint8_t> data_;
};

} // namespace bulkup::transfer

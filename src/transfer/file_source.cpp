#include "bulkup/transfer/file_source.hpp"

#include <algorithm>
#include <system_error>

namespace bulkup::transfer {
namespace fs = std::filesystem;

namespace {

std::uint64_t clamp_length(std::uint64_t size, std::uint64_t offset, std::uint64_t length) {
    if (offset >= size) {
        return 0;
    }
    return std::min(length, size - offset);
}

} // namespace

Result<std::unique_ptr<DiskFileSource>> DiskFileSource::open(const fs::path& path) {
    return open(path, path.filename().string());
}

Result<std::unique_ptr<DiskFileSource>> DiskFileSource::open(const fs::path& path, std::string name) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Fail<std::unique_ptr<DiskFileSource>>(ErrorCode::Io, "Not a regular file: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Fail<std::unique_ptr<DiskFileSource>>(ErrorCode::Io, "Failed to stat " + path.string() + ": " + ec.message());
    }

    std::unique_ptr<DiskFileSource> source(new DiskFileSource(path, std::move(name), size));
    if (!source->stream_) {
        return Fail<std::unique_ptr<DiskFileSource>>(ErrorCode::Io, "Failed to open source file: " + path.string());
    }
    return Ok(std::move(source));
}

DiskFileSource::DiskFileSource(fs::path path, std::string name, std::uint64_t size)
    : path_(std::move(path)),
      name_(std::move(name)),
      size_(size),
      stream_(path_, std::ios::binary) {}

Result<std::vector<std::uint8_t>> DiskFileSource::read(std::uint64_t offset, std::uint64_t length) {
    const auto count = clamp_length(size_, offset, length);
    std::vector<std::uint8_t> buffer(count);
    if (count == 0) {
        return Ok(std::move(buffer));
    }

    std::lock_guard lock(mutex_);
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset));
    stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (static_cast<std::uint64_t>(stream_.gcount()) != count) {
        return Fail<std::vector<std::uint8_t>>(ErrorCode::Io,
            "Short read from " + path_.string() + " at offset " + std::to_string(offset));
    }
    return Ok(std::move(buffer));
}

MemoryFileSource::MemoryFileSource(std::string name, std::vector<std::uint8_t> data)
    : name_(std::move(name)), data_(std::move(data)) {}

Result<std::vector<std::uint8_t>> MemoryFileSource::read(std::uint64_t offset, std::uint64_t length) {
    const auto count = clamp_length(data_.size(), offset, length);
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(count == 0 ? 0 : offset);
    return Ok(std::vector<std::uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(count)));
}

} // namespace bulkup::transfer

#include "bulkup/archive/archive_source.hpp"

#include <algorithm>
#include <chrono>

namespace bulkup::archive {

Result<std::unique_ptr<ArchiveFileSource>> ArchiveFileSource::create(std::shared_ptr<transfer::FileSource> inner,
                                                                     ArchiveEntry entry) {
    if (!inner) {
        return Fail<std::unique_ptr<ArchiveFileSource>>(ErrorCode::Validation, "No file provided");
    }
    if (entry.name.empty()) {
        entry.name = inner->name();
    }
    if (entry.mtime == 0) {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        entry.mtime = static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    auto header = TarEncoder::build_header(entry, inner->size());
    if (header.is_error()) {
        return Err<std::unique_ptr<ArchiveFileSource>>(header.error());
    }
    std::unique_ptr<ArchiveFileSource> source(
        new ArchiveFileSource(std::move(inner), std::move(entry), header.value()));
    return Ok(std::move(source));
}

ArchiveFileSource::ArchiveFileSource(std::shared_ptr<transfer::FileSource> inner,
                                     ArchiveEntry entry,
                                     HeaderBlock header)
    : inner_(std::move(inner)),
      entry_(std::move(entry)),
      header_(header),
      name_(inner_->name() + ".tar") {}

std::uint64_t ArchiveFileSource::size() const {
    return TarEncoder::archive_size(inner_->size());
}

Result<std::vector<std::uint8_t>> ArchiveFileSource::read(std::uint64_t offset, std::uint64_t length) {
    const std::uint64_t total = size();
    if (offset >= total) {
        return Ok(std::vector<std::uint8_t>{});
    }
    const std::uint64_t end = offset + std::min(length, total - offset);

    // Everything outside header and data is zero: padding and trailer.
    std::vector<std::uint8_t> out(end - offset, 0);

    if (offset < kBlockSize) {
        const auto header_end = std::min<std::uint64_t>(end, kBlockSize);
        std::copy(header_.begin() + static_cast<std::ptrdiff_t>(offset),
                  header_.begin() + static_cast<std::ptrdiff_t>(header_end),
                  out.begin());
    }

    const std::uint64_t data_begin = kBlockSize;
    const std::uint64_t data_end = kBlockSize + inner_->size();
    const std::uint64_t overlap_begin = std::max(offset, data_begin);
    const std::uint64_t overlap_end = std::min(end, data_end);
    if (overlap_begin < overlap_end) {
        auto data = inner_->read(overlap_begin - data_begin, overlap_end - overlap_begin);
        if (data.is_error()) {
            return data;
        }
        if (data.value().size() != overlap_end - overlap_begin) {
            return Fail<std::vector<std::uint8_t>>(ErrorCode::Io, "Short read from " + inner_->name());
        }
        std::copy(data.value().begin(), data.value().end(),
                  out.begin() + static_cast<std::ptrdiff_t>(overlap_begin - offset));
    }

    return Ok(std::move(out));
}

} // namespace bulkup::archive

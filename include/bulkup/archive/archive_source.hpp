#pragma once

#include "bulkup/archive/tar_encoder.hpp"
#include "bulkup/transfer/file_source.hpp"

#include <memory>
#include <string>

namespace bulkup::archive {

/**
 * @brief Presents another file as a single-entry tar stream
 *
 * Bytes are produced on demand from the wrapped source, so a large file can be
 * chunk-uploaded as an archive without holding it in memory. The stream is
 * byte-identical to TarEncoder::encode() over the same data.
 */
class ArchiveFileSource : public transfer::FileSource {
public:
    /**
     * @brief Wrap `inner`; the entry name defaults to the inner file's name
     *
     * An mtime of 0 is replaced by the current time.
     * The archive itself is named "<inner name>.tar".
     */
    static Result<std::unique_ptr<ArchiveFileSource>> create(std::shared_ptr<transfer::FileSource> inner,
                                                             ArchiveEntry entry = {});

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] std::uint64_t size() const override;
    [[nodiscard]] const ArchiveEntry& entry() const noexcept { return entry_; }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) override;

private:
    ArchiveFileSource(std::shared_ptr<transfer::FileSource> inner, ArchiveEntry entry, HeaderBlock header);

    std::shared_ptr<transfer::FileSource> inner_;
    ArchiveEntry entry_;
    HeaderBlock header_;
    std::string name_;
};

} // namespace bulkup::archive

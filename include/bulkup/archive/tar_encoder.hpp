#pragma once

/**
 * @file tar_encoder.hpp
 * @brief Single-file tar container encoder
 *
 * WHY THIS FILE EXISTS:
 * Some receivers only accept an archive-shaped payload and unpack it with a
 * standard tar implementation. The bytes produced here must be accepted by
 * that unpacker as-is.
 *
 * LAYOUT:
 * [512-byte header][file bytes][NUL padding to 512][two 512-byte zero blocks]
 *
 * HEADER FIELDS (offset, length):
 * name (0, 100) mode (100, 8) uid (108, 8) gid (116, 8) size (124, 12)
 * mtime (136, 12) checksum (148, 8) typeflag (156, 1) magic (257, 6)
 * version (263, 2). Numeric fields are zero-padded ASCII octal.
 *
 * EXAMPLE:
 * ArchiveEntry entry{"data.bin"};
 * auto stream = TarEncoder::encode(entry, bytes);
 */

#include "bulkup/core/result.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace bulkup::archive {

inline constexpr std::size_t kBlockSize = 512;
inline constexpr std::size_t kTrailerSize = 2 * kBlockSize;

using HeaderBlock = std::array<std::uint8_t, kBlockSize>;

/**
 * @brief Metadata written into the header for one regular file
 */
struct ArchiveEntry {
    std::string name;
    std::uint32_t mode = 0644;
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    std::uint64_t mtime = 0; ///< Seconds since the epoch; ArchiveFileSource stamps 0 with now
};

class TarEncoder {
public:
    /**
     * @brief Build the 512-byte header for a file of the given size
     *
     * Fails with ErrorCode::ArchiveEncoding when a value does not fit its
     * field (name over 100 bytes, size or mtime >= 8^11, mode/uid/gid >= 8^7).
     */
    static Result<HeaderBlock> build_header(const ArchiveEntry& entry, std::uint64_t size);

    /**
     * @brief Encode header, data, padding and trailer into one buffer
     */
    static Result<std::vector<std::uint8_t>> encode(const ArchiveEntry& entry,
                                                    const std::vector<std::uint8_t>& data);

    /**
     * @brief Unsigned byte sum of a header with the checksum field read as spaces
     */
    static std::uint32_t compute_checksum(const HeaderBlock& header);

    static constexpr std::uint64_t padding_for(std::uint64_t size) {
        return (kBlockSize - size % kBlockSize) % kBlockSize;
    }

    static constexpr std::uint64_t archive_size(std::uint64_t size) {
        return kBlockSize + size + padding_for(size) + kTrailerSize;
    }
};

} // namespace bulkup::archive

#include "bulkup/archive/tar_encoder.hpp"

#include <algorithm>
#include <cstring>

namespace bulkup::archive {
namespace {

constexpr std::size_t kNameOffset = 0;
constexpr std::size_t kNameLength = 100;
constexpr std::size_t kModeOffset = 100;
constexpr std::size_t kUidOffset = 108;
constexpr std::size_t kGidOffset = 116;
constexpr std::size_t kIdFieldLength = 8;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kMtimeOffset = 136;
constexpr std::size_t kNumberFieldLength = 12;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kChecksumLength = 8;
constexpr std::size_t kTypeflagOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kVersionOffset = 263;

constexpr char kRegularFile = '0';
constexpr char kMagic[] = "ustar ";
constexpr char kVersion[] = " ";

// Largest value representable with `digits` octal digits.
constexpr std::uint64_t octal_limit(std::size_t digits) {
    return digits >= 21 ? ~0ULL : (1ULL << (3 * digits)) - 1;
}

// Writes `value` as `digits` zero-padded octal digits at `offset`.
void write_octal(HeaderBlock& header, std::size_t offset, std::size_t digits, std::uint64_t value) {
    for (std::size_t i = 0; i < digits; ++i) {
        header[offset + digits - 1 - i] = static_cast<std::uint8_t>('0' + (value & 7));
        value >>= 3;
    }
}

Result<void> write_numeric(HeaderBlock& header,
                           std::size_t offset,
                           std::size_t field_length,
                           std::uint64_t value,
                           std::uint8_t terminator,
                           const char* field_name) {
    const std::size_t digits = field_length - 1;
    if (value > octal_limit(digits)) {
        return Fail(ErrorCode::ArchiveEncoding,
                    std::string("Value ") + std::to_string(value) + " overflows tar " + field_name + " field");
    }
    write_octal(header, offset, digits, value);
    header[offset + digits] = terminator;
    return Ok();
}

} // namespace

std::uint32_t TarEncoder::compute_checksum(const HeaderBlock& header) {
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const bool in_checksum = i >= kChecksumOffset && i < kChecksumOffset + kChecksumLength;
        sum += in_checksum ? static_cast<std::uint32_t>(' ') : header[i];
    }
    return sum;
}

Result<HeaderBlock> TarEncoder::build_header(const ArchiveEntry& entry, std::uint64_t size) {
    if (entry.name.empty()) {
        return Fail<HeaderBlock>(ErrorCode::ArchiveEncoding, "Archive entry name is empty");
    }
    if (entry.name.size() > kNameLength) {
        return Fail<HeaderBlock>(ErrorCode::ArchiveEncoding,
            "Archive entry name exceeds " + std::to_string(kNameLength) + " bytes: " + entry.name);
    }

    HeaderBlock header{};
    std::memcpy(header.data() + kNameOffset, entry.name.data(), entry.name.size());

    struct NumericField {
        std::size_t offset;
        std::size_t length;
        std::uint64_t value;
        std::uint8_t terminator;
        const char* name;
    };
    const NumericField fields[] = {
        {kModeOffset, kIdFieldLength, entry.mode, '\0', "mode"},
        {kUidOffset, kIdFieldLength, entry.uid, '\0', "uid"},
        {kGidOffset, kIdFieldLength, entry.gid, '\0', "gid"},
        {kSizeOffset, kNumberFieldLength, size, ' ', "size"},
        {kMtimeOffset, kNumberFieldLength, entry.mtime, ' ', "mtime"},
    };
    for (const auto& field : fields) {
        auto written = write_numeric(header, field.offset, field.length, field.value, field.terminator, field.name);
        if (written.is_error()) {
            return Err<HeaderBlock>(written.error());
        }
    }

    header[kTypeflagOffset] = static_cast<std::uint8_t>(kRegularFile);
    std::memcpy(header.data() + kMagicOffset, kMagic, sizeof(kMagic) - 1);
    std::memcpy(header.data() + kVersionOffset, kVersion, sizeof(kVersion) - 1);

    // Checksum: six octal digits, NUL, space.
    const std::uint32_t checksum = compute_checksum(header);
    write_octal(header, kChecksumOffset, 6, checksum);
    header[kChecksumOffset + 6] = '\0';
    header[kChecksumOffset + 7] = ' ';

    return Ok(header);
}

Result<std::vector<std::uint8_t>> TarEncoder::encode(const ArchiveEntry& entry,
                                                     const std::vector<std::uint8_t>& data) {
    auto header = build_header(entry, data.size());
    if (header.is_error()) {
        return Err<std::vector<std::uint8_t>>(header.error());
    }

    std::vector<std::uint8_t> stream;
    stream.reserve(archive_size(data.size()));
    stream.insert(stream.end(), header.value().begin(), header.value().end());
    stream.insert(stream.end(), data.begin(), data.end());
    stream.resize(archive_size(data.size()), 0);
    return Ok(std::move(stream));
}

} // namespace bulkup::archive

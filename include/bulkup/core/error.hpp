#pragma once

#include <string>

namespace bulkup {

/**
 * @brief Failure categories reported by the upload engine
 */
enum class ErrorCode {
    Validation,      ///< Bad input (no file, zero chunk size)
    Cancelled,       ///< Abort requested by the caller, not a failure
    ChunkTransfer,   ///< Sender rejected or threw for a chunk; file-fatal
    ArchiveEncoding, ///< Value does not fit a tar header field
    Io,              ///< Reading or writing local data failed
    Config           ///< Configuration could not be parsed
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation: return "validation";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::ChunkTransfer: return "chunk-transfer";
        case ErrorCode::ArchiveEncoding: return "archive-encoding";
        case ErrorCode::Io: return "io";
        case ErrorCode::Config: return "config";
    }
    return "unknown";
}

struct Error {
    ErrorCode code = ErrorCode::Validation;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool is_cancelled() const noexcept { return code == ErrorCode::Cancelled; }
};

} // namespace bulkup

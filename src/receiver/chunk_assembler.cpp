#include "bulkup/receiver/chunk_assembler.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace bulkup::receiver {
namespace fs = std::filesystem;

ChunkAssembler::ChunkAssembler(fs::path staging_root) : staging_root_(std::move(staging_root)) {}

Result<void> ChunkAssembler::accept(const transfer::ChunkEnvelope& envelope) {
    if (auto res = validate_name(envelope.file_name); res.is_error()) {
        return res;
    }
    if (envelope.chunk_index >= envelope.total_chunks) {
        return Fail(ErrorCode::Validation,
            "Chunk index " + std::to_string(envelope.chunk_index) + " out of range for " + envelope.file_name);
    }

    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = pending_.try_emplace(envelope.file_name);
        if (inserted) {
            it->second.file_size = envelope.file_size;
            it->second.total_chunks = envelope.total_chunks;
        } else if (it->second.file_size != envelope.file_size ||
                   it->second.total_chunks != envelope.total_chunks) {
            return Fail(ErrorCode::Validation,
                "Chunk of " + envelope.file_name + " disagrees with the upload in progress (" +
                std::to_string(envelope.file_size) + " bytes / " + std::to_string(envelope.total_chunks) +
                " chunks, expected " + std::to_string(it->second.file_size) + " / " +
                std::to_string(it->second.total_chunks) + ")");
        }
    }

    const auto dir = parts_dir(envelope.file_name);
    if (auto res = ensure_directory(dir); res.is_error()) {
        return res;
    }

    const auto path = chunk_path(dir, envelope.chunk_index);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Fail(ErrorCode::Io, "Failed to create chunk file: " + path.string());
    }
    out.write(reinterpret_cast<const char*>(envelope.data.data()), static_cast<std::streamsize>(envelope.data.size()));
    out.close();
    if (!out) {
        return Fail(ErrorCode::Io, "Failed to write chunk file: " + path.string());
    }

    std::lock_guard lock(mutex_);
    const auto it = pending_.find(envelope.file_name);
    if (it == pending_.end()) {
        // Discarded while the chunk was being written.
        return Fail(ErrorCode::Cancelled, "Upload of " + envelope.file_name + " was discarded");
    }
    it->second.received.insert(envelope.chunk_index);
    spdlog::trace("Stored chunk {}/{} of {}", envelope.chunk_index + 1, envelope.total_chunks, envelope.file_name);
    return Ok();
}

bool ChunkAssembler::is_complete(const std::string& file_name) const {
    std::lock_guard lock(mutex_);
    const auto it = pending_.find(file_name);
    return it != pending_.end() && it->second.received.size() == it->second.total_chunks;
}

std::size_t ChunkAssembler::received_chunks(const std::string& file_name) const {
    std::lock_guard lock(mutex_);
    const auto it = pending_.find(file_name);
    return it == pending_.end() ? 0 : it->second.received.size();
}

Result<fs::path> ChunkAssembler::assemble(const std::string& file_name, const fs::path& destination_dir) {
    if (auto res = validate_name(file_name); res.is_error()) {
        return Err<fs::path>(res.error());
    }

    PendingFile file;
    {
        std::lock_guard lock(mutex_);
        const auto it = pending_.find(file_name);
        if (it == pending_.end()) {
            return Fail<fs::path>(ErrorCode::Validation, "No chunks received for " + file_name);
        }
        file = it->second;
    }
    if (file.received.size() != file.total_chunks) {
        return Fail<fs::path>(ErrorCode::Validation,
            "Upload of " + file_name + " is incomplete: " + std::to_string(file.received.size()) + " of " +
            std::to_string(file.total_chunks) + " chunks");
    }

    const auto dir = parts_dir(file_name);
    const auto assembled_path = dir / "assembled";
    std::ofstream out(assembled_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Fail<fs::path>(ErrorCode::Io, "Failed to create " + assembled_path.string());
    }

    std::uint64_t written = 0;
    char buffer[64 * 1024];
    for (std::uint32_t index = 0; index < file.total_chunks; ++index) {
        const auto path = chunk_path(dir, index);
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Fail<fs::path>(ErrorCode::Io, "Missing chunk file: " + path.string());
        }
        while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
            out.write(buffer, in.gcount());
            written += static_cast<std::uint64_t>(in.gcount());
        }
    }
    out.close();
    if (!out) {
        return Fail<fs::path>(ErrorCode::Io, "Failed to write " + assembled_path.string());
    }

    if (written != file.file_size) {
        return Fail<fs::path>(ErrorCode::Validation,
            "Assembled size of " + file_name + " is " + std::to_string(written) + " bytes, expected " +
            std::to_string(file.file_size));
    }

    if (auto res = ensure_directory(destination_dir); res.is_error()) {
        return Err<fs::path>(res.error());
    }

    const auto destination = destination_dir / file_name;
    std::error_code ec;
    fs::rename(assembled_path, destination, ec);
    if (ec) {
        return Fail<fs::path>(ErrorCode::Io, "Failed to move assembled file to " + destination.string() + ": " +
                                                 ec.message());
    }

    discard(file_name);
    spdlog::debug("Assembled {} ({} bytes) at {}", file_name, written, destination.string());
    return Ok(destination);
}

void ChunkAssembler::discard(const std::string& file_name) {
    {
        std::lock_guard lock(mutex_);
        pending_.erase(file_name);
    }
    if (validate_name(file_name).is_error()) {
        return;
    }

    std::error_code ec;
    fs::remove_all(parts_dir(file_name), ec);
    if (ec) {
        spdlog::warn("Failed to remove staging data for {}: {}", file_name, ec.message());
    }
}

transfer::ChunkSender ChunkAssembler::sender() {
    return [this](const transfer::ChunkEnvelope& envelope) { return accept(envelope); };
}

fs::path ChunkAssembler::parts_dir(const std::string& file_name) const {
    return staging_root_ / (file_name + ".parts");
}

fs::path ChunkAssembler::chunk_path(const fs::path& parts_dir, std::uint32_t index) {
    return parts_dir / (std::to_string(index) + ".chunk");
}

Result<void> ChunkAssembler::ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::exists(dir)) {
        return Fail(ErrorCode::Io, "Failed to create directory: " + dir.string());
    }
    return Ok();
}

Result<void> ChunkAssembler::validate_name(const std::string& file_name) {
    const fs::path path(file_name);
    if (file_name.empty() || path.filename() != path || file_name == "." || file_name == "..") {
        return Fail(ErrorCode::Validation, "Invalid file name: '" + file_name + "'");
    }
    return Ok();
}

} // namespace bulkup::receiver

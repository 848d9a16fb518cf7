#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace bulkup::receiver {

/**
 * @brief Receiving end of the chunk contract, backed by a staging directory
 *
 * Each chunk is stored as <staging_root>/<file_name>.parts/<index>.chunk, so
 * chunks may arrive in any order and a re-delivered chunk simply replaces the
 * stored one. The first envelope of a file fixes its file_size and
 * total_chunks; later envelopes that disagree are rejected.
 *
 * accept() is safe to call from several sender threads at once.
 *
 * EXAMPLE:
 * ChunkAssembler assembler("/tmp/staging");
 * uploader.upload_file(file, assembler.sender(), options);
 * auto placed = assembler.assemble(file->name(), "/tmp/out");
 */
class ChunkAssembler {
public:
    explicit ChunkAssembler(std::filesystem::path staging_root);

    ChunkAssembler(const ChunkAssembler&) = delete;
    ChunkAssembler& operator=(const ChunkAssembler&) = delete;

    Result<void> accept(const transfer::ChunkEnvelope& envelope);

    [[nodiscard]] bool is_complete(const std::string& file_name) const;
    [[nodiscard]] std::size_t received_chunks(const std::string& file_name) const;

    /**
     * @brief Concatenate chunks by index into destination_dir/file_name
     *
     * Fails unless every chunk is present and the concatenated size equals
     * the announced file_size. Staging data is removed on success.
     */
    Result<std::filesystem::path> assemble(const std::string& file_name,
                                           const std::filesystem::path& destination_dir);

    void discard(const std::string& file_name);

    /**
     * @brief ChunkSender that forwards into accept()
     *
     * The assembler must outlive every upload using the returned sender.
     */
    transfer::ChunkSender sender();

private:
    struct PendingFile {
        std::uint64_t file_size = 0;
        std::uint32_t total_chunks = 0;
        std::set<std::uint32_t> received;
    };

    [[nodiscard]] std::filesystem::path parts_dir(const std::string& file_name) const;
    static std::filesystem::path chunk_path(const std::filesystem::path& parts_dir, std::uint32_t index);
    static Result<void> ensure_directory(const std::filesystem::path& dir);
    static Result<void> validate_name(const std::string& file_name);

    std::filesystem::path staging_root_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingFile> pending_;
};

} // namespace bulkup::receiver

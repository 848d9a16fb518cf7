#pragma once

#include "bulkup/events/event_bus.hpp"
#include "bulkup/progress/aggregator.hpp"
#include "bulkup/transfer/file_source.hpp"
#include "bulkup/transfer/types.hpp"
#include "bulkup/transfer/uploader.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace bulkup::transfer {

/**
 * @brief Uploader bound to one endpoint's sender, with optional aggregate tracking
 *
 * Files in upload_files() go one after another; parallelism is only ever
 * between chunks of the current file. When an aggregator is attached every
 * progress report is pushed into it and a file leaves it on completion or
 * cancellation.
 */
class UploadClient {
public:
    explicit UploadClient(ChunkSender sender,
                          progress::ProgressAggregator* aggregator = nullptr,
                          events::EventBus* bus = nullptr);

    bool upload_file(const std::shared_ptr<FileSource>& file, const UploadOptions& options = {});

    /**
     * @brief Upload files sequentially; one failure does not stop the rest
     *
     * options.on_file_complete is called for each successful file.
     */
    BatchResult upload_files(const std::vector<std::shared_ptr<FileSource>>& files,
                             const UploadOptions& options = {});

    [[nodiscard]] std::optional<Error> last_error() const { return uploader_.last_error(); }
    [[nodiscard]] bool is_uploading() const noexcept { return uploader_.is_uploading(); }

private:
    [[nodiscard]] UploadOptions tuned_options(const UploadOptions& options) const;

    ChunkSender sender_;
    progress::ProgressAggregator* aggregator_;
    ChunkedUploader uploader_;
};

} // namespace bulkup::transfer

#include "bulkup/transfer/upload_client.hpp"

#include <spdlog/spdlog.h>

namespace bulkup::transfer {

UploadClient::UploadClient(ChunkSender sender, progress::ProgressAggregator* aggregator, events::EventBus* bus)
    : sender_(std::move(sender)), aggregator_(aggregator), uploader_(bus) {}

bool UploadClient::upload_file(const std::shared_ptr<FileSource>& file, const UploadOptions& options) {
    UploadOptions wired = options;
    if (aggregator_) {
        wired.on_progress = [this, user = options.on_progress](const ProgressUpdate& update) {
            aggregator_->update_progress(update.file_name, update.progress);
            if (user) {
                user(update);
            }
        };
    }

    const bool ok = uploader_.upload_file(file, sender_, wired);

    if (aggregator_ && file) {
        const auto error = uploader_.last_error();
        if (ok || (error && error->is_cancelled())) {
            aggregator_->remove_progress(file->name());
        }
    }
    return ok;
}

BatchResult UploadClient::upload_files(const std::vector<std::shared_ptr<FileSource>>& files,
                                       const UploadOptions& options) {
    BatchResult result;
    for (const auto& file : files) {
        UploadOptions per_file = options.adaptive ? tuned_options(options) : options;
        per_file.on_file_complete = [&result, user = options.on_file_complete](const std::string& name) {
            result.successful.push_back(name);
            if (user) {
                user(name);
            }
        };

        if (upload_file(file, per_file)) {
            continue;
        }

        const auto error = last_error().value_or(Error{ErrorCode::ChunkTransfer, "Unknown error"});
        const std::string name = file ? file->name() : std::string{};
        spdlog::warn("Upload of '{}' did not complete: {}", name, error.message);
        result.failed.push_back(FailedUpload{name, error});
    }
    return result;
}

UploadOptions UploadClient::tuned_options(const UploadOptions& options) const {
    UploadOptions tuned = options;
    if (!aggregator_ || aggregator_->smoothed_network_speed() <= 0.0) {
        return tuned;
    }
    tuned.chunk_size = aggregator_->recommended_chunk_size();
    tuned.max_concurrency = aggregator_->recommended_concurrency();
    spdlog::debug("Adaptive upload settings: chunk_size={} max_concurrency={}",
                  tuned.chunk_size, *tuned.max_concurrency);
    return tuned;
}

} // namespace bulkup::transfer

#include "bulkup/transfer/uploader.hpp"

#include "bulkup/events/events.hpp"
#include "bulkup/transfer/chunk_planner.hpp"
#include "bulkup/transfer/concurrency.hpp"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <vector>

namespace bulkup::transfer {
namespace {

using steady = std::chrono::steady_clock;

bool is_cancelled(const UploadOptions& options) {
    return options.cancel_token && options.cancel_token->is_cancelled();
}

double bytes_per_second(std::uint64_t bytes, steady::duration elapsed) {
    const double seconds = std::max(0.001, std::chrono::duration<double>(elapsed).count());
    return static_cast<double>(bytes) / seconds;
}

Error cancelled_error() {
    return Error{ErrorCode::Cancelled, "Upload cancelled"};
}

// Clears the in-progress flag however upload_file returns.
class UploadingGuard {
public:
    explicit UploadingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~UploadingGuard() { flag_.store(false); }

    UploadingGuard(const UploadingGuard&) = delete;
    UploadingGuard& operator=(const UploadingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

ChunkedUploader::ChunkedUploader(events::EventBus* bus)
    : pool_(kMaxConcurrency), bus_(bus) {}

ChunkedUploader::~ChunkedUploader() {
    pool_.join();
}

std::optional<Error> ChunkedUploader::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

void ChunkedUploader::set_last_error(std::optional<Error> error) {
    std::lock_guard lock(error_mutex_);
    last_error_ = std::move(error);
}

bool ChunkedUploader::upload_file(const std::shared_ptr<FileSource>& file,
                                  const ChunkSender& sender,
                                  const UploadOptions& options) {
    if (!file) {
        set_last_error(Error{ErrorCode::Validation, "No file provided"});
        return false;
    }
    if (!sender) {
        set_last_error(Error{ErrorCode::Validation, "No chunk sender provided"});
        return false;
    }
    if (is_cancelled(options)) {
        set_last_error(cancelled_error());
        if (bus_) {
            bus_->emit(events::UploadCancelledEvent{file->name(), 0});
        }
        return false;
    }

    bool expected = false;
    if (!uploading_.compare_exchange_strong(expected, true)) {
        set_last_error(Error{ErrorCode::Validation, "An upload is already in progress"});
        return false;
    }
    UploadingGuard guard(uploading_);
    set_last_error(std::nullopt);

    Result<void> result = Ok();
    try {
        result = transfer(*file, sender, options);
    } catch (const std::exception& e) {
        result = Fail(ErrorCode::ChunkTransfer, std::string("Upload failed: ") + e.what());
    } catch (...) {
        result = Fail(ErrorCode::ChunkTransfer, "Upload failed: unknown error");
    }

    // A call rejected while this one ran may have recorded its own error.
    set_last_error(result.is_error() ? std::optional<Error>(result.error()) : std::nullopt);
    return result.is_ok();
}

Result<void> ChunkedUploader::transfer(FileSource& file, const ChunkSender& sender, const UploadOptions& options) {
    auto plan = plan_chunks(file.size(), options.chunk_size);
    if (plan.is_error()) {
        return Err<void>(plan.error());
    }

    TransferSession session(file.name(), plan.value(),
                            ConcurrencyController(options.max_concurrency, options.network_quality));
    if (auto started = session.start(); started.is_error()) {
        return started;
    }

    if (bus_) {
        bus_->emit(events::UploadStartedEvent{file.name(), file.size(), session.total_chunks(),
                                              session.concurrency().current()});
    }
    spdlog::debug("Uploading {} ({} bytes) in {} chunks of {} bytes, concurrency {}",
                  file.name(), file.size(), session.total_chunks(), options.chunk_size,
                  session.concurrency().current());

    if (session.total_chunks() == 0) {
        report_progress(options, ProgressUpdate{file.name(), session.progress()});
        return finish(session, options);
    }

    auto batches = run_batches(session, file, sender, options);
    if (batches.is_error()) {
        session.mark_failed(batches.error());
    }
    return finish(session, options);
}

Result<void> ChunkedUploader::run_batches(TransferSession& session,
                                          FileSource& file,
                                          const ChunkSender& sender,
                                          const UploadOptions& options) {
    const auto& plan = session.plan();
    std::uint32_t next_index = 0;

    while (next_index < plan.total_chunks() && !session.failed()) {
        if (is_cancelled(options)) {
            session.mark_failed(cancelled_error());
            break;
        }

        const std::uint32_t batch_size = std::min(session.concurrency().current(),
                                                  plan.total_chunks() - next_index);

        std::vector<ChunkEnvelope> batch;
        batch.reserve(batch_size);
        std::uint64_t batch_bytes = 0;
        for (std::uint32_t i = 0; i < batch_size; ++i) {
            const auto range = plan.range(next_index + i);
            auto data = file.read(range.offset, range.length);
            if (data.is_error()) {
                return Err<void>(data.error());
            }
            if (data.value().size() != range.length) {
                return Fail(ErrorCode::Io, "Short read of chunk " + std::to_string(range.index) + " from " + file.name());
            }
            ChunkEnvelope envelope;
            envelope.file_name = file.name();
            envelope.file_size = plan.file_size();
            envelope.chunk_index = range.index;
            envelope.total_chunks = plan.total_chunks();
            envelope.data = std::move(data.value());
            batch_bytes += range.length;
            batch.push_back(std::move(envelope));
        }
        next_index += batch_size;

        const auto batch_started = steady::now();
        std::vector<std::future<void>> pending;
        pending.reserve(batch.size());
        for (auto& envelope : batch) {
            auto task = std::make_shared<std::packaged_task<void()>>(
                [this, &session, &sender, &options, &envelope]() {
                    send_chunk(session, sender, options, envelope);
                });
            pending.push_back(task->get_future());
            boost::asio::post(pool_, [task]() { (*task)(); });
        }

        // Join the whole batch before looking at the outcome; no send is abandoned.
        for (auto& future : pending) {
            future.wait();
        }
        for (auto& future : pending) {
            future.get();
        }

        if (session.failed()) {
            break;
        }

        const double batch_rate = bytes_per_second(batch_bytes, steady::now() - batch_started);
        const std::uint32_t previous = session.concurrency().current();
        const std::uint32_t current = session.concurrency().on_batch_complete(batch_rate);
        if (current != previous) {
            spdlog::debug("{}: concurrency {} -> {} (batch {:.0f} B/s)", file.name(), previous, current, batch_rate);
            if (bus_) {
                bus_->emit(events::ConcurrencyChangedEvent{file.name(), previous, current, batch_rate});
            }
        }
    }

    return Ok();
}

void ChunkedUploader::send_chunk(TransferSession& session,
                                 const ChunkSender& sender,
                                 const UploadOptions& options,
                                 const ChunkEnvelope& envelope) {
    // A batch member that has not started yet skips its send once the file is lost.
    if (session.failed()) {
        return;
    }
    if (is_cancelled(options)) {
        session.mark_failed(cancelled_error());
        return;
    }

    const auto sent_at = steady::now();
    Result<void> result = Ok();
    try {
        result = sender(envelope);
    } catch (const std::exception& e) {
        result = Fail(ErrorCode::ChunkTransfer, e.what());
    } catch (...) {
        result = Fail(ErrorCode::ChunkTransfer, "unknown error");
    }
    const auto elapsed = steady::now() - sent_at;

    if (result.is_error()) {
        Error error = result.error();
        if (error.code != ErrorCode::Cancelled) {
            error = Error{ErrorCode::ChunkTransfer,
                          "Failed to upload chunk " + std::to_string(envelope.chunk_index) + " of " +
                              envelope.file_name + ": " + error.message};
        }
        spdlog::warn("{}", error.message);
        session.mark_failed(std::move(error));
        return;
    }

    const std::uint64_t bytes = envelope.data.size();
    {
        std::lock_guard lock(progress_mutex_);
        auto entry = session.record_chunk(envelope.chunk_index, bytes, elapsed);
        report_progress(options, ProgressUpdate{envelope.file_name, entry});
    }

    if (bus_) {
        bus_->emit(events::ChunkUploadedEvent{envelope.file_name, envelope.chunk_index, envelope.total_chunks,
                                              bytes, bytes_per_second(bytes, elapsed)});
    }
}

void ChunkedUploader::report_progress(const UploadOptions& options, ProgressUpdate update) {
    if (!options.on_progress) {
        return;
    }
    try {
        options.on_progress(update);
    } catch (const std::exception& e) {
        spdlog::error("on_progress callback for {} threw: {}", update.file_name, e.what());
    } catch (...) {
        spdlog::error("on_progress callback for {} threw a non-standard exception", update.file_name);
    }
}

Result<void> ChunkedUploader::finish(TransferSession& session, const UploadOptions& options) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - session.started_at());

    if (session.failed()) {
        // A sender that aborted because of the token reports a cancellation, not a failure.
        Error error = is_cancelled(options) ? cancelled_error()
                                            : session.last_error().value_or(Error{ErrorCode::ChunkTransfer, "Upload failed"});
        const auto uploaded = session.bytes_uploaded();

        if (error.is_cancelled()) {
            if (auto moved = session.transition_to(TransferState::Cancelled); moved.is_error()) {
                return moved;
            }
            if (bus_) {
                bus_->emit(events::UploadCancelledEvent{session.file_name(), uploaded});
            }
        } else {
            if (auto moved = session.transition_to(TransferState::Failed); moved.is_error()) {
                return moved;
            }
            if (bus_) {
                bus_->emit(events::UploadFailedEvent{session.file_name(), uploaded, error});
            }
        }
        return Err<void>(std::move(error));
    }

    if (auto moved = session.transition_to(TransferState::Complete); moved.is_error()) {
        return moved;
    }
    if (bus_) {
        bus_->emit(events::UploadCompletedEvent{session.file_name(), session.plan().file_size(), elapsed});
    }
    notify_complete(options, session.file_name());
    return Ok();
}

void ChunkedUploader::notify_complete(const UploadOptions& options, const std::string& file_name) {
    if (!options.on_file_complete) {
        return;
    }
    // The file is already uploaded; a throwing observer does not change that.
    try {
        options.on_file_complete(file_name);
    } catch (const std::exception& e) {
        spdlog::error("on_file_complete callback for {} threw: {}", file_name, e.what());
    } catch (...) {
        spdlog::error("on_file_complete callback for {} threw a non-standard exception", file_name);
    }
}

} // namespace bulkup::transfer

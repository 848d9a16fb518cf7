#include "bulkup/transfer/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace bulkup::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::unordered_map<TransferState, std::vector<TransferState>> transitions {
        {TransferState::Idle, {TransferState::Transferring, TransferState::Failed, TransferState::Cancelled}},
        {TransferState::Transferring, {TransferState::Complete, TransferState::Failed, TransferState::Cancelled}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::Idle: return "idle";
        case TransferState::Transferring: return "transferring";
        case TransferState::Complete: return "complete";
        case TransferState::Failed: return "failed";
        case TransferState::Cancelled: return "cancelled";
    }
    return "unknown";
}

TransferSession::TransferSession(std::string file_name, ChunkPlan plan, ConcurrencyController concurrency)
    : file_name_(std::move(file_name)),
      plan_(plan),
      concurrency_(concurrency),
      tracker_(plan.file_size()) {}

TransferState TransferSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

Result<void> TransferSession::start() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != TransferState::Idle) {
            return Fail(ErrorCode::Validation, "Transfer already started for " + file_name_);
        }
        started_at_ = std::chrono::steady_clock::now();
    }
    return transition_to(TransferState::Transferring);
}

Result<void> TransferSession::transition_to(TransferState next_state) {
    std::lock_guard lock(mutex_);
    if (state_ == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Fail(ErrorCode::Validation,
                    std::string("Illegal transfer state transition: ") + to_string(state_) + " -> " + to_string(next_state));
    }
    state_ = next_state;
    return Ok();
}

void TransferSession::mark_failed(Error error) {
    std::lock_guard lock(mutex_);
    if (!last_error_) {
        last_error_ = std::move(error);
    }
    failed_.store(true, std::memory_order_release);
}

std::optional<Error> TransferSession::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

ProgressEntry TransferSession::record_chunk(std::uint32_t chunk_index,
                                            std::uint64_t bytes,
                                            std::chrono::steady_clock::duration duration) {
    auto entry = tracker_.record_chunk(bytes, duration);
    entry.chunk_index = chunk_index;
    entry.total_chunks = plan_.total_chunks();
    return entry;
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    if (state_ == TransferState::Complete || state_ == TransferState::Failed || state_ == TransferState::Cancelled) {
        return false;
    }
    return is_progressive(state_, target);
}

} // namespace bulkup::transfer

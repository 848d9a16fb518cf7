#pragma once

#include <cstddef>
#include <deque>
#include <numeric>

namespace bulkup {

/**
 * @brief Fixed-capacity window of samples with an arithmetic mean
 *
 * Pushing beyond capacity drops the oldest sample. Not thread-safe;
 * owners guard it with their own mutex.
 */
class RollingAverage {
public:
    explicit RollingAverage(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(double sample) {
        samples_.push_back(sample);
        while (samples_.size() > capacity_) {
            samples_.pop_front();
        }
    }

    [[nodiscard]] double mean() const {
        if (samples_.empty()) {
            return 0.0;
        }
        return std::accumulate(samples_.begin(), samples_.end(), 0.0) / static_cast<double>(samples_.size());
    }

    [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }

    void clear() { samples_.clear(); }

private:
    std::size_t capacity_;
    std::deque<double> samples_;
};

} // namespace bulkup

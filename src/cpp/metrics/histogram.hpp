#pragma once
// Log-linear latency histogram with bounded relative error.
//
// Values (nanoseconds) are bucketed by power of two; each power-of-two range
// is split into sub_bucket_count linear slots, where sub_bucket_count is the
// smallest power of two >= 2 * 10^significant_digits. Any recorded value is
// therefore reported back within a relative error of 10^-significant_digits.
//
// Recording is lock-free (relaxed atomics on the bucket array plus running
// count/sum/min/max). Queries on a live histogram are approximate while
// writers are active; snapshot() produces an immutable copy.
#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace docbench {

struct HistogramSettings {
    int significant_digits = 3;
    int64_t highest_trackable_ns = 3'600'000'000'000LL;  // 1 hour
};

class HistogramSnapshot;

class Histogram {
public:
    explicit Histogram(const HistogramSettings& settings = {});

    Histogram(const Histogram&) = delete;
    Histogram& operator=(const Histogram&) = delete;

    void record(int64_t value_ns) noexcept;

    [[nodiscard]] int64_t count() const noexcept { return total_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] double mean() const noexcept;
    [[nodiscard]] int64_t min() const noexcept;
    [[nodiscard]] int64_t max() const noexcept;
    [[nodiscard]] int64_t value_at_percentile(double percentile) const;

    void reset() noexcept;

    [[nodiscard]] HistogramSnapshot snapshot() const;

    [[nodiscard]] const HistogramSettings& settings() const noexcept { return settings_; }
    [[nodiscard]] size_t bucket_slots() const noexcept { return counts_len_; }

    // Bucket arithmetic, shared with HistogramSnapshot
    struct Layout {
        int sub_bucket_half_count_magnitude = 0;
        int64_t sub_bucket_count = 0;
        int64_t sub_bucket_half_count = 0;
        int64_t sub_bucket_mask = 0;
        int bucket_count = 0;

        [[nodiscard]] size_t index_for(int64_t value) const noexcept;
        [[nodiscard]] int64_t lowest_equivalent(size_t index) const noexcept;
        [[nodiscard]] int64_t highest_equivalent(size_t index) const noexcept;
    };

    [[nodiscard]] const Layout& layout() const noexcept { return layout_; }

private:
    HistogramSettings settings_;
    Layout layout_;
    size_t counts_len_ = 0;
    std::unique_ptr<std::atomic<int64_t>[]> counts_;

    std::atomic<int64_t> total_count_{0};
    std::atomic<int64_t> total_sum_{0};
    std::atomic<int64_t> min_{INT64_MAX};
    std::atomic<int64_t> max_{0};
};

// Immutable sparse copy of a Histogram (only non-empty slots are kept)
class HistogramSnapshot {
public:
    HistogramSnapshot() = default;
    HistogramSnapshot(Histogram::Layout layout,
                      std::vector<std::pair<size_t, int64_t>> slots,
                      int64_t count, int64_t sum, int64_t min, int64_t max);

    [[nodiscard]] int64_t count() const noexcept { return count_; }
    [[nodiscard]] double mean() const noexcept {
        return count_ == 0 ? 0.0 : static_cast<double>(sum_) / static_cast<double>(count_);
    }
    [[nodiscard]] int64_t min() const noexcept { return count_ == 0 ? 0 : min_; }
    [[nodiscard]] int64_t max() const noexcept { return max_; }
    [[nodiscard]] int64_t sum() const noexcept { return sum_; }

    // percentile in [0, 100]; returns 0 for an empty snapshot
    [[nodiscard]] int64_t percentile(double percentile) const;

private:
    Histogram::Layout layout_{};
    std::vector<std::pair<size_t, int64_t>> slots_;
    int64_t count_ = 0;
    int64_t sum_ = 0;
    int64_t min_ = 0;
    int64_t max_ = 0;
};

} // namespace docbench

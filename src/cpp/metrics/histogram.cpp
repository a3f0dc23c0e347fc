#include "histogram.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace docbench {

namespace {

int bit_length(uint64_t v) {
    return v == 0 ? 0 : 64 - __builtin_clzll(v);
}

Histogram::Layout make_layout(const HistogramSettings& s) {
    if (s.significant_digits < 1 || s.significant_digits > 5) {
        throw std::invalid_argument("histogram significant_digits must be in [1, 5]");
    }
    if (s.highest_trackable_ns < 2) {
        throw std::invalid_argument("histogram highest_trackable_ns must be >= 2");
    }

    Histogram::Layout l;
    int64_t largest_single_unit = 2;
    for (int i = 0; i < s.significant_digits; ++i) largest_single_unit *= 10;

    int sub_bucket_count_magnitude =
        static_cast<int>(std::ceil(std::log2(static_cast<double>(largest_single_unit))));
    l.sub_bucket_half_count_magnitude = std::max(sub_bucket_count_magnitude, 1) - 1;
    l.sub_bucket_count = int64_t{1} << (l.sub_bucket_half_count_magnitude + 1);
    l.sub_bucket_half_count = l.sub_bucket_count / 2;
    l.sub_bucket_mask = l.sub_bucket_count - 1;

    int64_t smallest_untrackable = l.sub_bucket_count;
    int buckets = 1;
    while (smallest_untrackable <= s.highest_trackable_ns) {
        if (smallest_untrackable > INT64_MAX / 2) {
            ++buckets;
            break;
        }
        smallest_untrackable <<= 1;
        ++buckets;
    }
    l.bucket_count = buckets;
    return l;
}

void update_min(std::atomic<int64_t>& target, int64_t v) noexcept {
    int64_t cur = target.load(std::memory_order_relaxed);
    while (v < cur && !target.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {}
}

void update_max(std::atomic<int64_t>& target, int64_t v) noexcept {
    int64_t cur = target.load(std::memory_order_relaxed);
    while (v > cur && !target.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {}
}

int64_t count_at_percentile(double percentile, int64_t total) {
    double p = std::min(std::max(percentile, 0.0), 100.0);
    auto target = static_cast<int64_t>(std::llround(p / 100.0 * static_cast<double>(total)));
    return std::max<int64_t>(target, 1);
}

} // namespace

// --- Layout ---

size_t Histogram::Layout::index_for(int64_t value) const noexcept {
    if (value < 0) value = 0;
    int pow2ceiling = bit_length(static_cast<uint64_t>(value | sub_bucket_mask));
    int bucket_index = pow2ceiling - (sub_bucket_half_count_magnitude + 1);
    int64_t sub_bucket_index = value >> bucket_index;
    int64_t bucket_base = static_cast<int64_t>(bucket_index + 1) << sub_bucket_half_count_magnitude;
    return static_cast<size_t>(bucket_base + (sub_bucket_index - sub_bucket_half_count));
}

int64_t Histogram::Layout::lowest_equivalent(size_t index) const noexcept {
    int bucket_index = static_cast<int>(index >> sub_bucket_half_count_magnitude) - 1;
    int64_t sub_bucket_index =
        static_cast<int64_t>(index & static_cast<size_t>(sub_bucket_half_count - 1)) + sub_bucket_half_count;
    if (bucket_index < 0) {
        sub_bucket_index -= sub_bucket_half_count;
        bucket_index = 0;
    }
    return sub_bucket_index << bucket_index;
}

int64_t Histogram::Layout::highest_equivalent(size_t index) const noexcept {
    int bucket_index = std::max(static_cast<int>(index >> sub_bucket_half_count_magnitude) - 1, 0);
    return lowest_equivalent(index) + (int64_t{1} << bucket_index) - 1;
}

// --- Histogram ---

Histogram::Histogram(const HistogramSettings& settings)
    : settings_(settings)
    , layout_(make_layout(settings)) {
    counts_len_ = static_cast<size_t>(layout_.bucket_count + 1) *
                  static_cast<size_t>(layout_.sub_bucket_half_count);
    counts_ = std::make_unique<std::atomic<int64_t>[]>(counts_len_);
    for (size_t i = 0; i < counts_len_; ++i) {
        counts_[i].store(0, std::memory_order_relaxed);
    }
}

void Histogram::record(int64_t value_ns) noexcept {
    int64_t v = std::min(std::max<int64_t>(value_ns, 0), settings_.highest_trackable_ns);
    size_t idx = std::min(layout_.index_for(v), counts_len_ - 1);

    counts_[idx].fetch_add(1, std::memory_order_relaxed);
    total_count_.fetch_add(1, std::memory_order_relaxed);
    total_sum_.fetch_add(v, std::memory_order_relaxed);
    update_min(min_, v);
    update_max(max_, v);
}

double Histogram::mean() const noexcept {
    int64_t n = count();
    if (n == 0) return 0.0;
    return static_cast<double>(total_sum_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

int64_t Histogram::min() const noexcept {
    return count() == 0 ? 0 : min_.load(std::memory_order_relaxed);
}

int64_t Histogram::max() const noexcept {
    return max_.load(std::memory_order_relaxed);
}

int64_t Histogram::value_at_percentile(double percentile) const {
    return snapshot().percentile(percentile);
}

void Histogram::reset() noexcept {
    for (size_t i = 0; i < counts_len_; ++i) {
        counts_[i].store(0, std::memory_order_relaxed);
    }
    total_count_.store(0, std::memory_order_relaxed);
    total_sum_.store(0, std::memory_order_relaxed);
    min_.store(INT64_MAX, std::memory_order_relaxed);
    max_.store(0, std::memory_order_relaxed);
}

HistogramSnapshot Histogram::snapshot() const {
    std::vector<std::pair<size_t, int64_t>> slots;
    int64_t total = 0;
    for (size_t i = 0; i < counts_len_; ++i) {
        int64_t c = counts_[i].load(std::memory_order_relaxed);
        if (c != 0) {
            slots.emplace_back(i, c);
            total += c;
        }
    }
    return HistogramSnapshot(layout_, std::move(slots), total,
                             total_sum_.load(std::memory_order_relaxed),
                             min_.load(std::memory_order_relaxed),
                             max_.load(std::memory_order_relaxed));
}

// --- HistogramSnapshot ---

HistogramSnapshot::HistogramSnapshot(Histogram::Layout layout,
                                     std::vector<std::pair<size_t, int64_t>> slots,
                                     int64_t count, int64_t sum, int64_t min, int64_t max)
    : layout_(layout)
    , slots_(std::move(slots))
    , count_(count)
    , sum_(sum)
    , min_(min)
    , max_(max) {}

int64_t HistogramSnapshot::percentile(double percentile) const {
    if (count_ == 0) return 0;

    int64_t target = count_at_percentile(percentile, count_);
    int64_t cumulative = 0;
    for (const auto& [index, c] : slots_) {
        cumulative += c;
        if (cumulative >= target) {
            int64_t v = layout_.highest_equivalent(index);
            return std::min(std::max(v, min_), max_);
        }
    }
    return max_;
}

} // namespace docbench

#pragma once
// Time sources and interval timers.
// All benchmark timestamps go through a TimeSource so tests can drive time
// deterministically with MockTimeSource.
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace docbench {

using Duration = std::chrono::nanoseconds;

class TimeSource {
public:
    virtual ~TimeSource() = default;

    // Monotonic timestamp in nanoseconds
    [[nodiscard]] virtual int64_t now_ns() const = 0;

    [[nodiscard]] Duration elapsed_since(int64_t start_ns) const {
        return Duration(now_ns() - start_ns);
    }
};

class SystemTimeSource final : public TimeSource {
public:
    [[nodiscard]] int64_t now_ns() const override {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

    // Shared process-wide instance
    static std::shared_ptr<TimeSource> instance() {
        static std::shared_ptr<TimeSource> source = std::make_shared<SystemTimeSource>();
        return source;
    }
};

// Manually advanced clock for tests
class MockTimeSource final : public TimeSource {
public:
    explicit MockTimeSource(int64_t initial_ns = 0) : now_(initial_ns) {}

    [[nodiscard]] int64_t now_ns() const override {
        return now_.load(std::memory_order_acquire);
    }

    void advance(Duration d) { now_.fetch_add(d.count(), std::memory_order_acq_rel); }
    void set(int64_t ns) { now_.store(ns, std::memory_order_release); }

private:
    std::atomic<int64_t> now_;
};

class Timer {
public:
    explicit Timer(const TimeSource& source) noexcept : source_(source) {}

    void start() noexcept { start_ = source_.now_ns(); end_ = start_; }

    void stop() noexcept { end_ = source_.now_ns(); }

    [[nodiscard]] int64_t start_ns() const noexcept { return start_; }

    [[nodiscard]] Duration elapsed() const noexcept { return Duration(end_ - start_); }

    [[nodiscard]] int64_t elapsed_ns() const noexcept { return end_ - start_; }

    [[nodiscard]] double elapsed_sec() const noexcept {
        return static_cast<double>(end_ - start_) / 1e9;
    }

private:
    const TimeSource& source_;
    int64_t start_ = 0;
    int64_t end_ = 0;
};

// RAII scoped timer -- writes the elapsed time into a reference on destruction
class ScopedTimer {
public:
    ScopedTimer(const TimeSource& source, Duration& out) noexcept
        : source_(source), out_(out), start_(source.now_ns()) {}

    ~ScopedTimer() noexcept {
        out_ = Duration(source_.now_ns() - start_);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const TimeSource& source_;
    Duration& out_;
    int64_t start_;
};

inline double to_micros(Duration d) {
    return static_cast<double>(d.count()) / 1000.0;
}

} // namespace docbench

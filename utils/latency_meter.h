#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>

// ─────────────────────────────────────────────
// LatencyMeter
// - fixed ring of the most recent samples, no heap after construction
// - record() is noexcept with a single writer (the request loop)
// - statistics are computed over the samples currently held
// ─────────────────────────────────────────────
class LatencyMeter {
public:
    explicit LatencyMeter(const std::string& name = "");

    LatencyMeter(const LatencyMeter&) = delete;
    LatencyMeter& operator=(const LatencyMeter&) = delete;

    inline void start() noexcept {
        start_time_ = std::chrono::steady_clock::now();
    }

    /// Records the time since start() and returns it in ms.
    inline double stop() noexcept {
        auto end_time = std::chrono::steady_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time_).count();
        record(elapsed_ms);
        return elapsed_ms;
    }

    void record(double elapsed_ms) noexcept;

    double latest() const noexcept;
    double mean() const noexcept;
    double stdev() const noexcept;
    double max() const noexcept;

    /// Samples currently held, at most capacity().
    size_t count() const noexcept {
        const size_t n = total();
        return n < max_samples ? n : max_samples;
    }
    /// Samples recorded since construction.
    size_t total() const noexcept { return recorded_.load(std::memory_order_acquire); }

    static constexpr size_t capacity() noexcept { return max_samples; }

    const std::string& name() const noexcept { return name_; }

    void print_latest(std::ostream& os) const;
    void print_statistics(std::ostream& os) const;

private:
    struct Summary {
        size_t n = 0;
        double mean = 0.0;
        double m2 = 0.0;   // sum of squared deviations from mean
        double max = 0.0;
    };
    Summary summarize() const noexcept;

    static constexpr size_t max_samples = 512;
    std::string name_;
    std::array<double, max_samples> samples_{};
    std::chrono::steady_clock::time_point start_time_;
    double last_ = 0.0;
    std::atomic<size_t> recorded_{0};
};

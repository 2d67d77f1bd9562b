// latency_meter.cpp
#include "utils/latency_meter.h"

#include <cmath>
#include <iomanip>

LatencyMeter::LatencyMeter(const std::string& name) : name_(name) {}

void LatencyMeter::record(double elapsed_ms) noexcept {
    const size_t n = recorded_.load(std::memory_order_relaxed);
    samples_[n % max_samples] = elapsed_ms;
    last_ = elapsed_ms;
    recorded_.store(n + 1, std::memory_order_release);
}

double LatencyMeter::latest() const noexcept {
    return total() == 0 ? 0.0 : last_;
}

// Single Welford pass over the held slots. Slot order does not matter for
// the statistics, so the wrapped ring is read front to back.
LatencyMeter::Summary LatencyMeter::summarize() const noexcept {
    Summary s;
    const size_t held = count();
    for (size_t i = 0; i < held; ++i) {
        const double x = samples_[i];
        ++s.n;
        const double delta = x - s.mean;
        s.mean += delta / static_cast<double>(s.n);
        s.m2 += delta * (x - s.mean);
        if (s.n == 1 || x > s.max) s.max = x;
    }
    return s;
}

double LatencyMeter::mean() const noexcept { return summarize().mean; }

double LatencyMeter::stdev() const noexcept {
    const Summary s = summarize();
    return s.n == 0 ? 0.0 : std::sqrt(s.m2 / static_cast<double>(s.n));
}

double LatencyMeter::max() const noexcept { return summarize().max; }

void LatencyMeter::print_latest(std::ostream& os) const {
    os << "[Latency|" << name_ << "] " << std::fixed << std::setprecision(3)
       << latest() << " ms" << std::endl;
}

void LatencyMeter::print_statistics(std::ostream& os) const {
    const Summary s = summarize();
    if (s.n == 0) {
        os << "[Latency|" << name_ << "] No samples recorded." << std::endl;
        return;
    }
    os << "[Latency|" << name_ << "] n=" << total()
       << std::fixed << std::setprecision(3)
       << " mean=" << s.mean << " ms"
       << " std=" << std::sqrt(s.m2 / static_cast<double>(s.n)) << " ms"
       << " max=" << s.max << " ms" << std::endl;
}

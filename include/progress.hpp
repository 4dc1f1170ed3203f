#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace shuttle {

struct ProgressSnapshot {
    uint64_t bytes_confirmed = 0;
    uint64_t total_bytes = 0;
    double percent = 0.0;
    double bytes_per_second = 0.0;
    std::optional<double> eta_seconds; // unknown while speed is zero
};

// Speed over the most recent sampling window, not the whole run.
class ProgressTracker {
public:
    using time_point = std::chrono::steady_clock::time_point;

    ProgressTracker(uint64_t total_bytes, std::chrono::milliseconds interval);

    void start(time_point now, uint64_t bytes_confirmed);

    // A snapshot once at least one interval has passed since the last one
    std::optional<ProgressSnapshot> sample(time_point now, uint64_t bytes_confirmed);

private:
    uint64_t total_bytes_;
    std::chrono::milliseconds interval_;
    time_point last_time_{};
    uint64_t last_bytes_ = 0;
};

} // namespace shuttle

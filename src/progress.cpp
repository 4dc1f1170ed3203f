#include "progress.hpp"

namespace shuttle {

ProgressTracker::ProgressTracker(uint64_t total_bytes, std::chrono::milliseconds interval)
    : total_bytes_(total_bytes), interval_(interval) {}

void ProgressTracker::start(time_point now, uint64_t bytes_confirmed) {
    last_time_ = now;
    last_bytes_ = bytes_confirmed;
}

std::optional<ProgressSnapshot> ProgressTracker::sample(time_point now, uint64_t bytes_confirmed) {
    auto elapsed = now - last_time_;
    if (elapsed < interval_) {
        return std::nullopt;
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    ProgressSnapshot snap;
    snap.bytes_confirmed = bytes_confirmed;
    snap.total_bytes = total_bytes_;
    snap.percent = total_bytes_ > 0 ? 100.0 * static_cast<double>(bytes_confirmed) / static_cast<double>(total_bytes_) : 100.0;
    if (bytes_confirmed > last_bytes_ && seconds > 0.0) {
        snap.bytes_per_second = static_cast<double>(bytes_confirmed - last_bytes_) / seconds;
    }
    if (snap.bytes_per_second > 0.0) {
        snap.eta_seconds = static_cast<double>(total_bytes_ - bytes_confirmed) / snap.bytes_per_second;
    }

    last_time_ = now;
    last_bytes_ = bytes_confirmed;
    return snap;
}

} // namespace shuttle

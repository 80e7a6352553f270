#include "voiceguard/session_stats.hpp"

namespace voiceguard {

void SessionStats::record(CallStatus status) {
    total_++;
    if (status == CallStatus::Authorized) {
        authorized_++;
    } else {
        blocked_++;
    }
}

void SessionStats::markStart(std::chrono::system_clock::time_point when) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
    start_ms_.store(static_cast<int64_t>(ms));
}

std::chrono::system_clock::time_point SessionStats::startTime() const {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(start_ms_.load())));
}

SessionStats::Snapshot SessionStats::snapshot() const {
    Snapshot snap;
    snap.total_calls = total_.load();
    snap.authorized_calls = authorized_.load();
    snap.blocked_calls = blocked_.load();
    snap.start_time = startTime();
    return snap;
}

} // namespace voiceguard

#ifndef VOICEGUARD_SESSION_STATS_HPP
#define VOICEGUARD_SESSION_STATS_HPP

#include "voiceguard/call_event.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace voiceguard {

// Cumulative call counters. Written by the monitoring thread only; each
// counter can be read from any thread at any time.
class SessionStats {
public:
    struct Snapshot {
        uint64_t total_calls = 0;
        uint64_t authorized_calls = 0;
        uint64_t blocked_calls = 0;
        std::chrono::system_clock::time_point start_time;

        // Percentage of calls blocked, 0 when nothing was analyzed
        double blockRate() const {
            return total_calls > 0 ? 100.0 * static_cast<double>(blocked_calls) / static_cast<double>(total_calls) : 0.0;
        }
    };

    SessionStats() = default;

    SessionStats(const SessionStats&) = delete;
    SessionStats& operator=(const SessionStats&) = delete;

    // Count one completed analysis
    void record(CallStatus status);

    void markStart(std::chrono::system_clock::time_point when);

    uint64_t totalCalls() const { return total_.load(); }
    uint64_t authorizedCalls() const { return authorized_.load(); }
    uint64_t blockedCalls() const { return blocked_.load(); }
    std::chrono::system_clock::time_point startTime() const;

    // Counters read one by one; the triple is not a single atomic read
    Snapshot snapshot() const;

private:
    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> authorized_{0};
    std::atomic<uint64_t> blocked_{0};
    std::atomic<int64_t> start_ms_{0};  // milliseconds since the epoch
};

} // namespace voiceguard

#endif // VOICEGUARD_SESSION_STATS_HPP

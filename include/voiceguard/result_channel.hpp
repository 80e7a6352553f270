#ifndef VOICEGUARD_RESULT_CHANNEL_HPP
#define VOICEGUARD_RESULT_CHANNEL_HPP

#include "voiceguard/call_event.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

namespace voiceguard {

// Carries CallEvents from the monitoring thread to whoever polls.
// Undelivered events are capped at `max_pending`; past that the oldest are
// dropped and counted.
class ResultChannel {
public:
    explicit ResultChannel(size_t max_pending = 1000);

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    void publish(const CallEvent& event);

    // Everything published since the last drain, oldest first. Never waits.
    std::vector<CallEvent> drainAll();

    size_t pending() const;
    size_t droppedCount() const { return dropped_.load(); }

private:
    std::deque<CallEvent> events_;
    size_t max_pending_;
    mutable std::mutex mutex_;
    std::atomic<size_t> dropped_{0};
};

// Consumer-side trailing history of the last N calls, newest first
class CallHistory {
public:
    explicit CallHistory(size_t capacity = 20) : capacity_(capacity) {}

    void add(const CallEvent& event);
    void add(const std::vector<CallEvent>& events);

    const std::deque<CallEvent>& recent() const { return events_; }
    size_t size() const { return events_.size(); }
    size_t capacity() const { return capacity_; }

private:
    std::deque<CallEvent> events_;
    size_t capacity_;
};

} // namespace voiceguard

#endif // VOICEGUARD_RESULT_CHANNEL_HPP

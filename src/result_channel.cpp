#include "voiceguard/result_channel.hpp"

#include <iterator>

namespace voiceguard {

ResultChannel::ResultChannel(size_t max_pending) : max_pending_(max_pending > 0 ? max_pending : 1) {
}

void ResultChannel::publish(const CallEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
    while (events_.size() > max_pending_) {
        events_.pop_front();
        dropped_++;
    }
}

std::vector<CallEvent> ResultChannel::drainAll() {
    std::deque<CallEvent> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(events_);
    }
    return std::vector<CallEvent>(std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
}

size_t ResultChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void CallHistory::add(const CallEvent& event) {
    if (capacity_ == 0) {
        return;
    }
    events_.push_front(event);
    while (events_.size() > capacity_) {
        events_.pop_back();
    }
}

void CallHistory::add(const std::vector<CallEvent>& events) {
    for (const auto& event : events) {
        add(event);
    }
}

} // namespace voiceguard

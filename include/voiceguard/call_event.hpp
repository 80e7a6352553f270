#ifndef VOICEGUARD_CALL_EVENT_HPP
#define VOICEGUARD_CALL_EVENT_HPP

#include <chrono>
#include <string>
#include <utility>

namespace voiceguard {

enum class CallStatus {
    Authorized,
    Blocked
};

const char* toString(CallStatus status);

// Caller reported when no reference clears the threshold
extern const char* const kUnknownCaller;

struct CallEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string caller;
    float confidence;
    CallStatus status;

    CallEvent() : confidence(0.0f), status(CallStatus::Blocked) {}
    CallEvent(std::chrono::system_clock::time_point ts, std::string who, float conf, CallStatus st)
        : timestamp(ts), caller(std::move(who)), confidence(conf), status(st) {}

    bool authorized() const { return status == CallStatus::Authorized; }
};

// "HH:MM:SS" in local time
std::string formatClock(std::chrono::system_clock::time_point tp);

// One-line summary such as "14:02:11 Mom Authorized (94.0%)"
std::string describe(const CallEvent& event);

} // namespace voiceguard

#endif // VOICEGUARD_CALL_EVENT_HPP

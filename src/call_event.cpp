#include "voiceguard/call_event.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace voiceguard {

const char* const kUnknownCaller = "Unknown";

const char* toString(CallStatus status) {
    switch (status) {
        case CallStatus::Authorized:
            return "Authorized";
        case CallStatus::Blocked:
            return "Blocked";
    }
    return "Blocked";
}

std::string formatClock(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

std::string describe(const CallEvent& event) {
    std::ostringstream oss;
    oss << formatClock(event.timestamp) << " " << event.caller << " " << toString(event.status)
        << " (" << std::fixed << std::setprecision(1) << event.confidence * 100.0f << "%)";
    return oss.str();
}

} // namespace voiceguard

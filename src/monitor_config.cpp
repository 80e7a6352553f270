#include "voiceguard/monitor_config.hpp"
#include "voiceguard/errors.hpp"

#include <cmath>

namespace voiceguard {

size_t MonitorConfig::windowSamples() const {
    return static_cast<size_t>(std::lround(window_sec * sample_rate));
}

void MonitorConfig::validate() const {
    if (sample_rate <= 0) {
        throw ConfigurationError("sample_rate must be positive");
    }
    if (!(window_sec > 0.0) || windowSamples() == 0) {
        throw ConfigurationError("window_sec must cover at least one sample");
    }
    if (hop_sec < 0.0) {
        throw ConfigurationError("hop_sec must not be negative");
    }
    if (queue_timeout_ms <= 0) {
        throw ConfigurationError("queue_timeout_ms must be positive");
    }
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        throw ConfigurationError("threshold must be within [0, 1]");
    }
}

} // namespace voiceguard

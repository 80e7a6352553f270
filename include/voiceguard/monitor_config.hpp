#ifndef VOICEGUARD_MONITOR_CONFIG_HPP
#define VOICEGUARD_MONITOR_CONFIG_HPP

#include <cstddef>
#include <string>

namespace voiceguard {

struct MonitorConfig {
    // Audio format
    int sample_rate = 16000;          // Hz, mono

    // Analysis cadence
    double window_sec = 3.0;          // Length of audio analyzed per decision
    double hop_sec = 0.5;             // Pause after each completed analysis
    int queue_timeout_ms = 100;       // Longest wait for a chunk before re-checking stop

    // Decision
    float threshold = 0.75f;          // Minimum similarity to authorize a caller

    // Consumer side
    size_t history_size = 20;         // Calls kept by CallHistory
    size_t max_pending_events = 1000; // Undelivered events kept by ResultChannel

    // Reference voices
    std::string voices_dir = "voices";

    MonitorConfig() = default;

    size_t windowSamples() const;

    // Throws ConfigurationError on out-of-range values
    void validate() const;
};

} // namespace voiceguard

#endif // VOICEGUARD_MONITOR_CONFIG_HPP

#ifndef VOICEGUARD_MONITORING_WORKER_HPP
#define VOICEGUARD_MONITORING_WORKER_HPP

#include "voiceguard/capture_source.hpp"
#include "voiceguard/chunk_queue.hpp"
#include "voiceguard/embedding_extractor.hpp"
#include "voiceguard/monitor_config.hpp"
#include "voiceguard/reference_store.hpp"
#include "voiceguard/result_channel.hpp"
#include "voiceguard/session_stats.hpp"
#include "voiceguard/sliding_window.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voiceguard {

/**
 * @brief Real-time caller screening on a dedicated thread.
 *
 * Capture context: pushes chunks into the input queue and returns.
 *
 * Processing thread:
 *   - waits for the next chunk (bounded by queue_timeout_ms)
 *   - pushes it into the sliding window
 *   - if more chunks are already queued, skips analysis and keeps draining
 *   - otherwise embeds the window, matches it against the reference store,
 *     counts and publishes a CallEvent, then rests for one hop interval
 *
 * Only stop() ends the loop; per-iteration failures are logged and skipped.
 * The worker can be started again after stop().
 */
class MonitoringWorker {
public:
    enum class State {
        Idle,
        Running
    };

    MonitoringWorker(const MonitorConfig& config,
                     ReferenceStore& store,
                     EmbeddingExtractor& extractor,
                     CaptureSource& capture);
    ~MonitoringWorker();

    MonitoringWorker(const MonitoringWorker&) = delete;
    MonitoringWorker& operator=(const MonitoringWorker&) = delete;

    /**
     * @brief Idle -> Running. No-op if already running.
     * @throws ConfigurationError when no voices are enrolled
     * @throws CaptureError when the capture source fails to open
     */
    void start();

    /**
     * @brief Running -> Idle. Idempotent.
     */
    void stop();

    State state() const { return state_.load(); }
    bool isRunning() const { return state() == State::Running; }

    // Read at the start of each analysis
    float threshold() const { return threshold_.load(); }
    void setThreshold(float threshold);

    ResultChannel& results() { return results_; }
    const SessionStats& stats() const { return stats_; }
    std::vector<std::string> referenceNames() const { return store_.names(); }

    // Delivery point for the capture context
    ChunkSink sink();
    size_t pendingChunks() const { return queue_.size(); }

    // Diagnostics
    size_t chunksReceived() const { return chunks_received_.load(); }
    size_t analysesSkipped() const { return analyses_skipped_.load(); }
    size_t errorsSkipped() const { return errors_skipped_.load(); }

private:
    void processingLoop();
    bool analyzeWindow();
    void restForHop();

    MonitorConfig config_;
    ReferenceStore& store_;
    EmbeddingExtractor& extractor_;
    CaptureSource& capture_;

    SlidingWindow window_;  // touched only by the processing thread while running
    ChunkQueue queue_;
    ResultChannel results_;
    SessionStats stats_;

    std::atomic<float> threshold_;
    std::atomic<State> state_{State::Idle};
    std::atomic<bool> stop_requested_{false};

    std::mutex control_mutex_;  // serializes start/stop
    std::mutex rest_mutex_;
    std::condition_variable rest_cv_;
    std::thread thread_;

    std::atomic<size_t> chunks_received_{0};
    std::atomic<size_t> analyses_skipped_{0};
    std::atomic<size_t> errors_skipped_{0};
};

const char* toString(MonitoringWorker::State state);

} // namespace voiceguard

#endif // VOICEGUARD_MONITORING_WORKER_HPP

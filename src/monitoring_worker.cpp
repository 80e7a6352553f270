#include "voiceguard/monitoring_worker.hpp"
#include "voiceguard/errors.hpp"
#include "voiceguard/matcher.hpp"

#include <chrono>
#include <iostream>
#include <system_error>

namespace voiceguard {

namespace {
    size_t checkedWindowSamples(const MonitorConfig& config) {
        config.validate();
        return config.windowSamples();
    }
}

const char* toString(MonitoringWorker::State state) {
    return state == MonitoringWorker::State::Running ? "Running" : "Idle";
}

MonitoringWorker::MonitoringWorker(const MonitorConfig& config,
                                   ReferenceStore& store,
                                   EmbeddingExtractor& extractor,
                                   CaptureSource& capture)
    : config_(config),
      store_(store),
      extractor_(extractor),
      capture_(capture),
      window_(checkedWindowSamples(config)),
      results_(config.max_pending_events),
      threshold_(config.threshold) {
}

MonitoringWorker::~MonitoringWorker() {
    stop();
}

void MonitoringWorker::setThreshold(float threshold) {
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        throw ConfigurationError("threshold must be within [0, 1]");
    }
    threshold_.store(threshold);
    std::cout << "[MonitoringWorker] Threshold set to " << threshold << std::endl;
}

ChunkSink MonitoringWorker::sink() {
    return [this](AudioChunk&& chunk) { queue_.push(std::move(chunk)); };
}

void MonitoringWorker::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (state_.load() == State::Running) {
        return;
    }

    if (store_.empty()) {
        throw ConfigurationError("No enrolled voices; enroll at least one before monitoring");
    }

    // Chunks that arrived while idle belong to no session
    size_t stale = queue_.clear();
    if (stale > 0) {
        std::cout << "[MonitoringWorker] Discarded " << stale << " stale chunk(s)" << std::endl;
    }
    window_.reset();
    stop_requested_.store(false);

    try {
        capture_.open(sink());
    } catch (const CaptureError&) {
        throw;
    } catch (const std::exception& e) {
        throw CaptureError(capture_.describe() + ": " + e.what());
    }

    stats_.markStart(std::chrono::system_clock::now());
    state_.store(State::Running);

    try {
        thread_ = std::thread(&MonitoringWorker::processingLoop, this);
    } catch (const std::system_error& e) {
        state_.store(State::Idle);
        capture_.close();
        throw CaptureError(std::string("Cannot start processing thread: ") + e.what());
    }

    std::cout << "[MonitoringWorker] Monitoring " << capture_.describe() << " against "
              << store_.size() << " voice(s), threshold " << threshold_.load() << std::endl;
}

void MonitoringWorker::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (state_.load() != State::Running) {
        return;
    }

    {
        std::lock_guard<std::mutex> rest_lock(rest_mutex_);
        stop_requested_.store(true);
    }
    rest_cv_.notify_all();
    queue_.interrupt();

    if (thread_.joinable()) {
        thread_.join();
    }

    capture_.close();
    state_.store(State::Idle);

    SessionStats::Snapshot snap = stats_.snapshot();
    std::cout << "[MonitoringWorker] Stopped after " << snap.total_calls << " analyses ("
              << snap.authorized_calls << " authorized, " << snap.blocked_calls << " blocked, "
              << analyses_skipped_.load() << " shed)" << std::endl;
}

void MonitoringWorker::processingLoop() {
    std::cout << "[MonitoringWorker] Processing thread started" << std::endl;
    const std::chrono::milliseconds timeout(config_.queue_timeout_ms);

    while (!stop_requested_.load()) {
        AudioChunk chunk;
        if (!queue_.popFor(chunk, timeout)) {
            continue;
        }
        chunks_received_++;

        if (!chunk.wellFormed()) {
            std::cerr << "[MonitoringWorker] Skipping malformed chunk (" << chunk.samples.size()
                      << " samples, frame_count " << chunk.frame_count << ")" << std::endl;
            errors_skipped_++;
            continue;
        }

        window_.push(chunk.samples);

        // Behind real time: catch up on audio before spending time on a model run
        if (!queue_.empty()) {
            analyses_skipped_++;
            continue;
        }

        if (analyzeWindow()) {
            restForHop();
        }
    }

    std::cout << "[MonitoringWorker] Processing thread ended" << std::endl;
}

bool MonitoringWorker::analyzeWindow() {
    try {
        const float threshold = threshold_.load();
        std::shared_ptr<const ReferenceStore::Voices> references = store_.snapshot();

        std::vector<float> embedding = extractor_.extract(window_.snapshot());
        if (embedding.empty()) {
            throw ExtractionError("Embedding model returned nothing");
        }

        MatchResult result = match(embedding, *references, threshold);
        CallEvent event(std::chrono::system_clock::now(), result.caller, result.confidence, result.status);

        stats_.record(event.status);
        results_.publish(event);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[MonitoringWorker] Analysis skipped: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "[MonitoringWorker] Analysis skipped: unknown failure" << std::endl;
    }
    errors_skipped_++;
    return false;
}

void MonitoringWorker::restForHop() {
    if (config_.hop_sec <= 0.0) {
        return;
    }
    const auto hop = std::chrono::duration<double>(config_.hop_sec);
    std::unique_lock<std::mutex> lock(rest_mutex_);
    rest_cv_.wait_for(lock, hop, [this] { return stop_requested_.load(); });
}

} // namespace voiceguard

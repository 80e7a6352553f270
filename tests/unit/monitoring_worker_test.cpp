#include <cassert>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>
#include <vector>
#include "voiceguard/audio_file.hpp"
#include "voiceguard/errors.hpp"
#include "voiceguard/monitoring_worker.hpp"
#include "voiceguard/reference_store.hpp"
#include "test_doubles.hpp"

using namespace voiceguard;
using namespace voiceguard::testing;
using std::chrono::milliseconds;

// Window of 0.5 s at 16 kHz, delivered in 50 ms chunks
static const size_t kWindow = 8000;
static const size_t kChunk = 800;

static const std::vector<float> kMomLevels{0.5f, -0.25f, 0.125f, -0.5f};
static const std::vector<float> kDadLevels{-0.5f, 0.5f, 0.25f, 0.25f};
// cos(kMomLevels, kHalfLevels) is about 0.66
static const std::vector<float> kHalfLevels{0.5f, 0.0f, 0.0f, 0.0f};

static MonitorConfig testConfig(const ScopedTempDir& dir) {
    MonitorConfig cfg;
    cfg.sample_rate = 16000;
    cfg.window_sec = 0.5;
    cfg.hop_sec = 0.05;
    cfg.queue_timeout_ms = 20;
    cfg.threshold = 0.75f;
    cfg.voices_dir = dir.str();
    return cfg;
}

static ReferenceStore::Options storeOptions(const ScopedTempDir& dir) {
    ReferenceStore::Options opts;
    opts.directory = dir.str();
    return opts;
}

static std::vector<uint8_t> wavOf(const std::vector<float>& levels) {
    return encodeWav(segmentSignal(levels, kWindow), 16000);
}

static void testStartWithoutVoices() {
    ScopedTempDir dir("novoices");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    ScriptedCaptureSource capture;
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);

    bool threw = false;
    try {
        worker.start();
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    assert(worker.state() == MonitoringWorker::State::Idle);
    assert(capture.opens == 0);

    // Stop on an idle worker, twice
    worker.stop();
    worker.stop();
    assert(!worker.isRunning());
}

static void testCaptureFailure() {
    ScopedTempDir dir("capture");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));

    ScriptedCaptureSource capture;
    capture.fail_with_capture_error = true;
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);

    bool threw = false;
    try {
        worker.start();
    } catch (const CaptureError&) {
        threw = true;
    }
    assert(threw);
    assert(worker.state() == MonitoringWorker::State::Idle);

    // Other open() failures surface as CaptureError too
    capture.fail_with_capture_error = false;
    capture.fail_with_runtime_error = true;
    threw = false;
    try {
        worker.start();
    } catch (const CaptureError&) {
        threw = true;
    }
    assert(threw);
    assert(worker.state() == MonitoringWorker::State::Idle);

    // Recovers once the device is back
    capture.fail_with_runtime_error = false;
    worker.start();
    assert(worker.isRunning());
    worker.stop();
    assert(worker.state() == MonitoringWorker::State::Idle);
}

static void testInvalidConfig() {
    ScopedTempDir dir("config");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    ScriptedCaptureSource capture;

    MonitorConfig cfg = testConfig(dir);
    cfg.window_sec = 0.0;
    bool threw = false;
    try {
        MonitoringWorker worker(cfg, store, extractor, capture);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    cfg = testConfig(dir);
    cfg.threshold = 1.5f;
    threw = false;
    try {
        cfg.validate();
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    MonitoringWorker worker(testConfig(dir), store, extractor, capture);
    threw = false;
    try {
        worker.setThreshold(-0.1f);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
    assert(worker.threshold() == 0.75f);
}

// Chunks assembling exactly the enrolled sample identify the caller
static void testRecognizesEnrolledVoice() {
    ScopedTempDir dir("mom");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));
    store.enroll("Dad", wavOf(kDadLevels));

    ScriptedCaptureSource capture(splitChunks(segmentSignal(kMomLevels, kWindow), kChunk));
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);
    worker.start();
    assert(worker.isRunning());
    assert(capture.isOpen());

    assert(waitUntil([&] { return worker.stats().totalCalls() == 1; }));
    std::this_thread::sleep_for(milliseconds(100));
    worker.stop();
    assert(!capture.isOpen());
    assert(capture.closes == 1);

    std::vector<CallEvent> events = worker.results().drainAll();
    assert(events.size() == 1);
    assert(events[0].caller == "Mom");
    assert(events[0].status == CallStatus::Authorized);
    assert(events[0].confidence >= 0.75f);
    assert(std::fabs(events[0].confidence - 1.0f) < 1e-5f);

    // Ten chunks queued before the thread ran: nine shed, one analysis
    assert(worker.chunksReceived() == 10);
    assert(worker.analysesSkipped() == 9);
    SessionStats::Snapshot snap = worker.stats().snapshot();
    assert(snap.total_calls == 1 && snap.authorized_calls == 1 && snap.blocked_calls == 0);
}

static void testBlocksStranger() {
    ScopedTempDir dir("stranger");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));

    AudioChunk whole(segmentSignal(kHalfLevels, kWindow));
    ScriptedCaptureSource capture(std::vector<AudioChunk>{whole});
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);

    worker.start();
    assert(waitUntil([&] { return worker.stats().totalCalls() == 1; }));
    worker.stop();

    std::vector<CallEvent> events = worker.results().drainAll();
    assert(events.size() == 1);
    assert(events[0].status == CallStatus::Blocked);
    assert(events[0].caller == kUnknownCaller);
    assert(events[0].confidence > 0.6f && events[0].confidence < 0.75f);

    // Threshold change applies from the next analysis; counters carry over
    worker.setThreshold(0.5f);
    worker.start();
    assert(waitUntil([&] { return worker.stats().totalCalls() == 2; }));
    worker.stop();

    events = worker.results().drainAll();
    assert(events.size() == 1);
    assert(events[0].status == CallStatus::Authorized);
    assert(events[0].caller == "Mom");

    SessionStats::Snapshot snap = worker.stats().snapshot();
    assert(snap.total_calls == 2);
    assert(snap.authorized_calls == 1);
    assert(snap.blocked_calls == 1);
    assert(snap.blockRate() == 50.0);
    assert(capture.opens == 2 && capture.closes == 2);
}

// Sustained delivery faster than the hop interval
static void testLoadShedding() {
    ScopedTempDir dir("shed");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));
    const size_t enroll_calls = extractor.calls();

    MonitorConfig cfg = testConfig(dir);
    cfg.hop_sec = 0.1;
    FeederCaptureSource capture(AudioChunk(std::vector<float>(kChunk, 0.1f)), 200, std::chrono::microseconds(2000));
    MonitoringWorker worker(cfg, store, extractor, capture);

    worker.start();
    assert(waitUntil([&] { return capture.done(); }));
    assert(waitUntil([&] { return worker.pendingChunks() == 0; }));
    std::this_thread::sleep_for(milliseconds(150));
    worker.stop();

    const size_t received = worker.chunksReceived();
    const uint64_t analyses = worker.stats().totalCalls();
    assert(received == capture.pushed());
    assert(received == 200);
    assert(analyses >= 1);
    assert(analyses < received);
    assert(analyses == extractor.calls() - enroll_calls);
    assert(worker.analysesSkipped() > 0);
    assert(analyses + worker.analysesSkipped() + worker.errorsSkipped() == received);
    assert(worker.results().drainAll().size() == analyses);
}

// Failed iterations are skipped and the loop carries on
static void testSkipsFailures() {
    ScopedTempDir dir("failures");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));

    ScriptedCaptureSource capture;
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);
    ChunkSink sink = worker.sink();

    extractor.setFailing(true);
    worker.start();

    sink(AudioChunk(segmentSignal(kMomLevels, kWindow)));
    assert(waitUntil([&] { return worker.errorsSkipped() == 1; }));
    assert(worker.isRunning());

    AudioChunk malformed(std::vector<float>(10, 0.0f));
    malformed.frame_count = 20;
    sink(std::move(malformed));
    assert(waitUntil([&] { return worker.errorsSkipped() == 2; }));
    assert(worker.isRunning());
    assert(worker.stats().totalCalls() == 0);

    extractor.setFailing(false);
    sink(AudioChunk(segmentSignal(kMomLevels, kWindow)));
    assert(waitUntil([&] { return worker.stats().totalCalls() == 1; }));
    worker.stop();

    std::vector<CallEvent> events = worker.results().drainAll();
    assert(events.size() == 1);
    assert(events[0].caller == "Mom");
}

// Idle workers leave the queue alone; stale chunks are dropped on start
static void testIdleDoesNotConsume() {
    ScopedTempDir dir("idle");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));

    ScriptedCaptureSource capture;
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);
    ChunkSink sink = worker.sink();
    for (int i = 0; i < 3; ++i) {
        sink(AudioChunk(std::vector<float>(kChunk, 0.2f)));
    }
    std::this_thread::sleep_for(milliseconds(50));
    assert(worker.pendingChunks() == 3);
    assert(worker.chunksReceived() == 0);

    worker.start();
    assert(worker.pendingChunks() == 0);
    std::this_thread::sleep_for(milliseconds(50));
    worker.stop();
    assert(worker.chunksReceived() == 0);
    assert(worker.stats().totalCalls() == 0);

    // After stop, chunks pile up again untouched
    sink(AudioChunk(std::vector<float>(kChunk, 0.2f)));
    std::this_thread::sleep_for(milliseconds(50));
    assert(worker.pendingChunks() == 1);
}

// Voices enrolled while running are matched from the next analysis
static void testEnrollWhileRunning() {
    ScopedTempDir dir("live");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));

    ScriptedCaptureSource capture;
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);
    ChunkSink sink = worker.sink();
    worker.start();

    sink(AudioChunk(segmentSignal(kDadLevels, kWindow)));
    assert(waitUntil([&] { return worker.stats().totalCalls() == 1; }));

    store.enroll("Dad", wavOf(kDadLevels));
    std::vector<std::string> names = worker.referenceNames();
    assert(names.size() == 2 && names[1] == "Dad");

    sink(AudioChunk(segmentSignal(kDadLevels, kWindow)));
    assert(waitUntil([&] { return worker.stats().totalCalls() == 2; }));
    worker.stop();

    std::vector<CallEvent> events = worker.results().drainAll();
    assert(events.size() == 2);
    assert(events[0].caller == kUnknownCaller);
    assert(events[1].caller == "Dad");
    assert(events[1].authorized());
}

static void testRestart() {
    ScopedTempDir dir("restart");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));

    ScriptedCaptureSource capture(std::vector<AudioChunk>{AudioChunk(segmentSignal(kMomLevels, kWindow))});
    MonitoringWorker worker(testConfig(dir), store, extractor, capture);

    auto previous_start = worker.stats().startTime();
    for (int run = 1; run <= 3; ++run) {
        worker.start();
        worker.start();  // no-op while running
        assert(worker.isRunning());
        assert(waitUntil([&] { return worker.stats().totalCalls() == static_cast<uint64_t>(run); }));
        assert(worker.stats().startTime() >= previous_start);
        previous_start = worker.stats().startTime();
        worker.stop();
        worker.stop();
        assert(worker.state() == MonitoringWorker::State::Idle);
    }
    assert(capture.opens == 3);
    assert(worker.results().drainAll().size() == 3);
    assert(std::string(toString(MonitoringWorker::State::Idle)) == "Idle");
}

// Destroying a running worker stops it
static void testDestructorStops() {
    ScopedTempDir dir("dtor");
    SegmentMeanExtractor extractor;
    ReferenceStore store(extractor, storeOptions(dir));
    store.enroll("Mom", wavOf(kMomLevels));

    ScriptedCaptureSource capture;
    {
        MonitoringWorker worker(testConfig(dir), store, extractor, capture);
        worker.start();
    }
    assert(!capture.isOpen());
    assert(capture.closes == 1);
}

int main() {
    testStartWithoutVoices();
    testCaptureFailure();
    testInvalidConfig();
    testRecognizesEnrolledVoice();
    testBlocksStranger();
    testLoadShedding();
    testSkipsFailures();
    testIdleDoesNotConsume();
    testEnrollWhileRunning();
    testRestart();
    testDestructorStops();
    return 0;
}

#include "voiceguard/audio_file.hpp"
#include "voiceguard/errors.hpp"
#include "voiceguard/file_capture_source.hpp"
#include "voiceguard/matcher.hpp"
#include "voiceguard/monitor_config.hpp"
#include "voiceguard/monitoring_worker.hpp"
#include "voiceguard/onnx_embedding_extractor.hpp"
#include "voiceguard/portaudio_capture_source.hpp"
#include "voiceguard/reference_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace voiceguard;

std::atomic<bool> g_running(true);

void signalHandler(int signum) {
    g_running = false;

    // Restore default signal handler to allow force quit
    signal(signum, SIG_DFL);
}

struct Options {
    MonitorConfig monitor;
    std::string model_path = "models/speaker_embedding.onnx";
    int device_index = -1;
    std::string file;
    bool loop = false;
    double duration = 0.0;     // 0 = until Ctrl+C
    double record_seconds = 5.0;
    bool confirmed = false;

    std::string command;
    std::vector<std::string> args;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]" << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  monitor                   Screen live audio against enrolled voices (Ctrl+C to stop)" << std::endl;
    std::cout << "  enroll <name> <file>      Enroll a voice from an audio file" << std::endl;
    std::cout << "  record <name>             Record a sample from the microphone and enroll it" << std::endl;
    std::cout << "  identify <file>           Check a single clip against enrolled voices" << std::endl;
    std::cout << "  list                      Show enrolled voices" << std::endl;
    std::cout << "  remove <name>             Delete one enrolled voice" << std::endl;
    std::cout << "  clear --yes               Delete every enrolled voice" << std::endl;
    std::cout << "  devices                   List audio input devices" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --voices_dir <dir>        Enrolled voice samples (default: voices)" << std::endl;
    std::cout << "  --model <path>            Speaker embedding ONNX model (default: models/speaker_embedding.onnx)" << std::endl;
    std::cout << "  --threshold <val>         Similarity needed to authorize (default: 0.75)" << std::endl;
    std::cout << "  --window_sec <sec>        Audio analyzed per decision (default: 3.0)" << std::endl;
    std::cout << "  --hop_sec <sec>           Pause between decisions (default: 0.5)" << std::endl;
    std::cout << "  --history <n>             Calls kept in the recent history (default: 20)" << std::endl;
    std::cout << "  --device_index <index>    Audio input device (default: system default)" << std::endl;
    std::cout << "  --file <path>             Monitor an audio file instead of the microphone" << std::endl;
    std::cout << "  --loop                    Loop the --file input" << std::endl;
    std::cout << "  --duration <sec>          Stop monitoring after this long (default: until Ctrl+C)" << std::endl;
    std::cout << "  --seconds <sec>           Length of a recorded sample (default: 5)" << std::endl;
    std::cout << "  --yes                     Confirm destructive commands" << std::endl;
    std::cout << "  --help                    Show this help message" << std::endl;
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--voices_dir" && i + 1 < argc) {
            opts.monitor.voices_dir = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            opts.model_path = argv[++i];
        } else if (arg == "--threshold" && i + 1 < argc) {
            opts.monitor.threshold = std::stof(argv[++i]);
        } else if (arg == "--window_sec" && i + 1 < argc) {
            opts.monitor.window_sec = std::stod(argv[++i]);
        } else if (arg == "--hop_sec" && i + 1 < argc) {
            opts.monitor.hop_sec = std::stod(argv[++i]);
        } else if (arg == "--history" && i + 1 < argc) {
            opts.monitor.history_size = std::stoul(argv[++i]);
        } else if (arg == "--device_index" && i + 1 < argc) {
            opts.device_index = std::stoi(argv[++i]);
        } else if (arg == "--file" && i + 1 < argc) {
            opts.file = argv[++i];
        } else if (arg == "--loop") {
            opts.loop = true;
        } else if (arg == "--duration" && i + 1 < argc) {
            opts.duration = std::stod(argv[++i]);
        } else if (arg == "--seconds" && i + 1 < argc) {
            opts.record_seconds = std::stod(argv[++i]);
        } else if (arg == "--yes") {
            opts.confirmed = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    return !opts.command.empty();
}

bool expectArgs(const Options& opts, size_t count) {
    if (opts.args.size() != count) {
        std::cerr << "Error: '" << opts.command << "' takes " << count << " argument(s)" << std::endl;
        return false;
    }
    return true;
}

void printEvent(const CallEvent& event) {
    std::cout << (event.authorized() ? "[ALLOW] " : "[BLOCK] ") << describe(event) << std::endl;
}

void printStats(const SessionStats::Snapshot& stats) {
    std::cout << "\nSession Statistics:" << std::endl;
    std::cout << "  Started:    " << formatClock(stats.start_time) << std::endl;
    std::cout << "  Total:      " << stats.total_calls << std::endl;
    std::cout << "  Authorized: " << stats.authorized_calls << std::endl;
    std::cout << "  Blocked:    " << stats.blocked_calls << " (" << std::fixed << std::setprecision(1)
              << stats.blockRate() << "%)" << std::endl;
}

int runMonitor(const Options& opts, ReferenceStore& store, EmbeddingExtractor& extractor) {
    std::unique_ptr<CaptureSource> capture;
    FileCaptureSource* file_source = nullptr;
    if (!opts.file.empty()) {
        FileCaptureSource::Config cfg;
        cfg.path = opts.file;
        cfg.sample_rate = opts.monitor.sample_rate;
        cfg.loop = opts.loop;
        auto source = std::make_unique<FileCaptureSource>(cfg);
        file_source = source.get();
        capture = std::move(source);
    } else {
        PortAudioCaptureSource::Config cfg;
        cfg.device_index = opts.device_index;
        cfg.target_sample_rate = opts.monitor.sample_rate;
        capture = std::make_unique<PortAudioCaptureSource>(cfg);
    }

    MonitoringWorker worker(opts.monitor, store, extractor, *capture);
    CallHistory history(opts.monitor.history_size);

    worker.start();

    std::cout << "\n=== Live Call Screening ===" << std::endl;
    std::cout << "Known voices: " << worker.referenceNames().size() << std::endl;
    std::cout << "Threshold: " << worker.threshold() << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;
    std::cout << "===========================\n" << std::endl;

    const auto started = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::vector<CallEvent> events = worker.results().drainAll();
        for (const auto& event : events) {
            printEvent(event);
        }
        history.add(events);

        if (opts.duration > 0.0 &&
            std::chrono::steady_clock::now() - started >= std::chrono::duration<double>(opts.duration)) {
            break;
        }
        if (file_source && file_source->finished() && worker.pendingChunks() == 0) {
            break;
        }
    }

    worker.stop();

    std::vector<CallEvent> remaining = worker.results().drainAll();
    for (const auto& event : remaining) {
        printEvent(event);
    }
    history.add(remaining);

    printStats(worker.stats().snapshot());
    std::cout << "\nRecent calls (newest first):" << std::endl;
    for (const auto& event : history.recent()) {
        std::cout << "  " << describe(event) << std::endl;
    }
    return 0;
}

int runIdentify(const Options& opts, ReferenceStore& store, EmbeddingExtractor& extractor) {
    DecodedAudio clip = loadAudioFile(opts.args[0], opts.monitor.sample_rate);
    std::cout << "Analyzing " << opts.args[0] << " (" << std::fixed << std::setprecision(2)
              << static_cast<double>(clip.samples.size()) / opts.monitor.sample_rate << " s)..." << std::endl;

    std::vector<float> embedding = extractor.extract(clip.samples);
    MatchResult result = match(embedding, *store.snapshot(), opts.monitor.threshold);

    if (result.status == CallStatus::Authorized) {
        std::cout << "VOICE MATCH CONFIRMED: " << result.caller << " (" << std::setprecision(1)
                  << result.confidence * 100.0f << "%), call would be authorized" << std::endl;
    } else {
        std::cout << "UNKNOWN VOICE: best similarity " << std::setprecision(1) << result.confidence * 100.0f
                  << "%, call would be blocked" << std::endl;
    }
    return 0;
}

int runList(const ReferenceStore& store) {
    auto voices = store.snapshot();
    if (voices->empty()) {
        std::cout << "No voices enrolled in " << store.directory() << std::endl;
        return 0;
    }
    std::cout << std::left << std::setw(24) << "Name" << std::setw(14) << "Registered" << "Sample" << std::endl;
    for (const auto& voice : *voices) {
        std::cout << std::left << std::setw(24) << voice.name
                  << std::setw(14) << (voice.registered.empty() ? "-" : voice.registered)
                  << voice.file_name << std::endl;
    }
    return 0;
}

int runDevices() {
    for (const auto& dev : PortAudioCaptureSource::listDevices()) {
        std::cout << "Device " << dev.index << ": " << dev.name << " (inputs: " << dev.max_input_channels
                  << ", " << dev.default_sample_rate << " Hz)" << (dev.is_default ? " [default]" : "") << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;
    try {
        if (!parseArgs(argc, argv, opts)) {
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    if (opts.command == "help") {
        printUsage(argv[0]);
        return 0;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        opts.monitor.validate();

        if (opts.command == "devices") {
            return runDevices();
        }

        OnnxEmbeddingExtractor::Config model_cfg;
        model_cfg.model_path = opts.model_path;
        model_cfg.sample_rate = opts.monitor.sample_rate;
        OnnxEmbeddingExtractor extractor(model_cfg);

        ReferenceStore::Options store_opts;
        store_opts.directory = opts.monitor.voices_dir;
        store_opts.sample_rate = opts.monitor.sample_rate;
        ReferenceStore store(extractor, store_opts);

        ReferenceStore::LoadReport report = store.load();
        if (!report.ok()) {
            std::cerr << report.errors.size() << " voice sample(s) could not be loaded" << std::endl;
        }

        if (opts.command == "monitor") {
            return runMonitor(opts, store, extractor);
        } else if (opts.command == "list") {
            return runList(store);
        } else if (opts.command == "enroll") {
            if (!expectArgs(opts, 2)) return 1;
            store.enroll(opts.args[0], readFileBytes(opts.args[1]));
            std::cout << opts.args[0] << " registered successfully" << std::endl;
        } else if (opts.command == "record") {
            if (!expectArgs(opts, 1)) return 1;
            PortAudioCaptureSource::Config cfg;
            cfg.device_index = opts.device_index;
            cfg.target_sample_rate = opts.monitor.sample_rate;
            std::cout << "Recording " << opts.record_seconds << " s for " << opts.args[0] << ", speak now..." << std::endl;
            std::vector<float> samples = PortAudioCaptureSource::record(cfg, opts.record_seconds);
            store.enroll(opts.args[0], encodeWav(samples, opts.monitor.sample_rate));
            std::cout << opts.args[0] << " registered successfully" << std::endl;
        } else if (opts.command == "identify") {
            if (!expectArgs(opts, 1)) return 1;
            return runIdentify(opts, store, extractor);
        } else if (opts.command == "remove") {
            if (!expectArgs(opts, 1)) return 1;
            if (!store.remove(opts.args[0])) {
                std::cerr << "No voice named " << opts.args[0] << std::endl;
                return 1;
            }
        } else if (opts.command == "clear") {
            if (!opts.confirmed) {
                std::cerr << "Refusing to delete " << store.size() << " voice(s) without --yes" << std::endl;
                return 1;
            }
            size_t deleted = store.clear();
            std::cout << "Deleted " << deleted << " voice sample(s)" << std::endl;
        } else {
            std::cerr << "Unknown command: " << opts.command << std::endl;
            printUsage(argv[0]);
            return 1;
        }

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const CaptureError& e) {
        std::cerr << "Capture error: " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

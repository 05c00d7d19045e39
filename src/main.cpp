#include "asr/transcription_sink.hpp"
#include "asr/whisper_transcriber.hpp"
#include "audio/audio_capture.hpp"
#include "audio/capture_backend.hpp"
#include "config/config.hpp"
#include "pipeline/transcription_pipeline.hpp"
#include "storage/session_log.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace loopscribe;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

struct Args {
    bool list_devices = false;
    bool no_db = false;
    std::string config_path;
    AppConfig overrides;
};

static void print_usage() {
    std::cout << "loopscribe: live system/microphone audio to transcript JSON lines\n"
              << "  -l, --list-devices           List audio devices\n"
              << "  -d, --device <index>         Preferred input device index\n"
              << "  -o, --output-device <index>  Capture the loopback twin of this output device\n"
              << "      --sr <Hz>                Target sample rate (default 16000)\n"
              << "      --chunk-size <frames>    Frames per buffer (default 1024)\n"
              << "      --chunk-duration <s>     Transcription window length (default 3.0)\n"
              << "      --overlap <s>            Overlap between windows (default 0.5)\n"
              << "      --model <path>           Whisper model (default models/ggml-tiny.bin)\n"
              << "      --language <code>        Transcription language (default es)\n"
              << "      --threads <n>            Whisper threads (default 4)\n"
              << "      --db <path>              SQLite history path (default XDG)\n"
              << "      --no-db                  Do not record session history\n"
              << "      --config <path>          Config file (default XDG)\n";
}

static Args parse_args(int argc, char** argv) {
    Args a{};
    a.config_path = default_config_path();

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if      (s == "--list-devices" || s == "-l") a.list_devices = true;
        else if ((s == "--device" || s == "-d") && i + 1 < argc) a.overrides.input_device = std::stoi(argv[++i]);
        else if ((s == "--output-device" || s == "-o") && i + 1 < argc) a.overrides.output_device = std::stoi(argv[++i]);
        else if (s == "--sr" && i + 1 < argc) a.overrides.sample_rate = std::stoi(argv[++i]);
        else if (s == "--chunk-size" && i + 1 < argc) a.overrides.chunk_size = parse_chunk_size(argv[++i]);
        else if (s == "--chunk-duration" && i + 1 < argc) a.overrides.chunk_duration = std::stod(argv[++i]);
        else if (s == "--overlap" && i + 1 < argc) a.overrides.overlap_duration = std::stod(argv[++i]);
        else if (s == "--model" && i + 1 < argc) a.overrides.model_path = expand_path(argv[++i]);
        else if (s == "--language" && i + 1 < argc) a.overrides.language = argv[++i];
        else if (s == "--threads" && i + 1 < argc) a.overrides.threads = std::stoi(argv[++i]);
        else if (s == "--db" && i + 1 < argc) a.overrides.db_path = expand_path(argv[++i]);
        else if (s == "--no-db") a.no_db = true;
        else if (s == "--config" && i + 1 < argc) a.config_path = expand_path(argv[++i]);
        else if (s == "--help" || s == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Warning: ignoring unknown argument '" << s << "'\n";
        }
    }
    return a;
}

static std::string default_db_path() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/loopscribe/loopscribe.db";
    const char* home = std::getenv("HOME");
    return std::string(home ? home : ".") + "/.local/share/loopscribe/loopscribe.db";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Args args;
    Settings settings;
    try {
        args = parse_args(argc, argv);
        settings = resolve_settings(merge_config(load_config_file(args.config_path), args.overrides));
    } catch (const ConfigError& e) {
        std::cerr << "Error: configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::logic_error& e) { // std::sto* on a bad flag value
        std::cerr << "Error: invalid argument value (" << e.what() << ")\n";
        return 2;
    }

    try {
        auto capture = std::make_unique<AudioCapture>(makePlatformBackend());

        if (args.list_devices) {
            for (const auto& d : capture->listDevices()) std::cout << describeDevice(d) << "\n";
            return 0;
        }

        WhisperTranscriber::Config wcfg;
        wcfg.modelPath = settings.model_path;
        wcfg.language = settings.language;
        wcfg.threadCount = settings.threads;
        WhisperTranscriber whisper(wcfg);
        if (!whisper.init()) {
            return 1;
        }

        std::unique_ptr<SessionLog> history;
        if (!args.no_db) {
            history = std::make_unique<SessionLog>(settings.db_path.value_or(default_db_path()));
        }

        TranscriptionPipeline::Config pcfg;
        pcfg.chunkDuration = settings.chunk_duration;
        pcfg.overlapDuration = settings.overlap_duration;
        pcfg.sampleRate = settings.sample_rate;
        pcfg.blockGate = settings.block_gate;
        TranscriptionPipeline pipeline(capture->deliveryQueue(), whisper, pcfg);

        CaptureOptions opts;
        opts.sampleRate = settings.sample_rate;
        opts.chunkSize = settings.chunk_size;
        opts.inputDevice = settings.input_device;
        opts.outputDevice = settings.output_device;
        opts.stopTimeout = settings.stop_timeout;

        CaptureResult started = capture->startCapture(opts);
        if (started.failed()) {
            std::cout << statusMessage(false, started.message, 0, 0).dump() << std::endl;
            return 1;
        }

        std::optional<std::int64_t> session_id;
        if (history) {
            if (auto s = capture->session()) {
                session_id = history->startSession({capture->backend().name(), s->device.name,
                                                    s->deviceSampleRate, s->targetSampleRate});
            }
        }

        std::mutex out_mutex;
        pipeline.setTranscriptCallback([&](const TranscriptRecord& record) {
            {
                std::lock_guard<std::mutex> lock(out_mutex);
                std::cout << transportMessage(record).dump() << std::endl;
            }
            if (history && session_id) {
                try {
                    history->logTranscript(*session_id, record);
                } catch (const std::runtime_error& e) {
                    std::cerr << "Warning: " << e.what() << "\n";
                }
            }
        });

        std::cout << statusMessage(true, started.message, capture->bufferSize(), 0).dump() << std::endl;
        pipeline.start();

        while (!g_stop.load() && capture->isCapturing()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "Stopping…\n";
        CaptureResult stopped = capture->stop();
        pipeline.stop();

        if (history && session_id) history->endSession(*session_id);

        const CaptureStats cs = capture->stats();
        const TranscriptionPipeline::Stats ps = pipeline.stats();
        std::cout << "Blocks: " << cs.blocksDelivered << " delivered, " << ps.blocksGated << " below gate, "
                  << cs.callbackFaults << " faults, " << cs.resampleDegradations << " degraded, "
                  << cs.inputOverflows << " overflows; windows: " << ps.windowsTranscribed
                  << ", transcripts: " << ps.transcriptsQueued << "\n";
        std::cout << statusMessage(false, stopped.message, capture->bufferSize(),
                                   pipeline.pendingTranscripts()).dump() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

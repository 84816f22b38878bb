#include "chunkscribe/http_transcription_client.hpp"
#include "chunkscribe/log.hpp"
#include "chunkscribe/portaudio_source.hpp"
#include "chunkscribe/session_config.hpp"
#include "chunkscribe/session_controller.hpp"
#include "chunkscribe/transcript_writer.hpp"
#include "chunkscribe/wav_file_source.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <utility>
#include <vector>

using namespace chunkscribe;

std::atomic<bool> g_running(true);

void signalHandler(int signum) {
    g_running = false;

    // Restore default signal handler to allow force quit
    signal(signum, SIG_DFL);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --device_index <index>      Audio device index (default: system default)" << std::endl;
    std::cout << "  --list_devices              List audio input devices and exit" << std::endl;
    std::cout << "  --input_file <path>         Transcribe a sound file instead of the microphone" << std::endl;
    std::cout << "  --realtime                  Replay --input_file at capture speed" << std::endl;
    std::cout << "  --sample_rate <rate>        Sample rate (default: 16000)" << std::endl;
    std::cout << "  --frames_per_buffer <n>     Samples per frame (default: 1024)" << std::endl;
    std::cout << "  --calibration_frames <n>    Noise calibration frames (default: 50)" << std::endl;
    std::cout << "  --trigger_frames <n>        Consecutive speech frames to start a chunk (default: 3)" << std::endl;
    std::cout << "  --pre_roll_frames <n>       Frames kept before speech onset (default: 5)" << std::endl;
    std::cout << "  --silence_duration <sec>    Silence that ends a chunk (default: 2.5)" << std::endl;
    std::cout << "  --overlap_duration <sec>    Audio repeated at the start of the next chunk (default: 0.2)" << std::endl;
    std::cout << "  --min_speech <sec>          Shorter chunks are discarded (default: 0.5)" << std::endl;
    std::cout << "  --max_chunk_duration <sec>  Force a chunk boundary after this long, 0 = off (default: 0)" << std::endl;
    std::cout << "  --no_chunking               Record the whole session and transcribe it once" << std::endl;
    std::cout << "  --max_duration <sec>        Maximum session duration, 0 = unlimited (default: 300)" << std::endl;
    std::cout << "  --provider <name>           elevenlabs or openai (default: elevenlabs)" << std::endl;
    std::cout << "  --model <id>                Transcription model (default: provider specific)" << std::endl;
    std::cout << "  --language <code>           Language hint, e.g. en (default: auto)" << std::endl;
    std::cout << "  --api_url <url>             Override the transcription endpoint" << std::endl;
    std::cout << "  --timeout <sec>             Per-request timeout (default: 30)" << std::endl;
    std::cout << "  --queue_depth <n>           Chunks waiting for transcription (default: 2)" << std::endl;
    std::cout << "  --env_file <path>           Settings file (default: .env)" << std::endl;
    std::cout << "  --transcript_dir <dir>      Append the transcript to a timestamped file in <dir>" << std::endl;
    std::cout << "  --save_chunks <dir>         Save every chunk as a WAV file" << std::endl;
    std::cout << "  --log_level <level>         debug, info, warning or error (default: info)" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
}

void listDevices() {
    std::vector<InputDeviceInfo> devices = PortAudioSource::listInputDevices();
    std::cout << "Audio input devices:" << std::endl;
    for (const auto& d : devices) {
        std::cout << "  [" << d.index << "] " << d.name << " (" << d.max_input_channels << " ch, "
                  << d.default_sample_rate << " Hz)" << (d.is_default ? " [default]" : "") << std::endl;
    }
    if (devices.empty()) {
        std::cout << "  (none)" << std::endl;
    }
}

// Applies one command line option; returns false for unknown options
bool applyOption(const std::string& name, const std::string& value, SessionConfig& config) {
    if (name == "--device_index") {
        config.audio.device_index = std::stoi(value);
    } else if (name == "--input_file") {
        config.input_file = value;
    } else if (name == "--sample_rate") {
        config.audio.sample_rate = std::stoi(value);
    } else if (name == "--frames_per_buffer") {
        config.audio.frames_per_buffer = std::stoi(value);
    } else if (name == "--calibration_frames") {
        config.vad.calibration_frames = std::stoi(value);
    } else if (name == "--trigger_frames") {
        config.segmenter.speech_trigger_frames = std::stoi(value);
    } else if (name == "--pre_roll_frames") {
        config.segmenter.pre_roll_frames = std::stoi(value);
    } else if (name == "--silence_duration") {
        config.segmenter.silence_duration = std::stod(value);
    } else if (name == "--overlap_duration") {
        config.segmenter.overlap_duration = std::stod(value);
    } else if (name == "--min_speech") {
        config.segmenter.min_speech_duration = std::stod(value);
    } else if (name == "--max_chunk_duration") {
        config.segmenter.max_chunk_duration = std::stod(value);
    } else if (name == "--max_duration") {
        config.max_session_duration = std::stod(value);
    } else if (name == "--provider") {
        if (!parseProvider(value, config.transcription.provider)) {
            throw ConfigError("Unknown provider \"" + value + "\" (expected elevenlabs or openai)");
        }
    } else if (name == "--model") {
        config.transcription.model = value;
    } else if (name == "--language") {
        config.transcription.language = value;
    } else if (name == "--api_url") {
        config.transcription.api_url = value;
    } else if (name == "--timeout") {
        config.transcription.timeout_seconds = std::stod(value);
    } else if (name == "--queue_depth") {
        config.queue_depth = std::stoul(value);
    } else if (name == "--transcript_dir") {
        config.transcript_dir = value;
    } else if (name == "--save_chunks") {
        config.chunk_dump_dir = value;
    } else {
        return false;
    }
    return true;
}

void printStatistics(const SessionStats& stats) {
    std::cout << "\nSession Statistics:" << std::endl;
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  Audio captured:      " << stats.audio_seconds << " s (" << stats.frames << " frames)" << std::endl;
    std::cout << std::setprecision(4);
    std::cout << "  Noise floor:         " << stats.noise_floor << std::endl;
    std::cout << "  Silence threshold:   " << stats.threshold << std::endl;
    std::cout << "  Chunks committed:    " << stats.chunks_committed << std::endl;
    std::cout << "  Chunks discarded:    " << stats.chunks_discarded << " (too short)" << std::endl;
    std::cout << "  Chunks dropped:      " << stats.chunks_dropped << " (queue full)" << std::endl;
    std::cout << "  Chunks transcribed:  " << stats.chunks_transcribed << std::endl;
    std::cout << "  Chunks failed:       " << stats.chunks_failed << std::endl;
}

int main(int argc, char* argv[]) {
    std::string env_file = ".env";
    bool list_devices = false;
    bool realtime = false;
    bool chunked = true;
    std::vector<std::pair<std::string, std::string>> options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--list_devices") {
            list_devices = true;
        } else if (arg == "--realtime") {
            realtime = true;
        } else if (arg == "--no_chunking") {
            chunked = false;
        } else if (arg == "--env_file" && i + 1 < argc) {
            env_file = argv[++i];
        } else if (arg == "--log_level" && i + 1 < argc) {
            LogLevel level;
            if (!parseLogLevel(argv[++i], level)) {
                std::cerr << "Unknown log level: " << argv[i] << std::endl;
                return 1;
            }
            setLogLevel(level);
        } else if (arg.compare(0, 2, "--") == 0 && i + 1 < argc) {
            options.emplace_back(arg, argv[++i]);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        if (list_devices) {
            listDevices();
            return 0;
        }

        // Defaults < .env < environment < command line
        SessionConfig config;
        if (!loadConfigFromEnv(env_file, config)) {
            logDebug("Config", "No settings file at " + env_file);
        }
        applyEnvironment(config);
        for (const auto& option : options) {
            try {
                if (!applyOption(option.first, option.second, config)) {
                    std::cerr << "Unknown option: " << option.first << std::endl;
                    printUsage(argv[0]);
                    return 1;
                }
            } catch (const std::logic_error&) {
                throw ConfigError("Invalid value for " + option.first + ": " + option.second);
            }
        }
        config.realtime_file = realtime;
        if (!chunked) {
            config.chunked = false;
        }
        validateConfig(config);

        auto client = std::make_shared<HttpTranscriptionClient>(resolveTranscriptionConfig(config));

        std::unique_ptr<AudioSource> source;
        if (!config.input_file.empty()) {
            source = std::make_unique<WavFileSource>(config.input_file, config.realtime_file);
        } else {
            source = std::make_unique<PortAudioSource>();
        }

        std::unique_ptr<TranscriptWriter> writer;
        if (!config.transcript_dir.empty()) {
            writer = std::make_unique<TranscriptWriter>(config.transcript_dir);
        }

        SessionController session(config, std::move(source), client, [&](const SessionEvent& event) {
            switch (event.type) {
                case SessionEvent::Type::TranscriptionSucceeded:
                    if (!event.new_text.empty()) {
                        std::cout << event.new_text << std::flush;
                        if (writer) {
                            writer->append(event.new_text);
                        }
                    }
                    break;
                case SessionEvent::Type::TranscriptionFailed:
                    std::cerr << "\n[Chunk " << event.chunk_index << "] transcription failed ("
                              << toString(event.error_kind) << "): " << event.error_message << std::endl;
                    break;
                case SessionEvent::Type::ChunkDropped:
                    std::cerr << "\n[Chunk " << event.chunk_index << "] dropped, transcription is falling behind"
                              << std::endl;
                    break;
                case SessionEvent::Type::CaptureFailed:
                    std::cerr << "\nAudio capture failed: " << event.error_message << std::endl;
                    break;
                default:
                    break;
            }
        });

        // Set up signal handlers
        signal(SIGINT, signalHandler);   // Ctrl+C
        signal(SIGTERM, signalHandler);  // Termination

        session.start();

        std::cout << "\n=== chunkscribe ===" << std::endl;
        if (config.chunked) {
            std::cout << "Silence to end a chunk: " << config.segmenter.silence_duration << "s" << std::endl;
        } else {
            std::cout << "Single recording, transcribed when the session ends" << std::endl;
        }
        if (config.max_session_duration > 0.0) {
            std::cout << "Max duration: " << config.max_session_duration << "s" << std::endl;
        }
        std::cout << "Press Ctrl+C to stop" << std::endl;
        std::cout << "===================\n" << std::endl;

        while (g_running && !session.waitUntilFinished(std::chrono::milliseconds(100))) {
        }

        std::string transcript = session.stop();

        std::cout << "\n\n=== Transcript ===" << std::endl;
        std::cout << (transcript.empty() ? "(nothing transcribed)" : transcript) << std::endl;
        printStatistics(session.stats());
        if (writer && !writer->path().empty()) {
            std::cout << "  Transcript file:     " << writer->path() << std::endl;
        }

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const TranscriptionError& e) {
        std::cerr << "Transcription error: " << e.what() << std::endl;
        if (e.kind() == TranscriptionErrorKind::NotConfigured) {
            std::cerr << "Set the API key in " << env_file << " or the environment" << std::endl;
            return 2;
        }
        return 1;
    } catch (const AudioDeviceError& e) {
        std::cerr << "Audio device error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

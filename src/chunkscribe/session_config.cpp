#include "chunkscribe/session_config.hpp"
#include "chunkscribe/log.hpp"

#include <cstdlib>
#include <fstream>

namespace chunkscribe {

namespace {
    const char* const kKeys[] = {
        "ELEVENLABS_API_KEY",
        "OPENAI_API_KEY",
        "API_KEY",
        "API_URL",
        "CHUNKSCRIBE_PROVIDER",
        "CHUNKSCRIBE_MODEL",
        "CHUNKSCRIBE_LANGUAGE",
        "CHUNKSCRIBE_SILENCE_DURATION",
        "CHUNKSCRIBE_TRANSCRIPT_DIR",
        "CHUNKSCRIBE_CHUNKED",
    };

    std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    bool parseFlag(const std::string& key, const std::string& value) {
        if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
        if (value == "0" || value == "false" || value == "no" || value == "off") return false;
        throw ConfigError(key + ": expected true or false, got \"" + value + "\"");
    }

    double parseSeconds(const std::string& key, const std::string& value) {
        try {
            size_t used = 0;
            double v = std::stod(value, &used);
            if (used != value.size()) {
                throw ConfigError(key + ": trailing characters in \"" + value + "\"");
            }
            return v;
        } catch (const std::invalid_argument&) {
            throw ConfigError(key + ": not a number: \"" + value + "\"");
        } catch (const std::out_of_range&) {
            throw ConfigError(key + ": out of range: \"" + value + "\"");
        }
    }
}

bool applySetting(const std::string& key, const std::string& value, SessionConfig& config) {
    if (key == "ELEVENLABS_API_KEY") {
        config.elevenlabs_api_key = value;
    } else if (key == "OPENAI_API_KEY") {
        config.openai_api_key = value;
    } else if (key == "API_KEY") {
        config.transcription.api_key = value;
    } else if (key == "API_URL") {
        config.transcription.api_url = value;
    } else if (key == "CHUNKSCRIBE_PROVIDER") {
        if (!parseProvider(value, config.transcription.provider)) {
            throw ConfigError("Unknown provider \"" + value + "\" (expected elevenlabs or openai)");
        }
    } else if (key == "CHUNKSCRIBE_MODEL") {
        config.transcription.model = value;
    } else if (key == "CHUNKSCRIBE_LANGUAGE") {
        config.transcription.language = value;
    } else if (key == "CHUNKSCRIBE_SILENCE_DURATION") {
        config.segmenter.silence_duration = parseSeconds(key, value);
    } else if (key == "CHUNKSCRIBE_TRANSCRIPT_DIR") {
        config.transcript_dir = value;
    } else if (key == "CHUNKSCRIBE_CHUNKED") {
        config.chunked = parseFlag(key, value);
    } else {
        return false;
    }
    return true;
}

bool loadConfigFromEnv(const std::string& env_file, SessionConfig& config) {
    std::ifstream file(env_file);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        if (line.compare(0, 7, "export ") == 0) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            logWarning("Config", env_file + ":" + std::to_string(line_number) + ": ignoring line without '='");
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (!applySetting(key, value, config)) {
            logDebug("Config", env_file + ": ignoring unknown key " + key);
        }
    }

    logInfo("Config", "Loaded settings from " + env_file);
    return true;
}

void applyEnvironment(SessionConfig& config) {
    applyEnvironment(config, [](const char* name) { return std::getenv(name); });
}

void applyEnvironment(SessionConfig& config, const std::function<const char*(const char*)>& getenv_fn) {
    for (const char* key : kKeys) {
        const char* value = getenv_fn(key);
        if (value && *value) {
            applySetting(key, value, config);
        }
    }
}

TranscriptionConfig resolveTranscriptionConfig(const SessionConfig& config) {
    TranscriptionConfig resolved = config.transcription;
    const std::string& specific = config.transcription.provider == TranscriptionProvider::ElevenLabs
                                      ? config.elevenlabs_api_key
                                      : config.openai_api_key;
    if (!specific.empty()) {
        resolved.api_key = specific;
    }
    return resolved;
}

void validateConfig(const SessionConfig& config) {
    const AudioFormat& audio = config.audio;
    if (audio.sample_rate <= 0) {
        throw ConfigError("sample_rate must be positive");
    }
    if (audio.frames_per_buffer <= 0) {
        throw ConfigError("frames_per_buffer must be positive");
    }
    if (audio.channels < 1 || audio.channels > 2) {
        throw ConfigError("channels must be 1 or 2");
    }

    const ChunkSegmenter::Config& seg = config.segmenter;
    if (seg.speech_trigger_frames < 1) {
        throw ConfigError("trigger_frames must be at least 1");
    }
    if (seg.pre_roll_frames < 0) {
        throw ConfigError("pre_roll_frames must not be negative");
    }
    if (seg.silence_duration <= 0.0) {
        throw ConfigError("silence_duration must be positive");
    }
    if (seg.overlap_duration < 0.0 || seg.min_speech_duration < 0.0 || seg.max_chunk_duration < 0.0) {
        throw ConfigError("durations must not be negative");
    }
    if (seg.max_chunk_duration > 0.0 && seg.max_chunk_duration < seg.min_speech_duration) {
        throw ConfigError("max_chunk_duration must not be shorter than min_speech");
    }

    const VoiceActivityDetector::Config& vad = config.vad;
    if (vad.calibration_frames < 0) {
        throw ConfigError("calibration_frames must not be negative");
    }
    if (vad.min_threshold > vad.max_threshold) {
        throw ConfigError("VAD min_threshold exceeds max_threshold");
    }

    if (config.transcription.timeout_seconds <= 0.0) {
        throw ConfigError("timeout must be positive");
    }
    if (config.queue_depth < 1) {
        throw ConfigError("queue_depth must be at least 1");
    }
    if (config.stop_timeout < 0.0 || config.max_session_duration < 0.0) {
        throw ConfigError("session timeouts must not be negative");
    }
}

} // namespace chunkscribe

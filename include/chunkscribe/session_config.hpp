#ifndef CHUNKSCRIBE_SESSION_CONFIG_HPP
#define CHUNKSCRIBE_SESSION_CONFIG_HPP

#include "chunkscribe/audio_source.hpp"
#include "chunkscribe/chunk_segmenter.hpp"
#include "chunkscribe/http_transcription_client.hpp"
#include "chunkscribe/voice_activity_detector.hpp"

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

namespace chunkscribe {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct SessionConfig {
    AudioFormat audio;
    VoiceActivityDetector::Config vad;
    ChunkSegmenter::Config segmenter;
    TranscriptionConfig transcription;    // api_key here is the provider-neutral API_KEY
    std::string elevenlabs_api_key;
    std::string openai_api_key;

    bool chunked = true;                  // false = one transcription for the whole session
    size_t queue_depth = 2;
    double stop_timeout = 5.0;            // Seconds stop() waits for the last transcription
    double max_session_duration = 300.0;  // 0 = unlimited

    std::string transcript_dir;           // Empty = no transcript file
    std::string chunk_dump_dir;           // Empty = chunks are not saved
    std::string input_file;               // Empty = live capture
    bool realtime_file = false;           // Pace file input at capture speed
};

// Applies one KEY=VALUE setting; returns false for unknown keys
bool applySetting(const std::string& key, const std::string& value, SessionConfig& config);

// Loads a .env file (KEY=VALUE, # comments, optional quotes).
// Returns false if the file does not exist; throws ConfigError on bad values.
bool loadConfigFromEnv(const std::string& env_file, SessionConfig& config);

// Overrides from process environment variables with the same names
void applyEnvironment(SessionConfig& config);
void applyEnvironment(SessionConfig& config, const std::function<const char*(const char*)>& getenv_fn);

// Transcription settings with the key for the selected provider filled in
TranscriptionConfig resolveTranscriptionConfig(const SessionConfig& config);

// Throws ConfigError on impossible values
void validateConfig(const SessionConfig& config);

} // namespace chunkscribe

#endif // CHUNKSCRIBE_SESSION_CONFIG_HPP

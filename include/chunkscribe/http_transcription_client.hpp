#ifndef CHUNKSCRIBE_HTTP_TRANSCRIPTION_CLIENT_HPP
#define CHUNKSCRIBE_HTTP_TRANSCRIPTION_CLIENT_HPP

#include "chunkscribe/transcription_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace chunkscribe {

enum class TranscriptionProvider {
    ElevenLabs,
    OpenAI
};

const char* toString(TranscriptionProvider provider);
bool parseProvider(const std::string& name, TranscriptionProvider& provider);

struct TranscriptionConfig {
    TranscriptionProvider provider = TranscriptionProvider::ElevenLabs;
    std::string api_key;
    std::string api_url;        // Empty = provider default
    std::string model;          // Empty = provider default
    std::string language;       // Empty = auto-detect
    double timeout_seconds = 30.0;
    bool tag_audio_events = false;
};

std::string defaultApiUrl(TranscriptionProvider provider);
std::string defaultModel(TranscriptionProvider provider);

// HTTP status -> failure kind (401/403 auth, everything else server)
TranscriptionErrorKind errorKindForHttpStatus(long status);

// Extracts "text" from a response body; throws TranscriptionError(InvalidResponse)
std::string parseTranscriptionResponse(const std::string& body);

/**
 * Hosted speech-to-text over HTTPS (libcurl multipart upload).
 *
 * One request per chunk, synchronous. Safe to call from one thread at a time.
 */
class HttpTranscriptionClient : public TranscriptionClient {
public:
    explicit HttpTranscriptionClient(const TranscriptionConfig& config);
    ~HttpTranscriptionClient() override;

    std::string transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) override;
    std::string describe() const override;

    bool isConfigured() const override;
    const TranscriptionConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_HTTP_TRANSCRIPTION_CLIENT_HPP

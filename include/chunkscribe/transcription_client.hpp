#ifndef CHUNKSCRIBE_TRANSCRIPTION_CLIENT_HPP
#define CHUNKSCRIBE_TRANSCRIPTION_CLIENT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkscribe {

enum class TranscriptionErrorKind {
    Timeout,
    Auth,
    Server,
    Network,
    InvalidResponse,
    NotConfigured
};

const char* toString(TranscriptionErrorKind kind);

// One chunk could not be transcribed; never fatal to the session
class TranscriptionError : public std::runtime_error {
public:
    TranscriptionError(TranscriptionErrorKind kind, const std::string& message, long http_status = 0);

    TranscriptionErrorKind kind() const { return kind_; }
    long httpStatus() const { return http_status_; }

private:
    TranscriptionErrorKind kind_;
    long http_status_;
};

// Speech-to-text backend. transcribe() blocks, bounded by the backend's timeout.
class TranscriptionClient {
public:
    virtual ~TranscriptionClient() = default;

    // wav is a complete PCM16 WAV blob; an empty language_hint means auto-detect.
    // Throws TranscriptionError.
    virtual std::string transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) = 0;

    // For display, e.g. "ElevenLabs (scribe_v1)"
    virtual std::string describe() const = 0;

    // False when a request is certain to fail, e.g. no credentials
    virtual bool isConfigured() const { return true; }
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_TRANSCRIPTION_CLIENT_HPP

#include "chunkscribe/transcription_client.hpp"

namespace chunkscribe {

const char* toString(TranscriptionErrorKind kind) {
    switch (kind) {
        case TranscriptionErrorKind::Timeout: return "timeout";
        case TranscriptionErrorKind::Auth: return "auth";
        case TranscriptionErrorKind::Server: return "server";
        case TranscriptionErrorKind::Network: return "network";
        case TranscriptionErrorKind::InvalidResponse: return "invalid_response";
        case TranscriptionErrorKind::NotConfigured: return "not_configured";
    }
    return "unknown";
}

TranscriptionError::TranscriptionError(TranscriptionErrorKind kind, const std::string& message, long http_status)
    : std::runtime_error(message), kind_(kind), http_status_(http_status) {
}

} // namespace chunkscribe

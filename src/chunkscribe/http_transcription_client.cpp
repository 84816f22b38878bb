#include "chunkscribe/http_transcription_client.hpp"
#include "chunkscribe/log.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace chunkscribe {

using json = nlohmann::json;

namespace {
    std::once_flag curl_init_flag;

    size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        auto* str = static_cast<std::string*>(userp);
        str->append(static_cast<char*>(contents), size * nmemb);
        return size * nmemb;
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // Best-effort error text from a non-2xx body
    std::string errorDetail(const std::string& body) {
        json j = json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return body.substr(0, 200);
        }
        if (j.contains("detail")) {
            const auto& detail = j["detail"];
            if (detail.is_string()) return detail.get<std::string>();
            if (detail.is_object() && detail.contains("message") && detail["message"].is_string()) {
                return detail["message"].get<std::string>();
            }
        }
        if (j.contains("error") && j["error"].is_object() && j["error"].contains("message") &&
            j["error"]["message"].is_string()) {
            return j["error"]["message"].get<std::string>();
        }
        return j.dump().substr(0, 200);
    }
}

const char* toString(TranscriptionProvider provider) {
    switch (provider) {
        case TranscriptionProvider::ElevenLabs: return "elevenlabs";
        case TranscriptionProvider::OpenAI: return "openai";
    }
    return "unknown";
}

bool parseProvider(const std::string& name, TranscriptionProvider& provider) {
    const std::string lower = toLower(name);
    if (lower == "elevenlabs") {
        provider = TranscriptionProvider::ElevenLabs;
        return true;
    }
    if (lower == "openai") {
        provider = TranscriptionProvider::OpenAI;
        return true;
    }
    return false;
}

std::string defaultApiUrl(TranscriptionProvider provider) {
    switch (provider) {
        case TranscriptionProvider::ElevenLabs: return "https://api.elevenlabs.io/v1/speech-to-text";
        case TranscriptionProvider::OpenAI: return "https://api.openai.com/v1/audio/transcriptions";
    }
    return "";
}

std::string defaultModel(TranscriptionProvider provider) {
    switch (provider) {
        case TranscriptionProvider::ElevenLabs: return "scribe_v1";
        case TranscriptionProvider::OpenAI: return "whisper-1";
    }
    return "";
}

TranscriptionErrorKind errorKindForHttpStatus(long status) {
    if (status == 401 || status == 403) {
        return TranscriptionErrorKind::Auth;
    }
    return TranscriptionErrorKind::Server;
}

std::string parseTranscriptionResponse(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw TranscriptionError(TranscriptionErrorKind::InvalidResponse,
                                 std::string("Response is not JSON: ") + e.what());
    }

    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        throw TranscriptionError(TranscriptionErrorKind::InvalidResponse, "Response has no \"text\" field");
    }
    return j["text"].get<std::string>();
}

class HttpTranscriptionClient::Impl {
public:
    TranscriptionConfig config;
    std::string url;
    std::string model;
    std::mutex mutex;

    explicit Impl(const TranscriptionConfig& c) : config(c) {
        url = config.api_url.empty() ? defaultApiUrl(config.provider) : config.api_url;
        model = config.model.empty() ? defaultModel(config.provider) : config.model;
    }

    std::string providerName() const {
        return config.provider == TranscriptionProvider::ElevenLabs ? "ElevenLabs" : "OpenAI";
    }

    curl_slist* buildHeaders() const {
        curl_slist* headers = nullptr;
        if (config.provider == TranscriptionProvider::ElevenLabs) {
            headers = curl_slist_append(headers, ("xi-api-key: " + config.api_key).c_str());
        } else {
            headers = curl_slist_append(headers, ("Authorization: Bearer " + config.api_key).c_str());
        }
        headers = curl_slist_append(headers, "Accept: application/json");
        return headers;
    }

    static void addField(curl_mime* mime, const char* name, const std::string& value) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, name);
        curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
    }

    curl_mime* buildForm(CURL* curl, const std::vector<uint8_t>& wav, const std::string& language) const {
        curl_mime* mime = curl_mime_init(curl);

        curl_mimepart* file = curl_mime_addpart(mime);
        curl_mime_name(file, "file");
        curl_mime_data(file, reinterpret_cast<const char*>(wav.data()), wav.size());
        curl_mime_filename(file, "chunk.wav");
        curl_mime_type(file, "audio/wav");

        if (config.provider == TranscriptionProvider::ElevenLabs) {
            addField(mime, "model_id", model);
            if (!language.empty()) addField(mime, "language_code", language);
            addField(mime, "tag_audio_events", config.tag_audio_events ? "true" : "false");
        } else {
            addField(mime, "model", model);
            if (!language.empty()) addField(mime, "language", language);
            addField(mime, "response_format", "json");
        }
        return mime;
    }
};

HttpTranscriptionClient::HttpTranscriptionClient(const TranscriptionConfig& config)
    : impl(std::make_unique<Impl>(config)) {
    std::call_once(curl_init_flag, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

HttpTranscriptionClient::~HttpTranscriptionClient() = default;

bool HttpTranscriptionClient::isConfigured() const {
    return !impl->config.api_key.empty() && !impl->url.empty();
}

const TranscriptionConfig& HttpTranscriptionClient::config() const {
    return impl->config;
}

std::string HttpTranscriptionClient::describe() const {
    return impl->providerName() + " (" + impl->model + ")";
}

std::string HttpTranscriptionClient::transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) {
    std::lock_guard<std::mutex> lock(impl->mutex);

    if (!isConfigured()) {
        throw TranscriptionError(TranscriptionErrorKind::NotConfigured,
                                 std::string("No API key configured for ") + toString(impl->config.provider));
    }

    const std::string language = language_hint.empty() ? impl->config.language : language_hint;

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TranscriptionError(TranscriptionErrorKind::Network, "Failed to initialize cURL");
    }

    curl_slist* headers = impl->buildHeaders();
    curl_mime* form = impl->buildForm(curl, wav, language);
    std::string response_body;

    const long timeout_ms = static_cast<long>(impl->config.timeout_seconds * 1000.0);
    curl_easy_setopt(curl, CURLOPT_URL, impl->url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, form);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, 10000L));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

    const char* https_proxy = std::getenv("https_proxy");
    if (!https_proxy) https_proxy = std::getenv("HTTPS_PROXY");
    if (https_proxy) {
        curl_easy_setopt(curl, CURLOPT_PROXY, https_proxy);
    }

    CURLcode res = curl_easy_perform(curl);
    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);

    curl_mime_free(form);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TranscriptionError(TranscriptionErrorKind::Timeout,
                                 "Request timed out after " + std::to_string(impl->config.timeout_seconds) + " s");
    }
    if (res != CURLE_OK) {
        throw TranscriptionError(TranscriptionErrorKind::Network, std::string("cURL error: ") + curl_easy_strerror(res));
    }
    if (response_code < 200 || response_code >= 300) {
        throw TranscriptionError(errorKindForHttpStatus(response_code),
                                 "HTTP " + std::to_string(response_code) + ": " + errorDetail(response_body),
                                 response_code);
    }

    logDebug("API", "HTTP " + std::to_string(response_code) + ", " + std::to_string(response_body.size()) + " bytes");
    return parseTranscriptionResponse(response_body);
}

} // namespace chunkscribe

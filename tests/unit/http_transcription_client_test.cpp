#include "chunkscribe/http_transcription_client.hpp"
#include "chunkscribe/wav_encoder.hpp"

#include <gtest/gtest.h>

using namespace chunkscribe;

TEST(HttpTranscriptionClientTest, StatusCodesMapToErrorKinds) {
    EXPECT_EQ(errorKindForHttpStatus(401), TranscriptionErrorKind::Auth);
    EXPECT_EQ(errorKindForHttpStatus(403), TranscriptionErrorKind::Auth);
    EXPECT_EQ(errorKindForHttpStatus(400), TranscriptionErrorKind::Server);
    EXPECT_EQ(errorKindForHttpStatus(429), TranscriptionErrorKind::Server);
    EXPECT_EQ(errorKindForHttpStatus(503), TranscriptionErrorKind::Server);
}

TEST(HttpTranscriptionClientTest, ParsesTextField) {
    EXPECT_EQ(parseTranscriptionResponse(R"({"text": "hello there", "language_code": "en"})"), "hello there");
    EXPECT_EQ(parseTranscriptionResponse(R"({"text": ""})"), "");
}

TEST(HttpTranscriptionClientTest, MalformedResponsesAreInvalid) {
    for (const std::string body : {"", "not json", "[]", R"({"words": []})", R"({"text": 42})"}) {
        try {
            parseTranscriptionResponse(body);
            ADD_FAILURE() << "accepted: " << body;
        } catch (const TranscriptionError& e) {
            EXPECT_EQ(e.kind(), TranscriptionErrorKind::InvalidResponse) << body;
        }
    }
}

TEST(HttpTranscriptionClientTest, ProviderDefaults) {
    EXPECT_EQ(defaultApiUrl(TranscriptionProvider::ElevenLabs), "https://api.elevenlabs.io/v1/speech-to-text");
    EXPECT_EQ(defaultModel(TranscriptionProvider::ElevenLabs), "scribe_v1");
    EXPECT_EQ(defaultApiUrl(TranscriptionProvider::OpenAI), "https://api.openai.com/v1/audio/transcriptions");
    EXPECT_EQ(defaultModel(TranscriptionProvider::OpenAI), "whisper-1");

    TranscriptionProvider provider = TranscriptionProvider::ElevenLabs;
    EXPECT_TRUE(parseProvider("OpenAI", provider));
    EXPECT_EQ(provider, TranscriptionProvider::OpenAI);
    EXPECT_FALSE(parseProvider("whisper.cpp", provider));
}

TEST(HttpTranscriptionClientTest, DescribeNamesProviderAndModel) {
    TranscriptionConfig config;
    config.provider = TranscriptionProvider::OpenAI;
    config.model = "gpt-4o-transcribe";
    HttpTranscriptionClient client(config);
    EXPECT_EQ(client.describe(), "OpenAI (gpt-4o-transcribe)");
}

TEST(HttpTranscriptionClientTest, MissingKeyFailsWithoutNetwork) {
    TranscriptionConfig config;
    HttpTranscriptionClient client(config);
    EXPECT_FALSE(client.isConfigured());

    try {
        client.transcribe(encodeWav({0, 0, 0}, 16000), "");
        FAIL() << "expected TranscriptionError";
    } catch (const TranscriptionError& e) {
        EXPECT_EQ(e.kind(), TranscriptionErrorKind::NotConfigured);
    }
}

TEST(HttpTranscriptionClientTest, ErrorKindNames) {
    EXPECT_STREQ(toString(TranscriptionErrorKind::Timeout), "timeout");
    EXPECT_STREQ(toString(TranscriptionErrorKind::Auth), "auth");
    EXPECT_STREQ(toString(TranscriptionErrorKind::InvalidResponse), "invalid_response");

    TranscriptionError error(TranscriptionErrorKind::Server, "HTTP 502", 502);
    EXPECT_EQ(error.httpStatus(), 502);
    EXPECT_STREQ(error.what(), "HTTP 502");
}

#include "chunkscribe/session_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <map>
#include <string>

using namespace chunkscribe;

namespace {

class SessionConfigTest : public ::testing::Test {
protected:
    void TearDown() override { std::remove(path_.c_str()); }

    void writeEnv(const std::string& contents) {
        std::ofstream out(path_);
        out << contents;
    }

    std::string path_ = ::testing::TempDir() + "chunkscribe_test.env";
};

} // namespace

TEST_F(SessionConfigTest, LoadsEnvFile) {
    writeEnv(
        "# transcription settings\n"
        "\n"
        "ELEVENLABS_API_KEY=\"xi-secret\"\n"
        "OPENAI_API_KEY='sk-secret'\n"
        "export CHUNKSCRIBE_LANGUAGE = en\n"
        "CHUNKSCRIBE_SILENCE_DURATION=1.5\n"
        "CHUNKSCRIBE_TRANSCRIPT_DIR=transcripts\n"
        "UNRELATED=1\n"
        "not a setting\n");

    SessionConfig config;
    ASSERT_TRUE(loadConfigFromEnv(path_, config));
    EXPECT_EQ(config.elevenlabs_api_key, "xi-secret");
    EXPECT_EQ(config.openai_api_key, "sk-secret");
    EXPECT_EQ(config.transcription.language, "en");
    EXPECT_DOUBLE_EQ(config.segmenter.silence_duration, 1.5);
    EXPECT_EQ(config.transcript_dir, "transcripts");
}

TEST_F(SessionConfigTest, MissingFileIsNotAnError) {
    SessionConfig config;
    EXPECT_FALSE(loadConfigFromEnv(::testing::TempDir() + "does_not_exist.env", config));
    EXPECT_DOUBLE_EQ(config.segmenter.silence_duration, 2.5);
}

TEST_F(SessionConfigTest, BadValuesThrow) {
    writeEnv("CHUNKSCRIBE_SILENCE_DURATION=soon\n");
    SessionConfig config;
    EXPECT_THROW(loadConfigFromEnv(path_, config), ConfigError);

    EXPECT_THROW(applySetting("CHUNKSCRIBE_PROVIDER", "carrier-pigeon", config), ConfigError);
    EXPECT_THROW(applySetting("CHUNKSCRIBE_SILENCE_DURATION", "2.5s", config), ConfigError);
}

TEST_F(SessionConfigTest, EnvironmentOverridesFile) {
    writeEnv("CHUNKSCRIBE_MODEL=from-file\nCHUNKSCRIBE_LANGUAGE=de\n");
    SessionConfig config;
    loadConfigFromEnv(path_, config);

    std::map<std::string, std::string> env = {{"CHUNKSCRIBE_MODEL", "from-env"}, {"CHUNKSCRIBE_PROVIDER", "openai"}};
    applyEnvironment(config, [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });

    EXPECT_EQ(config.transcription.model, "from-env");
    EXPECT_EQ(config.transcription.language, "de");
    EXPECT_EQ(config.transcription.provider, TranscriptionProvider::OpenAI);
}

TEST_F(SessionConfigTest, ProviderSpecificKeyWins) {
    SessionConfig config;
    applySetting("API_KEY", "generic", config);
    EXPECT_EQ(resolveTranscriptionConfig(config).api_key, "generic");

    applySetting("ELEVENLABS_API_KEY", "xi", config);
    applySetting("OPENAI_API_KEY", "sk", config);
    EXPECT_EQ(resolveTranscriptionConfig(config).api_key, "xi");

    config.transcription.provider = TranscriptionProvider::OpenAI;
    EXPECT_EQ(resolveTranscriptionConfig(config).api_key, "sk");
}

TEST_F(SessionConfigTest, ValidateRejectsImpossibleValues) {
    SessionConfig config;
    EXPECT_NO_THROW(validateConfig(config));

    SessionConfig bad_rate = config;
    bad_rate.audio.sample_rate = 0;
    EXPECT_THROW(validateConfig(bad_rate), ConfigError);

    SessionConfig bad_trigger = config;
    bad_trigger.segmenter.speech_trigger_frames = 0;
    EXPECT_THROW(validateConfig(bad_trigger), ConfigError);

    SessionConfig bad_silence = config;
    bad_silence.segmenter.silence_duration = 0.0;
    EXPECT_THROW(validateConfig(bad_silence), ConfigError);

    SessionConfig bad_queue = config;
    bad_queue.queue_depth = 0;
    EXPECT_THROW(validateConfig(bad_queue), ConfigError);

    SessionConfig bad_max = config;
    bad_max.segmenter.max_chunk_duration = 0.2;
    EXPECT_THROW(validateConfig(bad_max), ConfigError);
}

TEST_F(SessionConfigTest, ChunkingCanBeTurnedOff) {
    SessionConfig config;
    EXPECT_TRUE(config.chunked);

    writeEnv("CHUNKSCRIBE_CHUNKED=false\n");
    ASSERT_TRUE(loadConfigFromEnv(path_, config));
    EXPECT_FALSE(config.chunked);

    applySetting("CHUNKSCRIBE_CHUNKED", "1", config);
    EXPECT_TRUE(config.chunked);
    EXPECT_THROW(applySetting("CHUNKSCRIBE_CHUNKED", "sometimes", config), ConfigError);
}

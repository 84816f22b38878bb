#include "chunkscribe/wav_encoder.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

using namespace chunkscribe;

namespace {

uint32_t readLE32(const std::vector<uint8_t>& b, size_t at) {
    return static_cast<uint32_t>(b[at]) | (static_cast<uint32_t>(b[at + 1]) << 8) |
           (static_cast<uint32_t>(b[at + 2]) << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
}

uint16_t readLE16(const std::vector<uint8_t>& b, size_t at) {
    return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

std::string tag(const std::vector<uint8_t>& b, size_t at) {
    return std::string(b.begin() + static_cast<std::ptrdiff_t>(at), b.begin() + static_cast<std::ptrdiff_t>(at + 4));
}

} // namespace

TEST(WavEncoderTest, CanonicalHeader) {
    std::vector<int16_t> samples = {0, 1, -1, 32767, -32768};
    std::vector<uint8_t> wav = encodeWav(samples, 16000);

    ASSERT_EQ(wav.size(), kWavHeaderSize + samples.size() * 2);
    EXPECT_EQ(tag(wav, 0), "RIFF");
    EXPECT_EQ(readLE32(wav, 4), 36u + 10u);
    EXPECT_EQ(tag(wav, 8), "WAVE");
    EXPECT_EQ(tag(wav, 12), "fmt ");
    EXPECT_EQ(readLE32(wav, 16), 16u);
    EXPECT_EQ(readLE16(wav, 20), 1u);       // PCM
    EXPECT_EQ(readLE16(wav, 22), 1u);       // mono
    EXPECT_EQ(readLE32(wav, 24), 16000u);
    EXPECT_EQ(readLE32(wav, 28), 32000u);   // byte rate
    EXPECT_EQ(readLE16(wav, 32), 2u);       // block align
    EXPECT_EQ(readLE16(wav, 34), 16u);
    EXPECT_EQ(tag(wav, 36), "data");
    EXPECT_EQ(readLE32(wav, 40), 10u);
}

TEST(WavEncoderTest, SamplesAreLittleEndian) {
    std::vector<uint8_t> wav = encodeWav({0x1234, -2}, 8000);
    EXPECT_EQ(wav[44], 0x34);
    EXPECT_EQ(wav[45], 0x12);
    EXPECT_EQ(wav[46], 0xFE);
    EXPECT_EQ(wav[47], 0xFF);
}

TEST(WavEncoderTest, EmptyPayloadIsHeaderOnly) {
    std::vector<uint8_t> wav = encodeWav({}, 16000);
    EXPECT_EQ(wav.size(), kWavHeaderSize);
    EXPECT_EQ(readLE32(wav, 40), 0u);
}

TEST(WavEncoderTest, StereoHeaderFields) {
    std::vector<uint8_t> wav = encodeWav({1, 2, 3, 4}, 44100, 2);
    EXPECT_EQ(readLE16(wav, 22), 2u);
    EXPECT_EQ(readLE32(wav, 28), 44100u * 4u);
    EXPECT_EQ(readLE16(wav, 32), 4u);
}

TEST(WavEncoderTest, WriteFileRoundTripsBytes) {
    const std::string path = ::testing::TempDir() + "chunkscribe_wav_test.wav";
    std::vector<uint8_t> wav = encodeWav({5, 6, 7}, 16000);
    ASSERT_TRUE(writeFile(path, wav));

    std::ifstream in(path, std::ios::binary);
    std::vector<uint8_t> read_back((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(read_back, wav);
    std::remove(path.c_str());

    EXPECT_FALSE(writeFile("/nonexistent-dir/for/sure/x.wav", wav));
}

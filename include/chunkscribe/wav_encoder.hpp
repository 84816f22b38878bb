#ifndef CHUNKSCRIBE_WAV_ENCODER_HPP
#define CHUNKSCRIBE_WAV_ENCODER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkscribe {

constexpr size_t kWavHeaderSize = 44;

// Canonical RIFF/WAVE container, PCM16 little endian
std::vector<uint8_t> encodeWav(const std::vector<int16_t>& samples, int sample_rate, int channels = 1);

// Writes raw bytes; returns false if the file cannot be written
bool writeFile(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace chunkscribe

#endif // CHUNKSCRIBE_WAV_ENCODER_HPP

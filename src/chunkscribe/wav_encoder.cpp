#include "chunkscribe/wav_encoder.hpp"

#include <fstream>

namespace chunkscribe {

namespace {
    void putTag(std::vector<uint8_t>& out, const char* tag) {
        out.insert(out.end(), tag, tag + 4);
    }

    void putLE16(std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }

    void putLE32(std::vector<uint8_t>& out, uint32_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    }
}

std::vector<uint8_t> encodeWav(const std::vector<int16_t>& samples, int sample_rate, int channels) {
    const uint16_t bits_per_sample = 16;
    const uint16_t block_align = static_cast<uint16_t>(channels * bits_per_sample / 8);
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(kWavHeaderSize + data_size);

    putTag(out, "RIFF");
    putLE32(out, 36 + data_size);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    putLE32(out, 16);                       // fmt chunk size
    putLE16(out, 1);                        // PCM
    putLE16(out, static_cast<uint16_t>(channels));
    putLE32(out, static_cast<uint32_t>(sample_rate));
    putLE32(out, byte_rate);
    putLE16(out, block_align);
    putLE16(out, bits_per_sample);

    putTag(out, "data");
    putLE32(out, data_size);
    for (int16_t s : samples) {
        putLE16(out, static_cast<uint16_t>(s));
    }
    return out;
}

bool writeFile(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

} // namespace chunkscribe

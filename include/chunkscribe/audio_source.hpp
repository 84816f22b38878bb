#ifndef CHUNKSCRIBE_AUDIO_SOURCE_HPP
#define CHUNKSCRIBE_AUDIO_SOURCE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace chunkscribe {

struct AudioFormat {
    int sample_rate = 16000;
    int channels = 1;              // Device channels; frames are always mono
    int frames_per_buffer = 1024;  // Samples per AudioFrame (64ms at 16kHz)
    int device_index = -1;         // -1 = system default input
};

// One mono PCM16 buffer of exactly frames_per_buffer samples
struct AudioFrame {
    std::vector<int16_t> samples;
    uint64_t sequence = 0;

    AudioFrame() = default;
    AudioFrame(std::vector<int16_t> s, uint64_t seq) : samples(std::move(s)), sequence(seq) {}
};

// Input cannot be opened or read; fatal to the session
class AudioDeviceError : public std::runtime_error {
public:
    explicit AudioDeviceError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Continuous audio capture.
 *
 * read() must return within about one frame period so that a stop request is
 * observed at the next frame boundary.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    // Throws AudioDeviceError
    virtual void open(const AudioFormat& format) = 0;

    // Returns false at end of stream; throws AudioDeviceError on failure
    virtual bool read(AudioFrame& frame) = 0;

    // Safe to call more than once
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_AUDIO_SOURCE_HPP

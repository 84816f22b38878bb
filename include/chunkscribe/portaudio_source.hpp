#ifndef CHUNKSCRIBE_PORTAUDIO_SOURCE_HPP
#define CHUNKSCRIBE_PORTAUDIO_SOURCE_HPP

#include "chunkscribe/audio_source.hpp"

#include <portaudio.h>
#include <string>
#include <vector>

namespace chunkscribe {

struct InputDeviceInfo {
    int index = -1;
    std::string name;
    int max_input_channels = 0;
    double default_sample_rate = 0.0;
    bool is_default = false;
};

// Microphone capture through a blocking-mode PortAudio input stream
class PortAudioSource : public AudioSource {
public:
    PortAudioSource();
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    void open(const AudioFormat& format) override;
    bool read(AudioFrame& frame) override;
    void close() override;
    std::string describe() const override;

    // Throws AudioDeviceError if PortAudio cannot be initialised
    static std::vector<InputDeviceInfo> listInputDevices();

private:
    AudioFormat format_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
    std::string device_name_;
    std::vector<int16_t> read_buffer_;
    uint64_t next_sequence_ = 0;
    uint64_t overflow_count_ = 0;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_PORTAUDIO_SOURCE_HPP

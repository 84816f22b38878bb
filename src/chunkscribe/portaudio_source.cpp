#include "chunkscribe/portaudio_source.hpp"
#include "chunkscribe/log.hpp"

#include <string>

namespace chunkscribe {

namespace {
    void paCheck(PaError err, const char* what) {
        if (err != paNoError) {
            throw AudioDeviceError(std::string(what) + " (" + std::to_string(static_cast<int>(err)) + "): " +
                                   Pa_GetErrorText(err));
        }
    }
}

PortAudioSource::PortAudioSource() = default;

PortAudioSource::~PortAudioSource() {
    close();
}

void PortAudioSource::open(const AudioFormat& format) {
    close();

    if (format.channels < 1 || format.frames_per_buffer <= 0 || format.sample_rate <= 0) {
        throw AudioDeviceError("Invalid audio format");
    }

    format_ = format;
    paCheck(Pa_Initialize(), "Pa_Initialize");
    initialized_ = true;

    try {
        PaStreamParameters inputParams{};
        inputParams.device = (format_.device_index >= 0) ? format_.device_index : Pa_GetDefaultInputDevice();
        if (inputParams.device == paNoDevice) {
            throw AudioDeviceError("No default input device available");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(inputParams.device);
        if (!info) {
            throw AudioDeviceError("Invalid input device index: " + std::to_string(inputParams.device));
        }
        if (info->maxInputChannels < format_.channels) {
            throw AudioDeviceError(std::string("Device has no ") + std::to_string(format_.channels) +
                                   "-channel input: " + info->name);
        }
        device_name_ = info->name;

        inputParams.channelCount = format_.channels;
        inputParams.sampleFormat = paInt16;
        inputParams.suggestedLatency = info->defaultLowInputLatency;
        inputParams.hostApiSpecificStreamInfo = nullptr;

        paCheck(Pa_OpenStream(&stream_, &inputParams, nullptr,
                              format_.sample_rate, format_.frames_per_buffer,
                              paClipOff, nullptr, nullptr),
                "Pa_OpenStream");
        paCheck(Pa_StartStream(stream_), "Pa_StartStream");
    } catch (const AudioDeviceError&) {
        close();
        throw;
    }

    read_buffer_.assign(static_cast<size_t>(format_.frames_per_buffer) * format_.channels, 0);
    next_sequence_ = 0;
    overflow_count_ = 0;

    logInfo("Capture", "Input device: " + device_name_ + " (" + std::to_string(format_.sample_rate) + " Hz, " +
                       std::to_string(format_.channels) + " ch, " + std::to_string(format_.frames_per_buffer) +
                       " frames/buffer)");
}

bool PortAudioSource::read(AudioFrame& frame) {
    if (!stream_) {
        throw AudioDeviceError("Stream not open");
    }

    PaError err = Pa_ReadStream(stream_, read_buffer_.data(), format_.frames_per_buffer);
    if (err == paInputOverflowed) {
        // Samples were lost upstream but the buffer is still valid
        if (++overflow_count_ % 50 == 1) {
            logWarning("Capture", "Input overflowed (" + std::to_string(overflow_count_) + " times)");
        }
    } else {
        paCheck(err, "Pa_ReadStream");
    }

    frame.sequence = next_sequence_++;
    frame.samples.resize(format_.frames_per_buffer);

    if (format_.channels == 1) {
        frame.samples.assign(read_buffer_.begin(), read_buffer_.end());
    } else {
        // Average interleaved channels down to mono
        for (int i = 0; i < format_.frames_per_buffer; ++i) {
            int sum = 0;
            for (int c = 0; c < format_.channels; ++c) {
                sum += read_buffer_[static_cast<size_t>(i) * format_.channels + c];
            }
            frame.samples[i] = static_cast<int16_t>(sum / format_.channels);
        }
    }
    return true;
}

void PortAudioSource::close() {
    if (stream_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            logWarning("Capture", std::string("Failed to stop stream: ") + Pa_GetErrorText(err));
        }
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

std::string PortAudioSource::describe() const {
    return device_name_.empty() ? std::string("PortAudio input") : "PortAudio input: " + device_name_;
}

std::vector<InputDeviceInfo> PortAudioSource::listInputDevices() {
    paCheck(Pa_Initialize(), "Pa_Initialize");

    std::vector<InputDeviceInfo> devices;
    const PaDeviceIndex defaultIndex = Pa_GetDefaultInputDevice();
    const int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        InputDeviceInfo device;
        device.index = i;
        device.name = info->name;
        device.max_input_channels = info->maxInputChannels;
        device.default_sample_rate = info->defaultSampleRate;
        device.is_default = (i == defaultIndex);
        devices.push_back(device);
    }

    Pa_Terminate();
    return devices;
}

} // namespace chunkscribe

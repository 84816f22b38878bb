#include "chunkscribe/wav_file_source.hpp"
#include "chunkscribe/log.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <thread>
#include <utility>

namespace chunkscribe {

std::vector<float> resampleLinear(const std::vector<float>& input, int input_rate, int output_rate) {
    if (input_rate == output_rate || input.empty() || input_rate <= 0 || output_rate <= 0) {
        return input;
    }
    double ratio = static_cast<double>(input_rate) / static_cast<double>(output_rate);
    size_t output_length = static_cast<size_t>(std::floor(static_cast<double>(input.size()) / ratio));
    std::vector<float> output(output_length);

    for (size_t i = 0; i < output_length; ++i) {
        double src_pos = static_cast<double>(i) * ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - static_cast<double>(idx);
        if (idx + 1 < input.size()) {
            output[i] = static_cast<float>((1.0 - frac) * input[idx] + frac * input[idx + 1]);
        } else {
            output[i] = input[std::min(idx, input.size() - 1)];
        }
    }
    return output;
}

WavFileSource::WavFileSource(std::string path, bool realtime)
    : path_(std::move(path)), realtime_(realtime) {
}

void WavFileSource::open(const AudioFormat& format) {
    if (format.frames_per_buffer <= 0 || format.sample_rate <= 0) {
        throw AudioDeviceError("Invalid audio format");
    }
    format_ = format;

    SF_INFO sf_info;
    std::memset(&sf_info, 0, sizeof(sf_info));
    SNDFILE* sf = sf_open(path_.c_str(), SFM_READ, &sf_info);
    if (!sf) {
        throw AudioDeviceError("Cannot open audio file " + path_ + ": " + sf_strerror(nullptr));
    }

    std::vector<float> interleaved(static_cast<size_t>(sf_info.frames) * sf_info.channels);
    sf_count_t frames_read = sf_readf_float(sf, interleaved.data(), sf_info.frames);
    sf_close(sf);

    if (frames_read < 0) {
        throw AudioDeviceError("Failed to read audio file " + path_);
    }
    if (frames_read != sf_info.frames) {
        logWarning("Capture", "Only read " + std::to_string(frames_read) + " of " +
                              std::to_string(sf_info.frames) + " frames from " + path_);
    }

    std::vector<float> mono(static_cast<size_t>(frames_read));
    for (sf_count_t i = 0; i < frames_read; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < sf_info.channels; ++ch) {
            sum += interleaved[static_cast<size_t>(i) * sf_info.channels + ch];
        }
        mono[static_cast<size_t>(i)] = sum / sf_info.channels;
    }

    if (sf_info.samplerate != format_.sample_rate) {
        logInfo("Capture", "Resampling " + path_ + " from " + std::to_string(sf_info.samplerate) + " Hz to " +
                           std::to_string(format_.sample_rate) + " Hz");
        mono = resampleLinear(mono, sf_info.samplerate, format_.sample_rate);
    }

    samples_.resize(mono.size());
    for (size_t i = 0; i < mono.size(); ++i) {
        float s = std::max(-1.0f, std::min(1.0f, mono[i]));
        samples_[i] = static_cast<int16_t>(std::lround(s * 32767.0f));
    }

    position_ = 0;
    next_sequence_ = 0;
    open_ = true;
    next_frame_time_ = std::chrono::steady_clock::now();

    logInfo("Capture", "Audio file: " + path_ + " (" + std::to_string(durationSeconds()) + " s)");
}

bool WavFileSource::read(AudioFrame& frame) {
    if (!open_) {
        throw AudioDeviceError("Audio file not open");
    }
    if (position_ >= samples_.size()) {
        return false;
    }

    const size_t frame_size = static_cast<size_t>(format_.frames_per_buffer);
    const size_t available = std::min(frame_size, samples_.size() - position_);

    frame.sequence = next_sequence_++;
    frame.samples.assign(frame_size, 0);
    std::copy(samples_.begin() + position_, samples_.begin() + position_ + available, frame.samples.begin());
    position_ += available;

    if (realtime_) {
        next_frame_time_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(static_cast<double>(frame_size) / format_.sample_rate));
        std::this_thread::sleep_until(next_frame_time_);
    }
    return true;
}

void WavFileSource::close() {
    open_ = false;
    samples_.clear();
    samples_.shrink_to_fit();
    position_ = 0;
}

std::string WavFileSource::describe() const {
    return "Audio file: " + path_;
}

double WavFileSource::durationSeconds() const {
    if (format_.sample_rate <= 0) return 0.0;
    return static_cast<double>(samples_.size()) / format_.sample_rate;
}

} // namespace chunkscribe

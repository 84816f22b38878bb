#ifndef CHUNKSCRIBE_TEST_SUPPORT_HPP
#define CHUNKSCRIBE_TEST_SUPPORT_HPP

#include "chunkscribe/audio_source.hpp"
#include "chunkscribe/transcription_client.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chunkscribe {
namespace test {

// Square wave of +-A; its RMS is exactly A / 32768
inline AudioFrame squareFrame(float rms, uint64_t sequence, int frame_size) {
    const int16_t amplitude = static_cast<int16_t>(std::lround(rms * 32768.0f));
    std::vector<int16_t> samples(static_cast<size_t>(frame_size));
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = (i % 2 == 0) ? amplitude : static_cast<int16_t>(-amplitude);
    }
    return AudioFrame(std::move(samples), sequence);
}

// Builds a frame sequence: add(count, rms) appends count frames at that level
class FrameScript {
public:
    explicit FrameScript(int frame_size) : frame_size_(frame_size) {}

    FrameScript& add(int count, float rms) {
        for (int i = 0; i < count; ++i) {
            frames_.push_back(squareFrame(rms, next_sequence_++, frame_size_));
        }
        return *this;
    }

    const std::vector<AudioFrame>& frames() const { return frames_; }

private:
    int frame_size_;
    uint64_t next_sequence_ = 0;
    std::vector<AudioFrame> frames_;
};

// Plays back a fixed list of frames, then reports end of stream. With
// repeat_last set it keeps returning the last frame until closed.
class ScriptedAudioSource : public AudioSource {
public:
    explicit ScriptedAudioSource(std::vector<AudioFrame> frames) : frames_(std::move(frames)) {}

    bool fail_on_open = false;
    int fail_at_frame = -1;
    bool repeat_last = false;
    std::chrono::microseconds read_delay{0};

    void open(const AudioFormat&) override {
        if (fail_on_open) {
            throw AudioDeviceError("no such device");
        }
        position_ = 0;
        opened = true;
    }

    bool read(AudioFrame& frame) override {
        if (read_delay.count() > 0) {
            std::this_thread::sleep_for(read_delay);
        }
        if (fail_at_frame >= 0 && static_cast<int>(position_) == fail_at_frame) {
            throw AudioDeviceError("device unplugged");
        }
        if (position_ >= frames_.size()) {
            if (!repeat_last || frames_.empty()) {
                return false;
            }
            frame = frames_.back();
            frame.sequence = position_++;
            return true;
        }
        frame = frames_[position_++];
        return true;
    }

    void close() override { closed = true; }

    std::string describe() const override { return "scripted"; }

    bool opened = false;
    bool closed = false;

private:
    std::vector<AudioFrame> frames_;
    size_t position_ = 0;
};

// Returns scripted texts in call order. An entry starting with "!" makes that
// call throw a Server error instead.
class FakeTranscriptionClient : public TranscriptionClient {
public:
    explicit FakeTranscriptionClient(std::vector<std::string> responses = {}) : responses_(std::move(responses)) {}

    std::chrono::milliseconds delay{0};
    bool configured = true;

    std::string transcribe(const std::vector<uint8_t>& wav, const std::string&) override {
        std::string response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blobs_.push_back(wav);
            const size_t call = calls_++;
            response = call < responses_.size() ? responses_[call] : "";
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (!response.empty() && response[0] == '!') {
            throw TranscriptionError(TranscriptionErrorKind::Server, response.substr(1), 500);
        }
        return response;
    }

    std::string describe() const override { return "fake"; }
    bool isConfigured() const override { return configured; }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::vector<uint8_t>> blobs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return blobs_;
    }

private:
    std::vector<std::string> responses_;
    mutable std::mutex mutex_;
    size_t calls_ = 0;
    std::vector<std::vector<uint8_t>> blobs_;
};

} // namespace test
} // namespace chunkscribe

#endif // CHUNKSCRIBE_TEST_SUPPORT_HPP

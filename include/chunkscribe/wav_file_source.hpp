#ifndef CHUNKSCRIBE_WAV_FILE_SOURCE_HPP
#define CHUNKSCRIBE_WAV_FILE_SOURCE_HPP

#include "chunkscribe/audio_source.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace chunkscribe {

/**
 * Replays a sound file (any format libsndfile reads) as if it were a
 * microphone: mixed down to mono, resampled to the session rate and cut into
 * frames_per_buffer frames. With realtime pacing enabled each read() sleeps
 * until the frame's playback time.
 */
class WavFileSource : public AudioSource {
public:
    explicit WavFileSource(std::string path, bool realtime = false);

    void open(const AudioFormat& format) override;
    bool read(AudioFrame& frame) override;
    void close() override;
    std::string describe() const override;

    double durationSeconds() const;

private:
    std::string path_;
    bool realtime_;
    AudioFormat format_;
    std::vector<int16_t> samples_;
    size_t position_ = 0;
    uint64_t next_sequence_ = 0;
    bool open_ = false;
    std::chrono::steady_clock::time_point next_frame_time_;
};

// Linear interpolation resampler for a mono float signal
std::vector<float> resampleLinear(const std::vector<float>& input, int input_rate, int output_rate);

} // namespace chunkscribe

#endif // CHUNKSCRIBE_WAV_FILE_SOURCE_HPP

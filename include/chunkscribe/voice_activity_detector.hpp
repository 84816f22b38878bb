#ifndef CHUNKSCRIBE_VOICE_ACTIVITY_DETECTOR_HPP
#define CHUNKSCRIBE_VOICE_ACTIVITY_DETECTOR_HPP

#include "chunkscribe/audio_source.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chunkscribe {

/**
 * Energy VAD with a per-session noise-floor calibration.
 *
 * The first calibration_frames frames are only measured. Their median RMS
 * (ignoring near-zero values) becomes the noise floor and the silence
 * threshold is derived from it once; after that the detector is read-only.
 */
class VoiceActivityDetector {
public:
    struct Config {
        int calibration_frames = 50;
        float zero_rms_epsilon = 0.0001f;     // Calibration values at or below this are ignored
        float fallback_noise_floor = 0.001f;  // Used when every calibration frame was ~0
        float low_noise_cutoff = 0.005f;
        float low_noise_threshold = 0.015f;   // Fixed threshold for very quiet rooms
        float threshold_multiplier = 2.5f;
        float min_threshold = 0.012f;
        float max_threshold = 0.04f;
        float initial_threshold = 0.02f;      // Only used before calibration completes
    };

    enum class Classification {
        Silence,
        Speech
    };

    VoiceActivityDetector();
    explicit VoiceActivityDetector(const Config& config);

    // RMS of normalised samples, in [0, 1]
    static float computeRms(const int16_t* samples, size_t count);
    static float computeRms(const AudioFrame& frame);

    // Records one frame's RMS; returns true once calibration is complete
    bool calibrate(const AudioFrame& frame);
    bool calibrate(float rms);

    bool isCalibrated() const { return calibrated_; }
    int calibrationFramesSeen() const { return static_cast<int>(rms_history_.size()); }

    // Pure comparison against the frozen threshold
    Classification classify(const AudioFrame& frame) const;
    Classification classify(float rms) const;

    float noiseFloor() const { return noise_floor_; }
    float threshold() const { return threshold_; }
    const Config& config() const { return config_; }

    // Back to an uncalibrated detector
    void reset();

    static float estimateNoiseFloor(const std::vector<float>& rms_values, const Config& config);
    static float deriveThreshold(float noise_floor, const Config& config);

private:
    void finishCalibration();

    Config config_;
    std::vector<float> rms_history_;
    bool calibrated_ = false;
    float noise_floor_ = 0.0f;
    float threshold_ = 0.0f;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_VOICE_ACTIVITY_DETECTOR_HPP

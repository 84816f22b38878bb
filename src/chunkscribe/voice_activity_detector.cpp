#include "chunkscribe/voice_activity_detector.hpp"
#include "chunkscribe/log.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace chunkscribe {

VoiceActivityDetector::VoiceActivityDetector() : VoiceActivityDetector(Config{}) {
}

VoiceActivityDetector::VoiceActivityDetector(const Config& config) : config_(config) {
    reset();
}

float VoiceActivityDetector::computeRms(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double acc = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double s = static_cast<double>(samples[i]);
        acc += s * s;
    }
    return static_cast<float>(std::sqrt(acc / static_cast<double>(count)) / 32768.0);
}

float VoiceActivityDetector::computeRms(const AudioFrame& frame) {
    return computeRms(frame.samples.data(), frame.samples.size());
}

bool VoiceActivityDetector::calibrate(const AudioFrame& frame) {
    return calibrate(computeRms(frame));
}

bool VoiceActivityDetector::calibrate(float rms) {
    if (calibrated_) return true;

    rms_history_.push_back(rms);
    if (static_cast<int>(rms_history_.size()) >= config_.calibration_frames) {
        finishCalibration();
    }
    return calibrated_;
}

VoiceActivityDetector::Classification VoiceActivityDetector::classify(const AudioFrame& frame) const {
    return classify(computeRms(frame));
}

VoiceActivityDetector::Classification VoiceActivityDetector::classify(float rms) const {
    return rms > threshold_ ? Classification::Speech : Classification::Silence;
}

void VoiceActivityDetector::reset() {
    rms_history_.clear();
    rms_history_.reserve(static_cast<size_t>(std::max(0, config_.calibration_frames)));
    calibrated_ = false;
    noise_floor_ = 0.0f;
    threshold_ = config_.initial_threshold;

    if (config_.calibration_frames <= 0) {
        finishCalibration();
    }
}

float VoiceActivityDetector::estimateNoiseFloor(const std::vector<float>& rms_values, const Config& config) {
    std::vector<float> non_zero;
    non_zero.reserve(rms_values.size());
    for (float r : rms_values) {
        if (r > config.zero_rms_epsilon) non_zero.push_back(r);
    }

    if (non_zero.empty()) {
        return config.fallback_noise_floor;
    }

    std::sort(non_zero.begin(), non_zero.end());
    return non_zero[non_zero.size() / 2];
}

float VoiceActivityDetector::deriveThreshold(float noise_floor, const Config& config) {
    if (noise_floor < config.low_noise_cutoff) {
        return config.low_noise_threshold;
    }
    return std::min(std::max(noise_floor * config.threshold_multiplier, config.min_threshold), config.max_threshold);
}

void VoiceActivityDetector::finishCalibration() {
    noise_floor_ = estimateNoiseFloor(rms_history_, config_);
    threshold_ = deriveThreshold(noise_floor_, config_);
    calibrated_ = true;

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(4)
        << "Calibration complete. Noise floor: " << noise_floor_ << ", silence threshold: " << threshold_;
    if (noise_floor_ < config_.low_noise_cutoff) {
        msg << " (low noise environment, fixed threshold)";
    }
    logInfo("VAD", msg.str());
}

} // namespace chunkscribe

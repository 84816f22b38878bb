#include "chunkscribe/chunk_segmenter.hpp"
#include "chunkscribe/log.hpp"
#include "chunkscribe/wav_encoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>

namespace chunkscribe {

namespace {
    constexpr double kFrameEpsilon = 1e-9;

    int secondsToFrames(double seconds, const AudioFormat& format) {
        if (seconds <= 0.0 || format.frames_per_buffer <= 0) return 0;
        const double frames = seconds * format.sample_rate / format.frames_per_buffer;
        return static_cast<int>(std::ceil(frames - kFrameEpsilon));
    }

    std::string seconds(double value) {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << value << "s";
        return out.str();
    }
}

const char* toString(SegmenterState state) {
    switch (state) {
        case SegmenterState::Calibrating: return "calibrating";
        case SegmenterState::Silent: return "silent";
        case SegmenterState::Speaking: return "speaking";
    }
    return "unknown";
}

ChunkSegmenter::ChunkSegmenter() : ChunkSegmenter(AudioFormat{}) {
}

ChunkSegmenter::ChunkSegmenter(const AudioFormat& format)
    : ChunkSegmenter(format, Config{}, VoiceActivityDetector::Config{}) {
}

ChunkSegmenter::ChunkSegmenter(const AudioFormat& format, const Config& config,
                               const VoiceActivityDetector::Config& vad_config)
    : format_(format), config_(config), vad_(vad_config) {
    silence_commit_frames_ = std::max(1, secondsToFrames(config_.silence_duration, format_));
    overlap_target_frames_ = secondsToFrames(config_.overlap_duration, format_);
    max_chunk_frames_ = secondsToFrames(config_.max_chunk_duration, format_);
    reset();
}

void ChunkSegmenter::reset() {
    vad_.reset();
    state_ = vad_.isCalibrated() ? SegmenterState::Silent : SegmenterState::Calibrating;
    counters_ = SegmenterCounters();
    main_buffer_.clear();
    pre_roll_.clear();
    speech_buffer_.clear();
    overlap_buffer_.clear();
    next_chunk_index_ = 0;
}

double ChunkSegmenter::framesToSeconds(size_t frames) const {
    if (format_.sample_rate <= 0) return 0.0;
    return static_cast<double>(frames) * format_.frames_per_buffer / format_.sample_rate;
}

SegmentResult ChunkSegmenter::processFrame(const AudioFrame& frame, AudioChunk& chunk) {
    counters_.frames_processed++;

    if (state_ == SegmenterState::Calibrating) {
        if (vad_.calibrate(frame)) {
            state_ = SegmenterState::Silent;
        }
        return SegmentResult::None;
    }

    const float rms = VoiceActivityDetector::computeRms(frame);
    const bool is_speech = vad_.classify(rms) == VoiceActivityDetector::Classification::Speech;
    traceLevel(rms);

    if (!config_.chunked) {
        main_buffer_.push_back(frame);
        if (is_speech) {
            speech_buffer_.push_back(frame);
            state_ = SegmenterState::Speaking;
        }
        return SegmentResult::None;
    }

    appendToBuffers(frame);

    if (state_ == SegmenterState::Silent) {
        if (is_speech) {
            speech_buffer_.push_back(frame);
            counters_.voice_run++;
            if (counters_.voice_run >= config_.speech_trigger_frames) {
                enterSpeaking();
            }
        } else {
            // An interrupted run does not count towards the next one
            counters_.voice_run = 0;
            speech_buffer_.clear();
        }
        return SegmentResult::None;
    }

    // Speaking
    if (is_speech) {
        speech_buffer_.push_back(frame);
        if (counters_.silence_run > 0) {
            logDebug("Segmenter", "Speech resumed after " + seconds(framesToSeconds(counters_.silence_run)) + " of silence");
        }
        counters_.silence_run = 0;
    } else {
        counters_.silence_run++;
        if (counters_.silence_run >= silence_commit_frames_) {
            SegmentResult result = commit(chunk, false);
            state_ = SegmenterState::Silent;
            counters_.voice_run = 0;
            counters_.silence_run = 0;
            return result;
        }
    }

    if (max_chunk_frames_ > 0 && static_cast<int>(main_buffer_.size()) >= max_chunk_frames_) {
        logDebug("Segmenter", "Maximum chunk duration reached, committing while speaking");
        return commit(chunk, false);
    }
    return SegmentResult::None;
}

SegmentResult ChunkSegmenter::flush(AudioChunk& chunk) {
    const bool pending = state_ == SegmenterState::Speaking || (!config_.chunked && !main_buffer_.empty());
    if (!pending) {
        main_buffer_.clear();
        speech_buffer_.clear();
        counters_.voice_run = 0;
        return SegmentResult::None;
    }

    SegmentResult result = commit(chunk, true);
    state_ = SegmenterState::Silent;
    counters_.voice_run = 0;
    counters_.silence_run = 0;
    return result;
}

void ChunkSegmenter::appendToBuffers(const AudioFrame& frame) {
    main_buffer_.push_back(frame);
    pre_roll_.push_back(frame);
    while (static_cast<int>(pre_roll_.size()) > std::max(0, config_.pre_roll_frames)) {
        pre_roll_.pop_front();
    }

    // Outside an utterance only the lookback window is worth keeping
    if (state_ == SegmenterState::Silent) {
        const size_t keep = static_cast<size_t>(std::max(config_.pre_roll_frames, config_.speech_trigger_frames));
        while (main_buffer_.size() > keep) {
            main_buffer_.pop_front();
        }
    }
}

void ChunkSegmenter::enterSpeaking() {
    // The trigger frames are already in the speech buffer
    const size_t trim = static_cast<size_t>(std::max(0, config_.speech_trigger_frames));
    const size_t lead = pre_roll_.size() > trim ? pre_roll_.size() - trim : 0;
    speech_buffer_.insert(speech_buffer_.begin(), pre_roll_.begin(), pre_roll_.begin() + static_cast<std::ptrdiff_t>(lead));

    state_ = SegmenterState::Speaking;
    counters_.voice_run = 0;
    counters_.silence_run = 0;
    logDebug("Segmenter", "Speech started (" + std::to_string(speech_buffer_.size()) + " frames incl. pre-roll)");
}

SegmentResult ChunkSegmenter::commit(AudioChunk& chunk, bool is_final) {
    chunk = AudioChunk();
    chunk.sample_rate = format_.sample_rate;
    chunk.is_final = is_final;
    chunk.speech_frames = static_cast<int>(speech_buffer_.size());
    chunk.speech_duration = framesToSeconds(speech_buffer_.size());
    chunk.overlap_frames = static_cast<int>(overlap_buffer_.size());
    chunk.frame_count = static_cast<int>(overlap_buffer_.size() + main_buffer_.size());
    chunk.duration = framesToSeconds(static_cast<size_t>(chunk.frame_count));
    if (!main_buffer_.empty()) {
        chunk.first_sequence = overlap_buffer_.empty() ? main_buffer_.front().sequence : overlap_buffer_.front().sequence;
        chunk.last_sequence = main_buffer_.back().sequence;
    }

    if (chunk.speech_duration + kFrameEpsilon < config_.min_speech_duration) {
        chunk.index = next_chunk_index_;
        counters_.chunks_discarded++;
        logDebug("Segmenter", "Discarding chunk: speech " + seconds(chunk.speech_duration) + " below minimum " +
                              seconds(config_.min_speech_duration));
        main_buffer_.clear();
        speech_buffer_.clear();
        return SegmentResult::ChunkDiscarded;
    }

    chunk.index = next_chunk_index_++;
    chunk.samples.reserve(static_cast<size_t>(chunk.frame_count) * format_.frames_per_buffer);
    for (const auto& f : overlap_buffer_) {
        chunk.samples.insert(chunk.samples.end(), f.samples.begin(), f.samples.end());
    }
    for (const auto& f : main_buffer_) {
        chunk.samples.insert(chunk.samples.end(), f.samples.begin(), f.samples.end());
    }
    chunk.wav = encodeWav(chunk.samples, format_.sample_rate);

    // Tail of this chunk leads the next one
    const size_t tail = std::min(main_buffer_.size(), static_cast<size_t>(overlap_target_frames_));
    overlap_buffer_.assign(main_buffer_.end() - static_cast<std::ptrdiff_t>(tail), main_buffer_.end());

    main_buffer_.clear();
    speech_buffer_.clear();
    counters_.chunks_committed++;

    logInfo("Segmenter", "Chunk " + std::to_string(chunk.index) + " committed: " + seconds(chunk.duration) +
                         " audio, " + seconds(chunk.speech_duration) + " speech" + (is_final ? " (final)" : ""));
    return SegmentResult::ChunkCommitted;
}

void ChunkSegmenter::traceLevel(float rms) {
    if (config_.level_log_interval <= 0 || !isLogEnabled(LogLevel::Debug)) return;
    if (counters_.frames_processed % static_cast<uint64_t>(config_.level_log_interval) != 0) return;

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(4) << "Audio level: " << rms << " (threshold " << vad_.threshold()
        << ", " << toString(state_) << ")";
    logDebug("Segmenter", msg.str());
}

} // namespace chunkscribe

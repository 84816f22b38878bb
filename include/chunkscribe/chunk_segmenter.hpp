#ifndef CHUNKSCRIBE_CHUNK_SEGMENTER_HPP
#define CHUNKSCRIBE_CHUNK_SEGMENTER_HPP

#include "chunkscribe/audio_source.hpp"
#include "chunkscribe/voice_activity_detector.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace chunkscribe {

// One committed (or discarded) utterance
struct AudioChunk {
    int index = 0;                  // 0-based, committed chunks only
    std::vector<int16_t> samples;   // overlap ++ main buffer
    std::vector<uint8_t> wav;       // samples as a PCM16 WAV blob
    int sample_rate = 16000;
    int frame_count = 0;            // Includes overlap frames
    int overlap_frames = 0;
    int speech_frames = 0;
    uint64_t first_sequence = 0;
    uint64_t last_sequence = 0;
    double duration = 0.0;          // Seconds of payload audio
    double speech_duration = 0.0;
    bool is_final = false;          // Produced by flush()
};

enum class SegmenterState {
    Calibrating,
    Silent,
    Speaking
};

const char* toString(SegmenterState state);

enum class SegmentResult {
    None,
    ChunkCommitted,
    ChunkDiscarded  // Below the minimum speech duration; chunk carries metadata only
};

struct SegmenterCounters {
    int voice_run = 0;        // Consecutive Speech frames while Silent
    int silence_run = 0;      // Consecutive Silence frames while Speaking
    uint64_t frames_processed = 0;
    int chunks_committed = 0;
    int chunks_discarded = 0;
};

/**
 * Turns a stream of frames into utterance chunks.
 *
 * Calibrating -> Silent <-> Speaking. Speaking is entered after
 * speech_trigger_frames consecutive Speech frames and left once
 * silence_duration of uninterrupted silence has been observed, at which
 * point the chunk is committed. Each committed chunk is prefixed with the
 * tail of the previous one so words cut at the boundary are not lost.
 *
 * With chunked = false every frame after calibration is kept and flush()
 * commits the whole recording, still subject to the minimum speech gate.
 *
 * Not thread safe; owned by the capture thread.
 */
class ChunkSegmenter {
public:
    struct Config {
        int speech_trigger_frames = 3;
        int pre_roll_frames = 5;
        double silence_duration = 2.5;     // Seconds of silence that end a chunk
        double overlap_duration = 0.2;     // Seconds carried into the next chunk
        double min_speech_duration = 0.5;  // Shorter chunks are discarded
        double max_chunk_duration = 0.0;   // 0 = unlimited
        int level_log_interval = 10;       // Frames between audio level traces
        bool chunked = true;               // false = whole session in one chunk, committed by flush()
    };

    ChunkSegmenter();
    explicit ChunkSegmenter(const AudioFormat& format);
    ChunkSegmenter(const AudioFormat& format, const Config& config, const VoiceActivityDetector::Config& vad_config);

    // Feeds one frame; fills chunk when the result is not None
    SegmentResult processFrame(const AudioFrame& frame, AudioChunk& chunk);

    // Session end: commits the pending chunk if Speaking (or the whole
    // recording when not chunked), otherwise drops buffers
    SegmentResult flush(AudioChunk& chunk);

    // Fresh calibration and empty buffers
    void reset();

    SegmenterState state() const { return state_; }
    const SegmenterCounters& counters() const { return counters_; }
    const VoiceActivityDetector& detector() const { return vad_; }
    float threshold() const { return vad_.threshold(); }
    float noiseFloor() const { return vad_.noiseFloor(); }
    const Config& config() const { return config_; }
    const AudioFormat& format() const { return format_; }

    size_t mainBufferFrames() const { return main_buffer_.size(); }
    size_t speechBufferFrames() const { return speech_buffer_.size(); }
    size_t preRollFrames() const { return pre_roll_.size(); }
    size_t overlapFrames() const { return overlap_buffer_.size(); }

    // Derived frame counts
    int silenceCommitFrames() const { return silence_commit_frames_; }
    int overlapTargetFrames() const { return overlap_target_frames_; }
    int maxChunkFrames() const { return max_chunk_frames_; }

    double framesToSeconds(size_t frames) const;

private:
    void enterSpeaking();
    SegmentResult commit(AudioChunk& chunk, bool is_final);
    void appendToBuffers(const AudioFrame& frame);
    void traceLevel(float rms);

    AudioFormat format_;
    Config config_;
    VoiceActivityDetector vad_;

    SegmenterState state_ = SegmenterState::Calibrating;
    SegmenterCounters counters_;

    std::deque<AudioFrame> main_buffer_;
    std::deque<AudioFrame> pre_roll_;
    std::vector<AudioFrame> speech_buffer_;
    std::vector<AudioFrame> overlap_buffer_;

    int silence_commit_frames_ = 0;
    int overlap_target_frames_ = 0;
    int max_chunk_frames_ = 0;
    int next_chunk_index_ = 0;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_CHUNK_SEGMENTER_HPP

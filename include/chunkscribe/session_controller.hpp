#ifndef CHUNKSCRIBE_SESSION_CONTROLLER_HPP
#define CHUNKSCRIBE_SESSION_CONTROLLER_HPP

#include "chunkscribe/audio_source.hpp"
#include "chunkscribe/chunk_queue.hpp"
#include "chunkscribe/chunk_segmenter.hpp"
#include "chunkscribe/session_config.hpp"
#include "chunkscribe/transcript_merger.hpp"
#include "chunkscribe/transcription_client.hpp"
#include "chunkscribe/transcription_worker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chunkscribe {

struct SessionEvent {
    enum class Type {
        ChunkCommitted,          // Handed to the transcription worker
        ChunkDiscarded,          // Too little speech; never transcribed
        ChunkDropped,            // Queue overflow; never transcribed
        TranscriptionSucceeded,
        TranscriptionFailed,
        CaptureFailed            // Audio input died; the session winds down
    };

    Type type = Type::ChunkCommitted;
    int chunk_index = -1;
    double audio_duration = 0.0;
    double speech_duration = 0.0;
    bool is_final = false;

    // TranscriptionSucceeded
    std::string new_text;     // Cleaned fragment to display or type
    std::string transcript;   // Accumulated transcript after the merge
    std::string raw_text;     // What the backend returned
    double processing_time = 0.0;

    // TranscriptionFailed / CaptureFailed
    TranscriptionErrorKind error_kind = TranscriptionErrorKind::Network;
    long http_status = 0;
    std::string error_message;
};

const char* toString(SessionEvent::Type type);

struct SessionStats {
    uint64_t frames = 0;
    int chunks_committed = 0;
    int chunks_discarded = 0;
    int chunks_dropped = 0;
    int chunks_transcribed = 0;
    int chunks_failed = 0;
    float noise_floor = 0.0f;
    float threshold = 0.0f;
    bool calibrated = false;
    double audio_seconds = 0.0;
};

/**
 * One recording session: capture thread -> segmenter -> bounded queue ->
 * transcription worker -> merger -> event callback.
 *
 * The capture thread owns the source and the segmenter. The worker thread is
 * the only writer of the transcript. Events are delivered from both threads,
 * one at a time.
 */
class SessionController {
public:
    using EventCallback = std::function<void(const SessionEvent&)>;

    SessionController(const SessionConfig& config, std::unique_ptr<AudioSource> source,
                      std::shared_ptr<TranscriptionClient> client, EventCallback on_event);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Opens the source and starts capturing. Throws TranscriptionError
    // (NotConfigured) if the client has no credentials and AudioDeviceError if
    // the input cannot be opened; returns false if already running.
    bool start();

    // Flushes the last chunk and returns the full transcript. Handing off the
    // last chunk and draining pending transcriptions share one stop_timeout.
    std::string stop();

    bool isRunning() const { return running_; }

    // True once capture has ended (end of input, duration limit, device failure or stop)
    bool waitUntilFinished(std::chrono::milliseconds timeout);

    SessionStats stats() const;
    std::string transcript() const;
    const SessionConfig& config() const { return config_; }

private:
    void captureLoop();
    void handleSegment(SegmentResult result, AudioChunk& chunk, std::chrono::milliseconds wait);
    void handleOutcome(const TranscriptionOutcome& outcome);
    void emit(const SessionEvent& event);
    void joinWorker();
    std::chrono::milliseconds flushWait();

    SessionConfig config_;
    std::unique_ptr<AudioSource> source_;
    std::shared_ptr<TranscriptionClient> client_;
    EventCallback on_event_;

    ChunkSegmenter segmenter_;
    TranscriptMerger merger_;
    std::unique_ptr<ChunkQueue> queue_;
    std::unique_ptr<TranscriptionWorker> worker_;
    std::thread capture_thread_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> accept_results_{false};

    std::mutex finish_mutex_;
    std::condition_variable finish_cv_;
    bool capture_finished_ = false;
    bool stop_deadline_set_ = false;
    std::chrono::steady_clock::time_point stop_deadline_;

    mutable std::mutex transcript_mutex_;
    mutable std::mutex stats_mutex_;
    SessionStats stats_;
    std::mutex sink_mutex_;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_SESSION_CONTROLLER_HPP

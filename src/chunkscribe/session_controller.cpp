#include "chunkscribe/session_controller.hpp"
#include "chunkscribe/log.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace chunkscribe {

namespace {
    std::chrono::milliseconds toMillis(double seconds) {
        return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    }

    std::chrono::milliseconds remainingUntil(std::chrono::steady_clock::time_point deadline) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    ChunkSegmenter::Config segmenterConfig(const SessionConfig& config) {
        ChunkSegmenter::Config seg = config.segmenter;
        seg.chunked = config.chunked;
        return seg;
    }
}

const char* toString(SessionEvent::Type type) {
    switch (type) {
        case SessionEvent::Type::ChunkCommitted: return "chunk_committed";
        case SessionEvent::Type::ChunkDiscarded: return "chunk_discarded";
        case SessionEvent::Type::ChunkDropped: return "chunk_dropped";
        case SessionEvent::Type::TranscriptionSucceeded: return "transcription_succeeded";
        case SessionEvent::Type::TranscriptionFailed: return "transcription_failed";
        case SessionEvent::Type::CaptureFailed: return "capture_failed";
    }
    return "unknown";
}

SessionController::SessionController(const SessionConfig& config, std::unique_ptr<AudioSource> source,
                                     std::shared_ptr<TranscriptionClient> client, EventCallback on_event)
    : config_(config),
      source_(std::move(source)),
      client_(std::move(client)),
      on_event_(std::move(on_event)),
      segmenter_(config.audio, segmenterConfig(config), config.vad) {
    if (!source_) {
        throw std::invalid_argument("SessionController needs an audio source");
    }
    if (!client_) {
        throw std::invalid_argument("SessionController needs a transcription client");
    }
}

SessionController::~SessionController() {
    if (running_) {
        stop();
    }
    joinWorker();
}

bool SessionController::start() {
    if (running_) {
        logWarning("Session", "Session already running");
        return false;
    }

    // A worker left over from a stop() that timed out must finish first
    joinWorker();

    {
        std::lock_guard<std::mutex> lock(transcript_mutex_);
        merger_.reset();
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = SessionStats();
    }
    segmenter_.reset();

    if (!client_->isConfigured()) {
        throw TranscriptionError(TranscriptionErrorKind::NotConfigured,
                                 "No API key configured for " + client_->describe());
    }

    // Throws AudioDeviceError; nothing has been started yet
    source_->open(config_.audio);
    logInfo("Session", "Input: " + source_->describe());
    logInfo("Session", "Transcription: " + client_->describe());

    {
        std::lock_guard<std::mutex> lock(finish_mutex_);
        capture_finished_ = false;
        stop_deadline_set_ = false;
    }
    stop_requested_ = false;
    accept_results_ = true;

    queue_ = std::make_unique<ChunkQueue>(config_.queue_depth);
    worker_ = std::make_unique<TranscriptionWorker>(client_, *queue_, [this](const TranscriptionOutcome& outcome) {
        handleOutcome(outcome);
    });
    worker_->setChunkDumpDir(config_.chunk_dump_dir);
    worker_->setLanguageHint(config_.transcription.language);
    worker_->start();

    running_ = true;
    capture_thread_ = std::thread(&SessionController::captureLoop, this);

    if (config_.vad.calibration_frames > 0) {
        logInfo("Session", "Calibrating noise floor, please stay quiet...");
    }
    return true;
}

std::string SessionController::stop() {
    if (!running_) {
        return transcript();
    }

    const auto deadline = std::chrono::steady_clock::now() + toMillis(config_.stop_timeout);
    {
        std::lock_guard<std::mutex> lock(finish_mutex_);
        stop_deadline_ = deadline;
        stop_deadline_set_ = true;
    }
    stop_requested_ = true;
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }

    if (worker_ && !worker_->waitUntilDone(remainingUntil(deadline))) {
        accept_results_ = false;
        size_t pending = queue_ ? queue_->clear() : 0;
        logWarning("Session", "Transcription did not finish within " + std::to_string(config_.stop_timeout) +
                              " s; " + std::to_string(pending) + " queued chunk(s) abandoned, late results discarded");
    } else {
        joinWorker();
    }

    running_ = false;
    logInfo("Session", "Session stopped");
    return transcript();
}

bool SessionController::waitUntilFinished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(finish_mutex_);
    return finish_cv_.wait_for(lock, timeout, [this] { return capture_finished_; });
}

SessionStats SessionController::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

std::string SessionController::transcript() const {
    std::lock_guard<std::mutex> lock(transcript_mutex_);
    return merger_.transcript();
}

void SessionController::joinWorker() {
    if (worker_) {
        worker_->join();
        worker_.reset();
    }
    queue_.reset();
}

std::chrono::milliseconds SessionController::flushWait() {
    std::lock_guard<std::mutex> lock(finish_mutex_);
    if (stop_deadline_set_) {
        return remainingUntil(stop_deadline_);
    }
    return toMillis(config_.stop_timeout);
}

void SessionController::captureLoop() {
    const auto started = std::chrono::steady_clock::now();
    const double frame_seconds = static_cast<double>(config_.audio.frames_per_buffer) / config_.audio.sample_rate;
    AudioFrame frame;
    AudioChunk chunk;

    try {
        while (!stop_requested_) {
            if (config_.max_session_duration > 0.0) {
                std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
                if (elapsed.count() >= config_.max_session_duration) {
                    logInfo("Session", "Maximum session duration reached");
                    break;
                }
            }

            if (!source_->read(frame)) {
                logInfo("Session", "End of audio input");
                break;
            }

            SegmentResult result = segmenter_.processFrame(frame, chunk);
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.frames++;
                stats_.audio_seconds += frame_seconds;
                stats_.calibrated = segmenter_.detector().isCalibrated();
                stats_.noise_floor = segmenter_.noiseFloor();
                stats_.threshold = segmenter_.threshold();
            }
            handleSegment(result, chunk, std::chrono::milliseconds(0));
        }
    } catch (const std::exception& e) {
        logError("Session", std::string("Audio capture failed: ") + e.what());
        SessionEvent event;
        event.type = SessionEvent::Type::CaptureFailed;
        event.error_message = e.what();
        emit(event);
    }

    handleSegment(segmenter_.flush(chunk), chunk, flushWait());

    source_->close();
    queue_->close();

    {
        std::lock_guard<std::mutex> lock(finish_mutex_);
        capture_finished_ = true;
    }
    finish_cv_.notify_all();
}

void SessionController::handleSegment(SegmentResult result, AudioChunk& chunk, std::chrono::milliseconds wait) {
    if (result == SegmentResult::None) {
        return;
    }

    SessionEvent event;
    event.chunk_index = chunk.index;
    event.audio_duration = chunk.duration;
    event.speech_duration = chunk.speech_duration;
    event.is_final = chunk.is_final;

    if (result == SegmentResult::ChunkDiscarded) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.chunks_discarded++;
        }
        event.type = SessionEvent::Type::ChunkDiscarded;
        emit(event);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.chunks_committed++;
    }
    event.type = SessionEvent::Type::ChunkCommitted;
    emit(event);

    std::vector<int> dropped;
    queue_->push(std::move(chunk), wait, &dropped);
    for (int index : dropped) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.chunks_dropped++;
        }
        SessionEvent drop_event;
        drop_event.type = SessionEvent::Type::ChunkDropped;
        drop_event.chunk_index = index;
        emit(drop_event);
    }
}

void SessionController::handleOutcome(const TranscriptionOutcome& outcome) {
    if (!accept_results_) {
        logWarning("Session", "Discarding late result for chunk " + std::to_string(outcome.chunk_index));
        return;
    }

    SessionEvent event;
    event.chunk_index = outcome.chunk_index;
    event.audio_duration = outcome.audio_duration;
    event.speech_duration = outcome.speech_duration;
    event.is_final = outcome.is_final;
    event.processing_time = outcome.processing_time;

    if (!outcome.success) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.chunks_failed++;
        }
        event.type = SessionEvent::Type::TranscriptionFailed;
        event.error_kind = outcome.error_kind;
        event.http_status = outcome.http_status;
        event.error_message = outcome.error_message;
        {
            std::lock_guard<std::mutex> lock(transcript_mutex_);
            event.transcript = merger_.transcript();
        }
        emit(event);
        return;
    }

    MergeResult merged;
    {
        std::lock_guard<std::mutex> lock(transcript_mutex_);
        merged = merger_.append(outcome.text);
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.chunks_transcribed++;
    }

    event.type = SessionEvent::Type::TranscriptionSucceeded;
    event.raw_text = outcome.text;
    event.new_text = merged.new_text;
    event.transcript = merged.merged;
    logDebug("Session", "Chunk " + std::to_string(outcome.chunk_index) + " transcribed in " +
                        std::to_string(outcome.processing_time) + " s");
    emit(event);
}

void SessionController::emit(const SessionEvent& event) {
    if (!on_event_) {
        return;
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    try {
        on_event_(event);
    } catch (const std::exception& e) {
        logError("Session", std::string("Event handler threw on ") + toString(event.type) + ": " + e.what());
    }
}

} // namespace chunkscribe

#ifndef CHUNKSCRIBE_TRANSCRIPTION_WORKER_HPP
#define CHUNKSCRIBE_TRANSCRIPTION_WORKER_HPP

#include "chunkscribe/chunk_queue.hpp"
#include "chunkscribe/transcription_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace chunkscribe {

struct TranscriptionOutcome {
    int chunk_index = 0;
    bool success = false;
    std::string text;
    TranscriptionErrorKind error_kind = TranscriptionErrorKind::Network;
    long http_status = 0;
    std::string error_message;
    double audio_duration = 0.0;
    double speech_duration = 0.0;
    double processing_time = 0.0;  // Seconds spent in the client
    bool is_final = false;
};

// Single consumer of the chunk queue. Chunks are transcribed strictly in order.
class TranscriptionWorker {
public:
    using ResultCallback = std::function<void(const TranscriptionOutcome&)>;

    TranscriptionWorker(std::shared_ptr<TranscriptionClient> client, ChunkQueue& queue, ResultCallback callback);
    ~TranscriptionWorker();

    // Directory for a WAV copy of every chunk; empty disables
    void setChunkDumpDir(const std::string& dir);
    void setLanguageHint(const std::string& language);

    void start();

    // True once the queue is closed and drained, false on timeout
    bool waitUntilDone(std::chrono::milliseconds timeout);

    void join();

    bool isRunning() const { return running_; }
    bool isBusy() const { return busy_; }

private:
    void workerThread();
    void processChunk(const AudioChunk& chunk);
    void dumpChunk(const AudioChunk& chunk);

    std::shared_ptr<TranscriptionClient> client_;
    ChunkQueue& queue_;
    ResultCallback callback_;
    std::string chunk_dump_dir_;
    std::string language_hint_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> busy_{false};

    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool done_ = false;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_TRANSCRIPTION_WORKER_HPP

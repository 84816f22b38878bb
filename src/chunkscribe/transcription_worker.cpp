#include "chunkscribe/transcription_worker.hpp"
#include "chunkscribe/log.hpp"
#include "chunkscribe/wav_encoder.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

namespace chunkscribe {

TranscriptionWorker::TranscriptionWorker(std::shared_ptr<TranscriptionClient> client, ChunkQueue& queue,
                                         ResultCallback callback)
    : client_(std::move(client)), queue_(queue), callback_(std::move(callback)) {
}

TranscriptionWorker::~TranscriptionWorker() {
    queue_.close();
    join();
}

void TranscriptionWorker::setChunkDumpDir(const std::string& dir) {
    chunk_dump_dir_ = dir;
}

void TranscriptionWorker::setLanguageHint(const std::string& language) {
    language_hint_ = language;
}

void TranscriptionWorker::start() {
    if (running_) {
        return;
    }
    running_ = true;
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = false;
    }
    thread_ = std::thread(&TranscriptionWorker::workerThread, this);
}

void TranscriptionWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void TranscriptionWorker::workerThread() {
    AudioChunk chunk;
    while (queue_.pop(chunk)) {
        busy_ = true;
        processChunk(chunk);
        busy_ = false;
    }
    logDebug("Worker", "Chunk queue closed, worker exiting");

    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

bool TranscriptionWorker::waitUntilDone(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(done_mutex_);
    if (!running_) {
        return true;
    }
    return done_cv_.wait_for(lock, timeout, [this] { return done_; });
}

void TranscriptionWorker::processChunk(const AudioChunk& chunk) {
    if (!chunk_dump_dir_.empty()) {
        dumpChunk(chunk);
    }

    TranscriptionOutcome outcome;
    outcome.chunk_index = chunk.index;
    outcome.audio_duration = chunk.duration;
    outcome.speech_duration = chunk.speech_duration;
    outcome.is_final = chunk.is_final;

    auto start_time = std::chrono::steady_clock::now();

    try {
        outcome.text = client_->transcribe(chunk.wav, language_hint_);
        outcome.success = true;
    } catch (const TranscriptionError& e) {
        outcome.error_kind = e.kind();
        outcome.http_status = e.httpStatus();
        outcome.error_message = e.what();
    } catch (const std::exception& e) {
        outcome.error_kind = TranscriptionErrorKind::Network;
        outcome.error_message = e.what();
    }

    auto end_time = std::chrono::steady_clock::now();
    outcome.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time).count() / 1000.0;

    if (!outcome.success) {
        logError("Worker", "Chunk " + std::to_string(chunk.index) + " failed (" + toString(outcome.error_kind) +
                           "): " + outcome.error_message);
    }

    if (callback_) {
        try {
            callback_(outcome);
        } catch (const std::exception& e) {
            logError("Worker", std::string("Result handler threw: ") + e.what());
        }
    }
}

void TranscriptionWorker::dumpChunk(const AudioChunk& chunk) {
    std::error_code ec;
    std::filesystem::create_directories(chunk_dump_dir_, ec);
    if (ec) {
        logWarning("Worker", "Cannot create " + chunk_dump_dir_ + ": " + ec.message());
        return;
    }

    std::ostringstream name;
    name << "chunk_" << std::setw(4) << std::setfill('0') << chunk.index << ".wav";
    const std::string path = (std::filesystem::path(chunk_dump_dir_) / name.str()).string();
    if (!writeFile(path, chunk.wav)) {
        logWarning("Worker", "Failed to write " + path);
        return;
    }
    logDebug("Worker", "Saved " + path);
}

} // namespace chunkscribe

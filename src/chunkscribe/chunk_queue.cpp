#include "chunkscribe/chunk_queue.hpp"
#include "chunkscribe/log.hpp"

#include <algorithm>
#include <utility>

namespace chunkscribe {

ChunkQueue::ChunkQueue(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {
}

bool ChunkQueue::push(AudioChunk&& chunk, std::chrono::milliseconds wait, std::vector<int>* dropped_indices) {
    bool dropped = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            logWarning("Queue", "Queue closed, chunk " + std::to_string(chunk.index) + " not queued");
            return false;
        }

        if (queue_.size() >= capacity_ && wait.count() > 0) {
            not_full_.wait_for(lock, wait, [this] {
                return queue_.size() < capacity_ || closed_;
            });
            if (closed_) {
                return false;
            }
        }

        while (queue_.size() >= capacity_) {
            logWarning("Queue", "Transcription is falling behind, dropping chunk " +
                                std::to_string(queue_.front().index));
            if (dropped_indices) dropped_indices->push_back(queue_.front().index);
            queue_.pop_front();
            dropped_++;
            dropped = true;
        }

        queue_.push_back(std::move(chunk));
    }
    not_empty_.notify_one();
    return !dropped;
}

bool ChunkQueue::pop(AudioChunk& chunk) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] {
            return !queue_.empty() || closed_;
        });

        if (queue_.empty()) {
            return false;
        }

        chunk = std::move(queue_.front());
        queue_.pop_front();
    }
    not_full_.notify_one();
    return true;
}

void ChunkQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool ChunkQueue::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ChunkQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = queue_.size();
    queue_.clear();
    return count;
}

size_t ChunkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ChunkQueue::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace chunkscribe

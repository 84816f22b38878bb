#ifndef CHUNKSCRIBE_CHUNK_QUEUE_HPP
#define CHUNKSCRIBE_CHUNK_QUEUE_HPP

#include "chunkscribe/chunk_segmenter.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace chunkscribe {

// Bounded hand-off from the capture thread to the transcription worker.
// A full queue drops its oldest chunk rather than blocking the producer.
class ChunkQueue {
public:
    explicit ChunkQueue(size_t capacity = 2);

    // Waits up to `wait` for room; returns false if a queued chunk had to be
    // dropped (its index is appended to dropped_indices when given)
    bool push(AudioChunk&& chunk, std::chrono::milliseconds wait = std::chrono::milliseconds(0),
              std::vector<int>* dropped_indices = nullptr);

    // Blocks until a chunk is available; false once closed and drained
    bool pop(AudioChunk& chunk);

    // Wakes the consumer; pushes after close are ignored
    void close();
    bool isClosed() const;

    // Drops everything still waiting; returns how many
    size_t clear();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t droppedCount() const;

private:
    const size_t capacity_;
    std::deque<AudioChunk> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
    size_t dropped_ = 0;
};

} // namespace chunkscribe

#endif // CHUNKSCRIBE_CHUNK_QUEUE_HPP

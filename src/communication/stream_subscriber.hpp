#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include "stream_message.hpp"

// One live consumer of the annotated stream with a bounded outbound queue
// push() never waits for the consumer: a full queue loses its oldest message
class StreamSubscriber
{
public:
    using MessagePtr = std::shared_ptr<const StreamMessage>;

    StreamSubscriber(uint64_t id, size_t capacity);

    // Enqueue, dropping the oldest queued message when full
    // Returns false when the subscriber is closed
    bool push(MessagePtr message);

    // Wait up to timeout_ms for a message, false on timeout or once closed
    bool pop(MessagePtr &message, int timeout_ms = 100);

    // Wake any waiting pop() and discard the queue; the subscriber stays closed
    void close();
    bool isClosed() const { return closed_; }

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_; }
    uint64_t id() const { return id_; }

private:
    const uint64_t id_;
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<MessagePtr> queue_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> dropped_{0};
};

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "stream_subscriber.hpp"

// Fans published frames out to every live subscriber
// publish() touches each subscriber queue once under that queue's own lock,
// so its cost depends on the subscriber count only, never on consumer speed
class StreamBroadcaster
{
public:
    explicit StreamBroadcaster(size_t queue_depth = 2, int jpeg_quality = 80);

    std::shared_ptr<StreamSubscriber> subscribe();

    // Closes the subscriber and discards its queue
    void unsubscribe(const std::shared_ptr<StreamSubscriber> &subscriber);

    void publish(cv::Mat annotated,
                 std::vector<Detection> detections,
                 uint64_t sequence,
                 std::chrono::system_clock::time_point timestamp);
    void publish(std::shared_ptr<const StreamMessage> message);

    // Close and forget every subscriber (pipeline stopped)
    void closeAll();

    size_t subscriberCount() const;
    size_t queueDepth() const { return queue_depth_; }
    uint64_t publishedCount() const { return published_; }

private:
    const size_t queue_depth_;
    const int jpeg_quality_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<StreamSubscriber>> subscribers_;
    uint64_t next_id_ = 1;
    std::atomic<uint64_t> published_{0};
};

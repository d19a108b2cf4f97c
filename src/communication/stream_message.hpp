#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "postprocess/detection.hpp"

// One published frame: the annotated image plus the detections drawn on it
// Shared read-only between all subscribers; the wire payload is built on first
// request by whichever delivery thread gets there first, never by the publisher
class StreamMessage
{
public:
    StreamMessage(cv::Mat annotated,
                  std::vector<Detection> detections,
                  uint64_t sequence,
                  std::chrono::system_clock::time_point timestamp,
                  int jpeg_quality = 80);

    const cv::Mat &frame() const { return frame_; }
    const std::vector<Detection> &detections() const { return detections_; }
    uint64_t sequence() const { return sequence_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

    // {"frame": <base64 JPEG>, "detections": [...], "timestamp": ISO-8601, "sequence": n}
    const std::string &payload() const;

private:
    cv::Mat frame_;
    std::vector<Detection> detections_;
    uint64_t sequence_;
    std::chrono::system_clock::time_point timestamp_;
    int jpeg_quality_;

    mutable std::once_flag encoded_;
    mutable std::string payload_;
};

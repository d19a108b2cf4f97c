#pragma once
#include <chrono>
#include <cstdint>
#include <opencv2/core.hpp>

// One decoded image plus its capture metadata
// Owned by the loop iteration that produced it, consumers that outlive
// the iteration take a clone
struct Frame
{
    cv::Mat image;                                     // BGR pixels
    uint64_t sequence = 0;                             // Monotonic within the session
    std::chrono::system_clock::time_point captured_at; // Wall-clock capture time

    int width() const { return image.cols; }
    int height() const { return image.rows; }
    bool empty() const { return image.empty(); }
};

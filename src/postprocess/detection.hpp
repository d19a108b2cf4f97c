#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

// Box in source-frame pixels, x1 < x2 and y1 < y2 once it leaves post-processing
struct BoundingBox
{
    float x1 = 0.0f;
    float y1 = 0.0f;
    float x2 = 0.0f;
    float y2 = 0.0f;

    float width() const { return x2 - x1; }
    float height() const { return y2 - y1; }
    float area() const { return valid() ? width() * height() : 0.0f; }
    bool valid() const { return x1 < x2 && y1 < y2; }
};

// One labeled, scored finding within a frame
// Treated as an immutable value once created by post-processing
struct Detection
{
    std::string class_name;
    float confidence = 0.0f; // [0, 1]
    BoundingBox bbox;
    std::chrono::system_clock::time_point timestamp; // Capture time of the frame
    uint64_t frame_sequence = 0;
    std::optional<double> frame_position; // Distance along the pipe in meters, when known
};

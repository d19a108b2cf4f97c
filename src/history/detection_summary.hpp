#pragma once
#include <map>
#include <string>
#include <vector>
#include "postprocess/detection.hpp"

// Aggregates over a set of detections, always recomputed from a snapshot
struct DetectionSummary
{
    size_t total_detections = 0;
    std::map<std::string, size_t> by_class; // Ordered by class name

    // Only meaningful when has_data is true, all zero otherwise
    bool has_data = false;
    double average_confidence = 0.0;
    double highest_confidence = 0.0;
    double lowest_confidence = 0.0;

    static DetectionSummary fromDetections(const std::vector<Detection> &detections);

    bool operator==(const DetectionSummary &other) const;
    bool operator!=(const DetectionSummary &other) const { return !(*this == other); }
};

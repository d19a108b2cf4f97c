#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "detection.hpp"

namespace annotation
{
    // Return a copy of frame with a box and a "class: conf" label per detection
    cv::Mat drawDetections(const cv::Mat &frame, const std::vector<Detection> &detections);

} // namespace annotation

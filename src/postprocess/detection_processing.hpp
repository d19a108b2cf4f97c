#pragma once

#include <optional>
#include <vector>
#include "backend/backend_interface.hpp"
#include "detection.hpp"
#include "source/frame.hpp"

namespace detection_processing
{
    // Intersection area / union area, 0 when the union is empty
    float overlapRatio(const BoundingBox &a, const BoundingBox &b);

    // Clamp a box to [0, width] x [0, height]
    BoundingBox clampToFrame(const BoundingBox &box, int width, int height);

    // Greedy per-class suppression: highest confidence first (ties keep first-seen order),
    // drop every same-class box whose overlap with a kept box exceeds overlap_threshold
    // Returns the indices of the kept detections in selection order
    std::vector<size_t> suppressOverlaps(const std::vector<RawDetection> &candidates, float overlap_threshold);

    // Full post-processing for one frame:
    //   1. drop candidates below confidence_threshold
    //   2. group by class label (groups in first-seen order)
    //   3. greedy overlap suppression inside each group
    //   4. clamp surviving boxes to the frame, drop the ones left empty
    //   5. stamp with the frame's capture time, sequence number and position
    // Deterministic for identical input
    std::vector<Detection> process(const std::vector<RawDetection> &raw,
                                   const Frame &frame,
                                   float confidence_threshold,
                                   float overlap_threshold,
                                   std::optional<double> frame_position = std::nullopt);

} // namespace detection_processing

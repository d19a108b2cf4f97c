#include "detection_processing.hpp"
#include <algorithm>
#include <numeric>

using namespace std;

namespace detection_processing
{
    namespace
    {
        BoundingBox boxOf(const RawDetection &det)
        {
            return BoundingBox{det.x1, det.y1, det.x2, det.y2};
        }
    }

    float overlapRatio(const BoundingBox &a, const BoundingBox &b)
    {
        float ix1 = max(a.x1, b.x1);
        float iy1 = max(a.y1, b.y1);
        float ix2 = min(a.x2, b.x2);
        float iy2 = min(a.y2, b.y2);

        float inter = max(0.0f, ix2 - ix1) * max(0.0f, iy2 - iy1);
        float uni = a.area() + b.area() - inter;
        return uni > 0.0f ? inter / uni : 0.0f;
    }

    BoundingBox clampToFrame(const BoundingBox &box, int width, int height)
    {
        BoundingBox clamped;
        clamped.x1 = min(max(box.x1, 0.0f), static_cast<float>(width));
        clamped.y1 = min(max(box.y1, 0.0f), static_cast<float>(height));
        clamped.x2 = min(max(box.x2, 0.0f), static_cast<float>(width));
        clamped.y2 = min(max(box.y2, 0.0f), static_cast<float>(height));
        return clamped;
    }

    vector<size_t> suppressOverlaps(const vector<RawDetection> &candidates, float overlap_threshold)
    {
        vector<size_t> order(candidates.size());
        iota(order.begin(), order.end(), 0);

        // Stable: equal confidences keep their arrival order
        stable_sort(order.begin(), order.end(), [&](size_t a, size_t b)
                    { return candidates[a].confidence > candidates[b].confidence; });

        vector<size_t> keep;
        vector<char> suppressed(candidates.size(), 0);

        for (size_t i = 0; i < order.size(); ++i)
        {
            size_t current = order[i];
            if (suppressed[current])
                continue;
            keep.push_back(current);

            BoundingBox kept = boxOf(candidates[current]);
            for (size_t j = i + 1; j < order.size(); ++j)
            {
                size_t other = order[j];
                if (suppressed[other] || candidates[other].label != candidates[current].label)
                    continue;
                if (overlapRatio(kept, boxOf(candidates[other])) > overlap_threshold)
                    suppressed[other] = 1;
            }
        }

        return keep;
    }

    vector<Detection> process(const vector<RawDetection> &raw,
                              const Frame &frame,
                              float confidence_threshold,
                              float overlap_threshold,
                              optional<double> frame_position)
    {
        // 1 + 2: filter and group, preserving first-seen order of the labels
        vector<string> labels;
        vector<vector<RawDetection>> groups;
        for (const auto &det : raw)
        {
            if (det.confidence < confidence_threshold)
                continue;
            if (!boxOf(det).valid())
                continue;

            auto it = find(labels.begin(), labels.end(), det.label);
            if (it == labels.end())
            {
                labels.push_back(det.label);
                groups.push_back({det});
            }
            else
            {
                groups[it - labels.begin()].push_back(det);
            }
        }

        vector<Detection> result;
        for (const auto &group : groups)
        {
            // 3: suppression within the class
            for (size_t index : suppressOverlaps(group, overlap_threshold))
            {
                const RawDetection &det = group[index];

                // 4: clamp, a box entirely outside the frame has nothing left to show
                BoundingBox box = clampToFrame(boxOf(det), frame.width(), frame.height());
                if (!box.valid())
                    continue;

                // 5: stamp
                Detection out;
                out.class_name = det.label;
                out.confidence = min(max(det.confidence, 0.0f), 1.0f);
                out.bbox = box;
                out.timestamp = frame.captured_at;
                out.frame_sequence = frame.sequence;
                out.frame_position = frame_position;
                result.push_back(out);
            }
        }

        return result;
    }

} // namespace detection_processing

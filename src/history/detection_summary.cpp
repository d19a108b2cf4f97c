#include "detection_summary.hpp"
#include <algorithm>

using namespace std;

DetectionSummary DetectionSummary::fromDetections(const vector<Detection> &detections)
{
    DetectionSummary summary;
    summary.total_detections = detections.size();
    if (detections.empty())
        return summary;

    double sum = 0.0;
    summary.highest_confidence = detections.front().confidence;
    summary.lowest_confidence = detections.front().confidence;

    for (const auto &det : detections)
    {
        summary.by_class[det.class_name]++;
        sum += det.confidence;
        summary.highest_confidence = max<double>(summary.highest_confidence, det.confidence);
        summary.lowest_confidence = min<double>(summary.lowest_confidence, det.confidence);
    }

    summary.has_data = true;
    summary.average_confidence = sum / static_cast<double>(detections.size());
    return summary;
}

bool DetectionSummary::operator==(const DetectionSummary &other) const
{
    return total_detections == other.total_detections &&
           by_class == other.by_class &&
           has_data == other.has_data &&
           average_confidence == other.average_confidence &&
           highest_confidence == other.highest_confidence &&
           lowest_confidence == other.lowest_confidence;
}

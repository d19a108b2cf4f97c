#pragma once
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include "history/detection_summary.hpp"
#include "postprocess/detection.hpp"

// Free text supplied by whoever requests the report
struct ReportMetadata
{
    std::string location;
    std::string inspector;
    std::string notes;
};

// Everything a renderer needs: {metadata, detections[], summary}
struct InspectionReport
{
    std::string id; // YYYYMMDD_HHMMSS, "_N" appended on collision
    std::chrono::system_clock::time_point created_at;
    ReportMetadata metadata;
    std::vector<Detection> detections;
    DetectionSummary summary;
    std::map<std::string, std::string> severity_by_class; // Classes present in the summary only
};

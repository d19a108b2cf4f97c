#pragma once
#include <nlohmann/json.hpp>
#include "history/detection_summary.hpp"
#include "pipeline/pipeline_controller.hpp"
#include "pipeline/pipeline_error.hpp"
#include "postprocess/detection.hpp"
#include "report/inspection_report.hpp"
#include "report/report_archive.hpp"

// nlohmann/json conversions for the types that cross the HTTP and stream boundaries
// Found through ADL, so `json j = detection;` works anywhere this header is included

// {"x1", "y1", "x2", "y2"} as integer pixels
void to_json(nlohmann::json &j, const BoundingBox &box);

// {class_name, confidence, bbox, timestamp (ISO-8601), sequence, frame_position (number or null)}
void to_json(nlohmann::json &j, const Detection &detection);

// {total_detections, by_class, average_confidence (null without data), highest/lowest_confidence, has_data}
void to_json(nlohmann::json &j, const DetectionSummary &summary);

void to_json(nlohmann::json &j, const ReportMetadata &metadata);

// Missing keys stay empty, non-string values throw json::type_error
void from_json(const nlohmann::json &j, ReportMetadata &metadata);

// {metadata{location, inspector, notes, report_id, timestamp, total_detections},
//  detections, summary, severity_by_class}
void to_json(nlohmann::json &j, const InspectionReport &report);

void to_json(nlohmann::json &j, const ReportEntry &entry);

// {error, code, category} plus "cause" for wrapped errors
void to_json(nlohmann::json &j, const PipelineError &error);

void to_json(nlohmann::json &j, const SourceDescriptor &source);
void to_json(nlohmann::json &j, const BackendDescriptor &backend);
void to_json(nlohmann::json &j, const PipelineStatus &status);

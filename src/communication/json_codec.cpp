#include "json_codec.hpp"
#include "utils.hpp"

using namespace std;
using json = nlohmann::json;

void to_json(json &j, const BoundingBox &box)
{
    j = json{{"x1", static_cast<int>(box.x1)},
             {"y1", static_cast<int>(box.y1)},
             {"x2", static_cast<int>(box.x2)},
             {"y2", static_cast<int>(box.y2)}};
}

void to_json(json &j, const Detection &detection)
{
    j = json{{"class_name", detection.class_name},
             {"confidence", detection.confidence},
             {"bbox", detection.bbox},
             {"timestamp", timefmt::toIsoString(detection.timestamp)},
             {"sequence", detection.frame_sequence}};

    if (detection.frame_position)
        j["frame_position"] = *detection.frame_position;
    else
        j["frame_position"] = nullptr;
}

void to_json(json &j, const DetectionSummary &summary)
{
    j = json{{"total_detections", summary.total_detections},
             {"by_class", summary.by_class},
             {"has_data", summary.has_data},
             {"highest_confidence", summary.highest_confidence},
             {"lowest_confidence", summary.lowest_confidence}};

    if (summary.has_data)
        j["average_confidence"] = summary.average_confidence;
    else
        j["average_confidence"] = nullptr;
}

void to_json(json &j, const ReportMetadata &metadata)
{
    j = json{{"location", metadata.location},
             {"inspector", metadata.inspector},
             {"notes", metadata.notes}};
}

void from_json(const json &j, ReportMetadata &metadata)
{
    metadata.location = j.value("location", "");
    metadata.inspector = j.value("inspector", "");
    metadata.notes = j.value("notes", "");
}

void to_json(json &j, const InspectionReport &report)
{
    json metadata = report.metadata;
    metadata["report_id"] = report.id;
    metadata["timestamp"] = timefmt::toIsoString(report.created_at);
    metadata["total_detections"] = report.detections.size();

    j = json{{"metadata", metadata},
             {"detections", report.detections},
             {"summary", report.summary},
             {"severity_by_class", report.severity_by_class}};
}

void to_json(json &j, const ReportEntry &entry)
{
    j = json{{"filename", entry.filename},
             {"id", entry.id},
             {"format", entry.format},
             {"created", timefmt::toIsoString(entry.created)},
             {"size", entry.size}};
}

void to_json(json &j, const PipelineError &error)
{
    j = json{{"error", error.message},
             {"code", errorCodeToString(error.code)},
             {"category", errorCategoryToString(error.category())}};

    if (error.cause != ErrorCode::NONE)
        j["cause"] = errorCodeToString(error.cause);
}

void to_json(json &j, const SourceDescriptor &source)
{
    j = json{{"source", source.toString()},
             {"type", source.typeName()},
             {"loop_playback", source.loop_playback}};
}

void to_json(json &j, const BackendDescriptor &backend)
{
    j = json{{"kind", backendKindToString(backend.kind)},
             {"model_path", backend.model_path},
             {"precision", precisionToString(backend.precision)},
             {"input_size", {backend.input_width, backend.input_height}},
             {"classes", backend.class_names}};

    if (backend.kind == BackendKind::ACCELERATED)
        j["delegate"] = backend.delegate;
}

void to_json(json &j, const PipelineStatus &status)
{
    json source = status.source;
    source["open"] = status.source_open;
    if (status.source_open)
    {
        source["width"] = status.source_info.width;
        source["height"] = status.source_info.height;
        source["fps"] = status.source_info.fps;
    }

    json backend = status.backend;
    backend["loaded"] = status.backend_loaded;

    j = json{{"state", pipelineStateToString(status.state)},
             {"running", status.state == PipelineState::RUNNING},
             {"source", source},
             {"backend", backend},
             {"session_id", status.session_id},
             {"frames_processed", status.frames_processed},
             {"frames_skipped", status.frames_skipped},
             {"fps", status.fps},
             {"uptime_s", status.uptime_s}};

    if (status.last_error)
        j["last_error"] = status.last_error;
    else
        j["last_error"] = nullptr;
}

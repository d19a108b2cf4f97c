#include "report_assembler.hpp"
#include "postprocess/defect_classes.hpp"
#include "utils.hpp"
#include <filesystem>

using namespace std;

ReportAssembler::ReportAssembler(shared_ptr<DetectionStore> store, shared_ptr<ReportArchive> archive)
    : store_(move(store)), archive_(move(archive))
{
}

void ReportAssembler::registerRenderer(unique_ptr<ReportRenderer> renderer)
{
    if (!renderer)
        return;
    string format = renderer->format();
    renderers_[format] = move(renderer);
}

bool ReportAssembler::hasRenderer(const string &format) const
{
    return renderers_.count(format) > 0;
}

InspectionReport ReportAssembler::assemble(const string &id,
                                           chrono::system_clock::time_point created_at,
                                           const ReportMetadata &metadata,
                                           vector<Detection> detections)
{
    InspectionReport report;
    report.id = id;
    report.created_at = created_at;
    report.metadata = metadata;
    report.summary = DetectionSummary::fromDetections(detections);
    report.detections = move(detections);

    for (const auto &entry : report.summary.by_class)
    {
        report.severity_by_class[entry.first] =
            defect_classes::severityToString(defect_classes::severityOf(entry.first));
    }
    return report;
}

PipelineError ReportAssembler::generate(const string &session_id,
                                        const ReportMetadata &metadata,
                                        const string &format,
                                        GeneratedReport &result)
{
    auto renderer = renderers_.find(format);
    if (renderer == renderers_.end())
        return PipelineError(ErrorCode::INVALID_ARGUMENT, "Unsupported report format '" + format + "'");

    vector<Detection> detections = store_->snapshot(session_id);
    if (detections.empty())
        return PipelineError(ErrorCode::INVALID_ARGUMENT, "No detections available for report generation");

    string error;
    if (!archive_->ensureDirectory(error))
    {
        log_error(error);
        return PipelineError(ErrorCode::REPORT_WRITE_FAILED, error);
    }

    auto now = chrono::system_clock::now();
    InspectionReport report = assemble(archive_->allocateId(now), now, metadata, move(detections));

    string path = archive_->pathFor(report.id, renderer->second->extension());
    if (!renderer->second->render(report, path, error))
    {
        log_error("Report " + report.id + " failed: " + error);
        return PipelineError(ErrorCode::REPORT_WRITE_FAILED, error);
    }

    result.id = report.id;
    result.format = format;
    result.path = path;
    result.filename = std::filesystem::path(path).filename().string();
    result.total_detections = report.detections.size();

    log_info("Generated " + format + " report " + log_string_src(result.filename) + " with " +
             log_string(result.total_detections) + " detections");
    return PipelineError();
}

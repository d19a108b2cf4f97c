#pragma once
#include <map>
#include <memory>
#include <string>
#include "history/detection_store.hpp"
#include "inspection_report.hpp"
#include "pipeline/pipeline_error.hpp"
#include "report_archive.hpp"
#include "report_renderer.hpp"

// Result of a generate() call, enough for the caller to fetch the file later
struct GeneratedReport
{
    std::string id;
    std::string format;
    std::string filename;
    std::string path;
    size_t total_detections = 0;
};

// Builds reports from a point-in-time copy of a session's history
class ReportAssembler
{
public:
    ReportAssembler(std::shared_ptr<DetectionStore> store, std::shared_ptr<ReportArchive> archive);

    // Takes ownership; a renderer for an already registered format replaces it
    void registerRenderer(std::unique_ptr<ReportRenderer> renderer);
    bool hasRenderer(const std::string &format) const;

    // Pure: build the report structure from detections that were already copied
    static InspectionReport assemble(const std::string &id,
                                     std::chrono::system_clock::time_point created_at,
                                     const ReportMetadata &metadata,
                                     std::vector<Detection> detections);

    // Snapshot the session, assemble and render into the archive
    // REQUEST errors for an empty history or an unknown format
    PipelineError generate(const std::string &session_id,
                           const ReportMetadata &metadata,
                           const std::string &format,
                           GeneratedReport &result);

private:
    std::shared_ptr<DetectionStore> store_;
    std::shared_ptr<ReportArchive> archive_;
    std::map<std::string, std::unique_ptr<ReportRenderer>> renderers_;
};

#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include "history/detection_store.hpp"
#include "pipeline/pipeline_controller.hpp"
#include "report/report_archive.hpp"
#include "report/report_assembler.hpp"
#include "stream_broadcaster.hpp"

struct ApiServerSettings
{
    std::string host = "0.0.0.0";
    int port = 8000;
    int worker_threads = 8;
    int ping_interval_s = 30;
    size_t default_history_limit = 100;
    std::string version = "0.0.0";
};

// REST control surface plus the /ws/video live stream
// Every live stream client occupies one worker thread for the lifetime of its connection
class ApiServer
{
public:
    ApiServer(std::shared_ptr<PipelineController> controller,
              std::shared_ptr<DetectionStore> store,
              std::shared_ptr<StreamBroadcaster> broadcaster,
              std::shared_ptr<ReportAssembler> reports,
              std::shared_ptr<ReportArchive> archive,
              ApiServerSettings settings);
    ~ApiServer();

    // Bind and start serving in the background, false when the port cannot be bound
    bool start();
    void stop();
    bool isRunning() const { return running_; }

private:
    void registerRoutes();

    void handleStatus(const httplib::Request &req, httplib::Response &res);
    void handleStart(const httplib::Request &req, httplib::Response &res);
    void handleStop(const httplib::Request &req, httplib::Response &res);
    void handleGetSource(const httplib::Request &req, httplib::Response &res);
    void handleSetSource(const httplib::Request &req, httplib::Response &res);
    void handleListCameras(const httplib::Request &req, httplib::Response &res);
    void handleGetBackend(const httplib::Request &req, httplib::Response &res);
    void handleSetBackend(const httplib::Request &req, httplib::Response &res);
    void handleHistory(const httplib::Request &req, httplib::Response &res);
    void handleClear(const httplib::Request &req, httplib::Response &res);
    void handleGenerateReport(const httplib::Request &req, httplib::Response &res);
    void handleListReports(const httplib::Request &req, httplib::Response &res);
    void handleDownloadReport(const httplib::Request &req, httplib::Response &res);
    void handleVideoStream(const httplib::Request &req, httplib::Response &res);

    std::shared_ptr<PipelineController> controller_;
    std::shared_ptr<DetectionStore> store_;
    std::shared_ptr<StreamBroadcaster> broadcaster_;
    std::shared_ptr<ReportAssembler> reports_;
    std::shared_ptr<ReportArchive> archive_;
    ApiServerSettings settings_;

    std::unique_ptr<httplib::Server> server_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
};

// HTTP status for an error: STATE 409, REQUEST 400, everything else 500
int httpStatusFor(const PipelineError &error);

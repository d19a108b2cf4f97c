#include "api_server.hpp"
#include "backend/backend_factory.hpp"
#include "backend/dnn/accelerated_backend.hpp"
#include "json_codec.hpp"
#include "source/video_source.hpp"
#include "utils.hpp"
#include "utils/args.hpp"
#include "websocket_protocol.hpp"
#include <fstream>
#include <iterator>

using namespace std;
using json = nlohmann::json;

namespace
{
    void sendJson(httplib::Response &res, const json &body, int status = 200)
    {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

    void sendError(httplib::Response &res, const PipelineError &error)
    {
        json body = error;
        sendJson(res, body, httpStatusFor(error));
    }

    void sendBadRequest(httplib::Response &res, const string &message)
    {
        sendError(res, PipelineError(ErrorCode::INVALID_ARGUMENT, message));
    }

    // Empty bodies parse to an empty object
    bool parseBody(const httplib::Request &req, json &body, string &error)
    {
        if (req.body.empty())
        {
            body = json::object();
            return true;
        }
        try
        {
            body = json::parse(req.body);
        }
        catch (const json::parse_error &e)
        {
            error = string("Invalid JSON: ") + e.what();
            return false;
        }
        if (!body.is_object())
        {
            error = "Request body must be a JSON object";
            return false;
        }
        return true;
    }

    // Accepts "source": 0 as well as "source": "0"
    bool readSourceField(const json &body, string &source)
    {
        auto it = body.find("source");
        if (it == body.end())
            return false;
        if (it->is_number_integer())
            source = to_string(it->get<int>());
        else if (it->is_string())
            source = it->get<string>();
        else
            return false;
        return true;
    }

    // Overlay the backend fields of a request body onto a descriptor
    bool applyBackendFields(const json &body, BackendDescriptor &descriptor, string &error)
    {
        if (body.contains("backend"))
        {
            if (!body["backend"].is_string() || !BackendFactory::parseKind(body["backend"].get<string>(), descriptor.kind))
            {
                error = "backend must be 'full' or 'accelerated'";
                return false;
            }
            descriptor.precision = BackendFactory::defaultPrecision(descriptor.kind, descriptor.delegate);
        }
        if (body.contains("model"))
        {
            if (!body["model"].is_string() || body["model"].get<string>().empty())
            {
                error = "model must be a non-empty path";
                return false;
            }
            descriptor.model_path = body["model"].get<string>();
        }
        if (body.contains("delegate"))
        {
            if (!body["delegate"].is_string())
            {
                error = "delegate must be a string";
                return false;
            }
            descriptor.delegate = body["delegate"].get<string>();
            descriptor.precision = BackendFactory::defaultPrecision(descriptor.kind, descriptor.delegate);
        }
        if (body.contains("precision"))
        {
            if (!body["precision"].is_string() || !BackendFactory::parsePrecision(body["precision"].get<string>(), descriptor.precision))
            {
                error = "precision must be fp32, fp16 or int8";
                return false;
            }
        }
        return true;
    }

    json acceleratorAvailability()
    {
        json available = json::object();
        for (const char *delegate : {"cuda", "opencl", "vulkan", "npu"})
        {
            Precision precision = BackendFactory::defaultPrecision(BackendKind::ACCELERATED, delegate);
            available[delegate] = AcceleratedBackend::delegateAvailable(delegate, precision);
        }
        return available;
    }
}

int httpStatusFor(const PipelineError &error)
{
    switch (error.category())
    {
    case ErrorCategory::NONE:
        return 200;
    case ErrorCategory::STATE:
        return 409;
    case ErrorCategory::REQUEST:
        return 400;
    default:
        return 500;
    }
}

ApiServer::ApiServer(shared_ptr<PipelineController> controller,
                     shared_ptr<DetectionStore> store,
                     shared_ptr<StreamBroadcaster> broadcaster,
                     shared_ptr<ReportAssembler> reports,
                     shared_ptr<ReportArchive> archive,
                     ApiServerSettings settings)
    : controller_(move(controller)),
      store_(move(store)),
      broadcaster_(move(broadcaster)),
      reports_(move(reports)),
      archive_(move(archive)),
      settings_(move(settings))
{
}

ApiServer::~ApiServer()
{
    stop();
}

bool ApiServer::start()
{
    if (running_)
        return true;

    server_ = make_unique<httplib::Server>();

    int threads = settings_.worker_threads;
    server_->new_task_queue = [threads]
    { return new httplib::ThreadPool(threads); };

    // CORS headers
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    registerRoutes();

    if (!server_->bind_to_port(settings_.host, settings_.port))
    {
        log_error("Cannot bind " + settings_.host + ":" + to_string(settings_.port));
        server_.reset();
        return false;
    }

    running_ = true;
    worker_thread_ = thread([this]()
                            {
        log_info("REST server listening on http://" + settings_.host + ":" + to_string(settings_.port) + "/");
        log_info("Video stream on ws://" + settings_.host + ":" + to_string(settings_.port) + "/ws/video");
        if (!server_->listen_after_bind())
            log_error("HTTP server stopped unexpectedly");
        running_ = false; });
    return true;
}

void ApiServer::stop()
{
    bool was_running = running_.exchange(false);

    // Stream handlers leave their loops once running_ drops
    broadcaster_->closeAll();

    if (server_)
        server_->stop();
    if (worker_thread_.joinable())
        worker_thread_.join();
    server_.reset();

    if (was_running)
        log_info("API server stopped");
}

void ApiServer::registerRoutes()
{
    using namespace httplib;

    server_->Options(R"(.*)", [](const Request &, Response &res)
                     { res.status = 204; });

    server_->Get("/", [this](const Request &, Response &res)
                 { sendJson(res, {{"service", "PipeScope"},
                                  {"version", settings_.version},
                                  {"status", "running"},
                                  {"pipeline", pipelineStateToString(controller_->state())}}); });

    server_->Get("/api/system/status", [this](const Request &req, Response &res)
                 { handleStatus(req, res); });

    server_->Post("/api/pipeline/start", [this](const Request &req, Response &res)
                  { handleStart(req, res); });
    server_->Post("/api/camera/start", [this](const Request &req, Response &res)
                  { handleStart(req, res); });
    server_->Post("/api/pipeline/stop", [this](const Request &req, Response &res)
                  { handleStop(req, res); });
    server_->Post("/api/camera/stop", [this](const Request &req, Response &res)
                  { handleStop(req, res); });

    server_->Get("/api/camera/source", [this](const Request &req, Response &res)
                 { handleGetSource(req, res); });
    server_->Post("/api/camera/source", [this](const Request &req, Response &res)
                  { handleSetSource(req, res); });
    server_->Get("/api/cameras/list", [this](const Request &req, Response &res)
                 { handleListCameras(req, res); });

    server_->Get("/api/backend", [this](const Request &req, Response &res)
                 { handleGetBackend(req, res); });
    server_->Post("/api/backend", [this](const Request &req, Response &res)
                  { handleSetBackend(req, res); });

    server_->Get("/api/detections/history", [this](const Request &req, Response &res)
                 { handleHistory(req, res); });
    server_->Delete("/api/detections/clear", [this](const Request &req, Response &res)
                    { handleClear(req, res); });

    server_->Post("/api/report/generate", [this](const Request &req, Response &res)
                  { handleGenerateReport(req, res); });
    server_->Get("/api/reports/list", [this](const Request &req, Response &res)
                 { handleListReports(req, res); });
    server_->Get(R"(/api/report/download/([^/]+))", [this](const Request &req, Response &res)
                 { handleDownloadReport(req, res); });

    server_->Get("/ws/video", [this](const Request &req, Response &res)
                 { handleVideoStream(req, res); });
}

void ApiServer::handleStatus(const httplib::Request &, httplib::Response &res)
{
    PipelineStatus status = controller_->status();
    string session = status.session_id.empty() ? store_->currentSession() : status.session_id;

    json body;
    body["pipeline"] = status;
    body["camera"] = {{"is_running", status.state == PipelineState::RUNNING},
                      {"source", status.source.toString()},
                      {"type", status.source.typeName()}};
    body["detections"] = {{"session_id", session},
                          {"total", store_->size(session)},
                          {"summary", store_->summarize(session)}};
    body["stream"] = {{"subscribers", broadcaster_->subscriberCount()},
                      {"queue_depth", broadcaster_->queueDepth()},
                      {"published", broadcaster_->publishedCount()}};
    body["accelerators"] = acceleratorAvailability();
    body["version"] = settings_.version;
    sendJson(res, body);
}

void ApiServer::handleStart(const httplib::Request &req, httplib::Response &res)
{
    json body;
    string error;
    if (!parseBody(req, body, error))
        return sendBadRequest(res, error);

    SourceDescriptor source = controller_->sourceDescriptor();
    BackendDescriptor backend = controller_->backendDescriptor();

    string text;
    if (readSourceField(body, text))
    {
        SourceDescriptor parsed = source;
        if (!parseSourceDescriptor(text, parsed))
            return sendBadRequest(res, "Invalid source '" + text + "'");
        source = parsed;
    }
    if (!applyBackendFields(body, backend, error))
        return sendBadRequest(res, error);

    PipelineError err = controller_->start(source, backend);
    if (err)
        return sendError(res, err);

    sendJson(res, {{"message", "Pipeline started successfully"},
                   {"status", "running"},
                   {"source", source.toString()},
                   {"backend", backendKindToString(backend.kind)}});
}

void ApiServer::handleStop(const httplib::Request &, httplib::Response &res)
{
    PipelineError err = controller_->stop();
    if (err && !err.is(ErrorCode::NOT_RUNNING))
        return sendError(res, err);

    sendJson(res, {{"message", err ? "Pipeline already stopped" : "Pipeline stopped"},
                   {"status", "stopped"}});
}

void ApiServer::handleGetSource(const httplib::Request &, httplib::Response &res)
{
    SourceDescriptor source = controller_->sourceDescriptor();
    json body = source;
    body["is_running"] = controller_->isRunning();
    sendJson(res, body);
}

void ApiServer::handleSetSource(const httplib::Request &req, httplib::Response &res)
{
    json body;
    string error;
    if (!parseBody(req, body, error))
        return sendBadRequest(res, error);

    string text;
    if (!readSourceField(body, text))
        return sendBadRequest(res, "Missing 'source' (device index or stream URL)");

    SourceDescriptor source = controller_->sourceDescriptor();
    if (!parseSourceDescriptor(text, source))
        return sendBadRequest(res, "Invalid source '" + text + "'");
    if (body.contains("loop") && body["loop"].is_boolean())
        source.loop_playback = body["loop"].get<bool>();

    PipelineError err;
    bool live = controller_->isRunning();
    if (live)
        err = controller_->switchSource(source);
    else
        err = controller_->configure(source, controller_->backendDescriptor());

    if (err)
        return sendError(res, err);

    sendJson(res, {{"message", live ? "Source switched" : "Source updated"},
                   {"source", source.toString()},
                   {"type", source.typeName()},
                   {"is_running", controller_->isRunning()}});
}

void ApiServer::handleListCameras(const httplib::Request &, httplib::Response &res)
{
    SourceDescriptor active = controller_->sourceDescriptor();
    bool in_use = controller_->isRunning() && active.kind == SourceKind::DEVICE;

    json cameras = json::array();
    for (int index : VideoSource::listAvailableDevices())
    {
        cameras.push_back({{"index", index}, {"name", "Camera " + to_string(index)}});
    }

    // The active device cannot be opened a second time while streaming
    if (in_use)
    {
        bool listed = false;
        for (const auto &camera : cameras)
            listed = listed || camera["index"] == active.device_index;
        if (!listed)
            cameras.push_back({{"index", active.device_index}, {"name", "Camera " + to_string(active.device_index)}, {"in_use", true}});
    }

    sendJson(res, {{"cameras", cameras}, {"count", cameras.size()}});
}

void ApiServer::handleGetBackend(const httplib::Request &, httplib::Response &res)
{
    PipelineStatus status = controller_->status();
    json body = status.backend;
    body["loaded"] = status.backend_loaded;
    body["accelerators"] = acceleratorAvailability();
    sendJson(res, body);
}

void ApiServer::handleSetBackend(const httplib::Request &req, httplib::Response &res)
{
    json body;
    string error;
    if (!parseBody(req, body, error))
        return sendBadRequest(res, error);

    BackendDescriptor backend = controller_->backendDescriptor();
    if (!applyBackendFields(body, backend, error))
        return sendBadRequest(res, error);

    PipelineError err;
    bool live = controller_->isRunning();
    if (live)
        err = controller_->switchBackend(backend);
    else
        err = controller_->configure(controller_->sourceDescriptor(), backend);

    if (err)
        return sendError(res, err);

    json reply = backend;
    reply["message"] = live ? "Backend switched" : "Backend updated";
    reply["is_running"] = controller_->isRunning();
    sendJson(res, reply);
}

void ApiServer::handleHistory(const httplib::Request &req, httplib::Response &res)
{
    size_t limit = settings_.default_history_limit;
    if (req.has_param("limit"))
    {
        int parsed = 0;
        if (!parseInt(req.get_param_value("limit"), parsed) || parsed <= 0)
            return sendBadRequest(res, "limit must be a positive integer");
        limit = static_cast<size_t>(parsed);
    }

    string session = store_->currentSession();
    sendJson(res, {{"session_id", session},
                   {"detections", store_->recent(session, limit)},
                   {"total", store_->size(session)}});
}

void ApiServer::handleClear(const httplib::Request &, httplib::Response &res)
{
    store_->clear(store_->currentSession());
    sendJson(res, {{"message", "Detection history cleared"}});
}

void ApiServer::handleGenerateReport(const httplib::Request &req, httplib::Response &res)
{
    json body;
    string error;
    if (!parseBody(req, body, error))
        return sendBadRequest(res, error);

    ReportMetadata metadata;
    string format = "json";
    try
    {
        if (body.contains("metadata"))
            metadata = body["metadata"].get<ReportMetadata>();
        format = body.value("format", format);
    }
    catch (const json::exception &e)
    {
        return sendBadRequest(res, string("Invalid report request: ") + e.what());
    }

    GeneratedReport report;
    PipelineError err = reports_->generate(store_->currentSession(), metadata, format, report);
    if (err)
        return sendError(res, err);

    sendJson(res, {{"message", "Report generated successfully"},
                   {"report_id", report.id},
                   {"filename", report.filename},
                   {"format", report.format},
                   {"total_detections", report.total_detections}});
}

void ApiServer::handleListReports(const httplib::Request &, httplib::Response &res)
{
    sendJson(res, {{"reports", archive_->list()}});
}

void ApiServer::handleDownloadReport(const httplib::Request &req, httplib::Response &res)
{
    string id = req.matches[1].str();
    string format = req.has_param("format") ? req.get_param_value("format") : "json";

    string path;
    if (!archive_->locate(id, format, path))
    {
        sendJson(res, {{"error", "Report not found"}, {"report_id", id}, {"format", format}}, 404);
        return;
    }

    ifstream file(path, ios::binary);
    if (!file)
    {
        sendJson(res, {{"error", "Report could not be read"}, {"report_id", id}}, 500);
        return;
    }

    string content((istreambuf_iterator<char>(file)), istreambuf_iterator<char>());
    string filename = string(ReportArchive::FILE_PREFIX) + id + "." + format;
    res.set_header("Content-Disposition", "attachment; filename=\"" + filename + "\"");
    res.set_content(content, format == "json" ? "application/json" : "application/octet-stream");
}

void ApiServer::handleVideoStream(const httplib::Request &req, httplib::Response &res)
{
    if (!websocket::isUpgradeRequest(req.get_header_value("Upgrade"), req.get_header_value("Connection")))
    {
        res.status = 400;
        res.set_content("WebSocket endpoint. Connect with ws://<host>:" + to_string(settings_.port) + "/ws/video", "text/plain");
        return;
    }

    string websocket_key = req.get_header_value("Sec-WebSocket-Key");
    if (websocket_key.empty())
    {
        res.status = 400;
        return;
    }

    res.status = 101;
    res.set_header("Upgrade", "websocket");
    res.set_header("Connection", "Upgrade");
    res.set_header("Sec-WebSocket-Accept", websocket::acceptKey(websocket_key));

    // No pipeline: one error message, then close so the client retries later
    if (!controller_->isRunning())
    {
        res.set_content_provider(
            "application/octet-stream",
            [](size_t, httplib::DataSink &sink) -> bool
            {
                string message = json{{"error", "Pipeline is not running"}}.dump();
                vector<uint8_t> text = websocket::textFrame(message);
                vector<uint8_t> close = websocket::closeFrame(1011);
                if (sink.write(reinterpret_cast<const char *>(text.data()), text.size()))
                    sink.write(reinterpret_cast<const char *>(close.data()), close.size());
                return false;
            });
        return;
    }

    shared_ptr<StreamSubscriber> subscriber = broadcaster_->subscribe();
    auto ping_interval = chrono::seconds(settings_.ping_interval_s);

    res.set_content_provider(
        "application/octet-stream",
        [this, subscriber, ping_interval](size_t, httplib::DataSink &sink) -> bool
        {
            auto last_write = chrono::steady_clock::now();

            while (running_)
            {
                StreamSubscriber::MessagePtr message;
                if (subscriber->pop(message, 100))
                {
                    vector<uint8_t> frame = websocket::textFrame(message->payload());
                    if (!sink.write(reinterpret_cast<const char *>(frame.data()), frame.size()))
                    {
                        log_debug("Stream subscriber " + log_string(subscriber->id()) + " write failed");
                        break;
                    }
                    last_write = chrono::steady_clock::now();
                    continue;
                }

                if (subscriber->isClosed())
                {
                    // Pipeline stopped or the subscriber was evicted
                    vector<uint8_t> close = websocket::closeFrame(1001);
                    if (!sink.write(reinterpret_cast<const char *>(close.data()), close.size()))
                        log_debug("Close frame to subscriber " + log_string(subscriber->id()) + " not delivered");
                    break;
                }

                auto now = chrono::steady_clock::now();
                if (now - last_write >= ping_interval)
                {
                    vector<uint8_t> ping = websocket::pingFrame();
                    if (!sink.write(reinterpret_cast<const char *>(ping.data()), ping.size()))
                        break;
                    last_write = now;
                }
            }

            broadcaster_->unsubscribe(subscriber);
            return false; // End streaming
        },
        [this, subscriber](bool)
        { broadcaster_->unsubscribe(subscriber); });
}

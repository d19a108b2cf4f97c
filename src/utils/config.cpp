#include "config.hpp"
#include "args.hpp"
#include "backend/backend_factory.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

namespace
{
    // Copy section[key] into target when present and of the right type
    template <typename T>
    void readValue(const json &section, const char *key, T &target)
    {
        auto it = section.find(key);
        if (it == section.end() || it->is_null())
            return;
        try
        {
            target = it->get<T>();
        }
        catch (const json::exception &e)
        {
            log_error(string("Config key '") + key + "' ignored: " + e.what());
        }
    }

    const json &section(const json &root, const char *name)
    {
        static const json empty = json::object();
        auto it = root.find(name);
        return (it != root.end() && it->is_object()) ? *it : empty;
    }

    const char *env(const char *name)
    {
        const char *value = getenv(name);
        return (value && *value) ? value : nullptr;
    }

    void envString(const char *name, string &target)
    {
        if (const char *value = env(name))
            target = value;
    }

    void envInt(const char *name, int &target)
    {
        const char *value = env(name);
        if (!value)
            return;
        if (!parseInt(value, target))
            log_error(string("Invalid integer in ") + name + "='" + value + "', keeping " + to_string(target));
    }

    void envDouble(const char *name, double &target)
    {
        const char *value = env(name);
        if (!value)
            return;
        if (!parseDouble(value, target))
            log_error(string("Invalid number in ") + name + "='" + value + "', keeping " + to_string(target));
    }

    void argInt(int argc, char **argv, const string &flag, int &target)
    {
        if (!hasArg(argc, argv, flag))
            return;
        string value = getArg(argc, argv, flag, "");
        if (!parseInt(value, target))
            log_error("Invalid integer for " + flag + " '" + value + "', keeping " + to_string(target));
    }

    void argDouble(int argc, char **argv, const string &flag, double &target)
    {
        if (!hasArg(argc, argv, flag))
            return;
        string value = getArg(argc, argv, flag, "");
        if (!parseDouble(value, target))
            log_error("Invalid number for " + flag + " '" + value + "', keeping " + to_string(target));
    }

    vector<string> splitClasses(const string &text)
    {
        vector<string> classes;
        for (string name : splitString(text))
        {
            name.erase(0, name.find_first_not_of(" \t"));
            name.erase(name.find_last_not_of(" \t") + 1);
            if (!name.empty())
                classes.push_back(name);
        }
        return classes;
    }
}

bool AppConfig::loadFile(const string &path, string &error)
{
    ifstream file(path);
    if (!file.is_open())
    {
        error = "Cannot open config file " + path;
        return false;
    }

    json root;
    try
    {
        root = json::parse(file);
    }
    catch (const json::parse_error &e)
    {
        error = "Invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!root.is_object())
    {
        error = "Config file " + path + " must contain a JSON object";
        return false;
    }

    const json &srv = section(root, "server");
    readValue(srv, "host", server.host);
    readValue(srv, "port", server.port);
    readValue(srv, "threads", server.worker_threads);
    readValue(srv, "ping_interval_s", server.ping_interval_s);

    const json &cam = section(root, "camera");
    if (cam.contains("source") && cam["source"].is_number_integer())
        camera.source = to_string(cam["source"].get<int>());
    else
        readValue(cam, "source", camera.source);
    readValue(cam, "width", camera.width);
    readValue(cam, "height", camera.height);
    readValue(cam, "fps", camera.fps);
    readValue(cam, "loop", camera.loop_playback);
    readValue(cam, "open_timeout_ms", camera.open_timeout_ms);
    readValue(cam, "read_timeout_ms", camera.read_timeout_ms);

    const json &mdl = section(root, "model");
    readValue(mdl, "backend", model.backend);
    readValue(mdl, "path", model.path);
    readValue(mdl, "delegate", model.delegate);
    readValue(mdl, "precision", model.precision);
    readValue(mdl, "input_size", model.input_size);
    readValue(mdl, "classes", model.classes);
    readValue(mdl, "class_names_path", model.class_names_path);

    const json &det = section(root, "detection");
    readValue(det, "confidence", detection.confidence_threshold);
    readValue(det, "overlap", detection.overlap_threshold);
    readValue(det, "max_fps", detection.max_fps);
    readValue(det, "crawler_speed_mps", detection.crawler_speed_mps);
    readValue(det, "position_offset_m", detection.position_offset_m);

    const json &rty = section(root, "retry");
    readValue(rty, "max_attempts", retry.max_attempts);
    readValue(rty, "initial_backoff_ms", retry.initial_backoff_ms);
    readValue(rty, "backoff_multiplier", retry.backoff_multiplier);
    readValue(rty, "max_backoff_ms", retry.max_backoff_ms);

    const json &str = section(root, "stream");
    readValue(str, "queue_depth", stream.queue_depth);
    readValue(str, "jpeg_quality", stream.jpeg_quality);

    const json &lg = section(root, "logging");
    readValue(lg, "level", logging.level);
    readValue(lg, "timestamps", logging.timestamps);
    readValue(lg, "file", logging.file);

    readValue(section(root, "reports"), "directory", reports_dir);
    readValue(root, "stop_timeout_ms", stop_timeout_ms);
    readValue(root, "switch_timeout_ms", switch_timeout_ms);
    readValue(root, "autostart", autostart);

    log_debug("Loaded config file " + path);
    return true;
}

void AppConfig::applyEnvironment()
{
    envString("HOST", server.host);
    envInt("PORT", server.port);
    envString("CAMERA_INDEX", camera.source);
    envInt("CAMERA_WIDTH", camera.width);
    envInt("CAMERA_HEIGHT", camera.height);
    envInt("CAMERA_FPS", camera.fps);
    envString("MODEL_PATH", model.path);
    envString("BACKEND", model.backend);
    envDouble("CONFIDENCE_THRESHOLD", detection.confidence_threshold);
    envDouble("IOU_THRESHOLD", detection.overlap_threshold);
    envString("REPORTS_DIR", reports_dir);
    envString("LOG_LEVEL", logging.level);

    if (const char *classes = env("DEFECT_CLASSES"))
        model.classes = splitClasses(classes);
}

void AppConfig::applyArgs(int argc, char **argv)
{
    server.host = getArg(argc, argv, "--host", server.host);
    argInt(argc, argv, "--port", server.port);
    argInt(argc, argv, "--threads", server.worker_threads);

    camera.source = getArg(argc, argv, "--source", camera.source);
    argInt(argc, argv, "--width", camera.width);
    argInt(argc, argv, "--height", camera.height);
    argInt(argc, argv, "--fps", camera.fps);
    if (hasFlag(argc, argv, "--loop"))
        camera.loop_playback = true;

    model.path = getArg(argc, argv, "--model", model.path);
    model.backend = getArg(argc, argv, "--backend", model.backend);
    model.delegate = getArg(argc, argv, "--delegate", model.delegate);
    model.precision = getArg(argc, argv, "--precision", model.precision);
    if (hasArg(argc, argv, "--classes"))
        model.classes = splitClasses(getArg(argc, argv, "--classes", ""));

    argDouble(argc, argv, "--conf", detection.confidence_threshold);
    argDouble(argc, argv, "--iou", detection.overlap_threshold);
    argDouble(argc, argv, "--max-fps", detection.max_fps);
    argDouble(argc, argv, "--speed", detection.crawler_speed_mps);

    reports_dir = getArg(argc, argv, "--reports", reports_dir);
    logging.file = getArg(argc, argv, "--log-file", logging.file);
    logging.level = getArg(argc, argv, "--log-level", logging.level);

    if (hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d"))
        logging.level = "debug";
    else if (hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q"))
        logging.level = "error";
    if (hasFlag(argc, argv, "--timestamps"))
        logging.timestamps = true;
    if (hasFlag(argc, argv, "--autostart"))
        autostart = true;
}

vector<string> AppConfig::validate()
{
    vector<string> corrections;
    AppConfig defaults;

    auto clampUnit = [&](double &value, const string &name)
    {
        double clamped = min(1.0, max(0.0, value));
        if (clamped != value)
        {
            corrections.push_back(name + " " + to_string(value) + " clamped to " + to_string(clamped));
            value = clamped;
        }
    };
    auto positive = [&](auto &value, auto fallback, const string &name)
    {
        if (value <= 0)
        {
            corrections.push_back(name + " must be positive, using " + to_string(fallback));
            value = fallback;
        }
    };

    clampUnit(detection.confidence_threshold, "confidence threshold");
    clampUnit(detection.overlap_threshold, "overlap threshold");

    positive(server.port, defaults.server.port, "port");
    positive(server.worker_threads, defaults.server.worker_threads, "worker threads");
    positive(server.ping_interval_s, defaults.server.ping_interval_s, "ping interval");
    positive(camera.width, defaults.camera.width, "width");
    positive(camera.height, defaults.camera.height, "height");
    positive(camera.fps, defaults.camera.fps, "fps");
    positive(model.input_size, defaults.model.input_size, "model input size");
    positive(detection.max_fps, defaults.detection.max_fps, "max fps");
    positive(stream.queue_depth, defaults.stream.queue_depth, "stream queue depth");
    positive(stop_timeout_ms, defaults.stop_timeout_ms, "stop timeout");
    positive(switch_timeout_ms, defaults.switch_timeout_ms, "switch timeout");
    positive(retry.initial_backoff_ms, defaults.retry.initial_backoff_ms, "initial backoff");
    positive(retry.max_backoff_ms, defaults.retry.max_backoff_ms, "max backoff");

    if (server.port > 65535)
    {
        corrections.push_back("port " + to_string(server.port) + " out of range, using " + to_string(defaults.server.port));
        server.port = defaults.server.port;
    }
    if (retry.max_attempts < 0)
    {
        corrections.push_back("retry attempts must not be negative, using " + to_string(defaults.retry.max_attempts));
        retry.max_attempts = defaults.retry.max_attempts;
    }
    if (retry.backoff_multiplier < 1.0)
    {
        corrections.push_back("backoff multiplier below 1, using " + to_string(defaults.retry.backoff_multiplier));
        retry.backoff_multiplier = defaults.retry.backoff_multiplier;
    }
    if (stream.jpeg_quality < 1 || stream.jpeg_quality > 100)
    {
        corrections.push_back("jpeg quality " + to_string(stream.jpeg_quality) + " out of range, using " +
                              to_string(defaults.stream.jpeg_quality));
        stream.jpeg_quality = defaults.stream.jpeg_quality;
    }
    if (model.classes.empty())
    {
        corrections.push_back("empty class list, using the default classes");
        model.classes = defaults.model.classes;
    }

    return corrections;
}

bool AppConfig::sourceDescriptor(SourceDescriptor &descriptor, string &error) const
{
    SourceDescriptor parsed;
    if (!parseSourceDescriptor(camera.source, parsed))
    {
        error = "Invalid camera source '" + camera.source + "'";
        return false;
    }

    parsed.width = camera.width;
    parsed.height = camera.height;
    parsed.fps = camera.fps;
    parsed.loop_playback = camera.loop_playback;
    parsed.open_timeout_ms = camera.open_timeout_ms;
    parsed.read_timeout_ms = camera.read_timeout_ms;
    descriptor = parsed;
    return true;
}

bool AppConfig::backendDescriptor(BackendDescriptor &descriptor, string &error) const
{
    BackendDescriptor result;
    if (!BackendFactory::parseKind(model.backend, result.kind))
    {
        error = "Unknown backend '" + model.backend + "' (expected full or accelerated)";
        return false;
    }

    result.model_path = model.path;
    result.delegate = model.delegate;
    result.input_width = model.input_size;
    result.input_height = model.input_size;
    result.class_names = model.classes;
    result.class_names_path = model.class_names_path;

    result.precision = BackendFactory::defaultPrecision(result.kind, result.delegate);
    if (!model.precision.empty() && !BackendFactory::parsePrecision(model.precision, result.precision))
    {
        error = "Unknown precision '" + model.precision + "' (expected fp32, fp16 or int8)";
        return false;
    }

    descriptor = result;
    return true;
}

PipelineSettings AppConfig::pipelineSettings() const
{
    PipelineSettings settings;
    settings.confidence_threshold = static_cast<float>(detection.confidence_threshold);
    settings.overlap_threshold = static_cast<float>(detection.overlap_threshold);
    settings.max_fps = detection.max_fps;
    settings.retry = retry;
    settings.stop_timeout_ms = stop_timeout_ms;
    settings.switch_timeout_ms = switch_timeout_ms;
    settings.crawler_speed_mps = detection.crawler_speed_mps;
    settings.position_offset_m = detection.position_offset_m;
    return settings;
}

bool loadConfig(int argc, char **argv, AppConfig &config, string &error)
{
    if (hasArg(argc, argv, "--config"))
    {
        if (!config.loadFile(getArg(argc, argv, "--config", ""), error))
            return false;
    }

    config.applyEnvironment();
    config.applyArgs(argc, argv);

    for (const auto &correction : config.validate())
        log_warning("Config: " + correction);
    return true;
}

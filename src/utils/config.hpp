#pragma once
#include <string>
#include <vector>
#include "backend/backend_interface.hpp"
#include "pipeline/pipeline_controller.hpp"
#include "postprocess/defect_classes.hpp"
#include "source/frame_source.hpp"
#include "source/retry_state.hpp"

struct ServerConfig
{
    std::string host = "0.0.0.0";
    int port = 8000;
    int worker_threads = 8; // HTTP handlers, each live stream client holds one
    int ping_interval_s = 30;
};

struct CameraConfig
{
    std::string source = "0"; // Device index, stream URI or file path
    int width = 640;
    int height = 480;
    int fps = 30;
    bool loop_playback = false;
    int open_timeout_ms = 10000;
    int read_timeout_ms = 5000;
};

struct ModelConfig
{
    std::string backend = "full";
    std::string path = "models/pipescope.onnx";
    std::string delegate = "auto";
    std::string precision; // Empty: the backend's default
    int input_size = 640;
    std::vector<std::string> classes = defect_classes::defaultClassNames();
    std::string class_names_path;
};

struct DetectionConfig
{
    double confidence_threshold = 0.5;
    double overlap_threshold = 0.45;
    double max_fps = 30.0;
    double crawler_speed_mps = 0.0;
    double position_offset_m = 0.0;
};

struct StreamConfig
{
    int queue_depth = 2;
    int jpeg_quality = 80;
};

struct LogConfig
{
    std::string level = "info";
    bool timestamps = false;
    std::string file; // Empty: console only
};

struct AppConfig
{
    ServerConfig server;
    CameraConfig camera;
    ModelConfig model;
    DetectionConfig detection;
    RetryPolicy retry;
    StreamConfig stream;
    LogConfig logging;
    std::string reports_dir = "reports";
    int stop_timeout_ms = 5000;
    int switch_timeout_ms = 30000;
    bool autostart = false;

    // Merge a JSON config file, unknown keys are ignored
    bool loadFile(const std::string &path, std::string &error);

    // HOST, PORT, CAMERA_INDEX, CAMERA_WIDTH ... (see applyEnvironment in config.cpp)
    void applyEnvironment();

    void applyArgs(int argc, char **argv);

    // Clamp thresholds to [0, 1], restore defaults for non-positive sizes and rates
    // Returns the list of corrections made
    std::vector<std::string> validate();

    bool sourceDescriptor(SourceDescriptor &descriptor, std::string &error) const;
    bool backendDescriptor(BackendDescriptor &descriptor, std::string &error) const;
    PipelineSettings pipelineSettings() const;
};

// Defaults -> --config file -> environment -> command line, then validate
// Returns false when the config file is unreadable
bool loadConfig(int argc, char **argv, AppConfig &config, std::string &error);

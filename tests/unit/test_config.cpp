#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "utils/config.hpp"
#include "utils/logging.hpp"

using namespace std;
namespace fs = std::filesystem;

namespace
{
    // argv built from string literals, argv[0] included
    struct Argv
    {
        vector<string> storage;
        vector<char *> pointers;

        Argv(initializer_list<string> args) : storage(args)
        {
            storage.insert(storage.begin(), "pipescope");
            for (auto &arg : storage)
                pointers.push_back(&arg[0]);
            pointers.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(storage.size()); }
        char **argv() { return pointers.data(); }
    };

    string writeConfigFile(const string &content)
    {
        fs::path path = fs::temp_directory_path() / ("pipescope_config_" + to_string(getpid()) + ".json");
        ofstream(path) << content;
        return path.string();
    }
}

TEST_CASE("defaults")
{
    AppConfig config;
    CHECK(config.server.port == 8000);
    CHECK(config.camera.source == "0");
    CHECK(config.detection.confidence_threshold == doctest::Approx(0.5));
    CHECK(config.detection.overlap_threshold == doctest::Approx(0.45));
    CHECK(config.stream.queue_depth == 2);
    CHECK(config.validate().empty());
}

TEST_CASE("file, environment and command line are layered in that order")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    string path = writeConfigFile(R"({
        "server": {"port": 9000, "host": "127.0.0.1"},
        "camera": {"source": 2, "width": 1280},
        "model": {"backend": "accelerated", "delegate": "opencl"},
        "detection": {"confidence": 0.3, "overlap": 0.6},
        "retry": {"max_attempts": 9},
        "reports": {"directory": "/tmp/from_file"}
    })");

    setenv("PORT", "9100", 1);
    setenv("CONFIDENCE_THRESHOLD", "0.35", 1);
    setenv("DEFECT_CLASSES", "crack, leak ,", 1);

    Argv args{"--config", path, "--conf", "0.4", "--source", "rtsp://cam/1"};
    AppConfig config;
    string error;
    bool loaded = loadConfig(args.argc(), args.argv(), config, error);

    unsetenv("PORT");
    unsetenv("CONFIDENCE_THRESHOLD");
    unsetenv("DEFECT_CLASSES");
    fs::remove(path);

    REQUIRE(loaded);
    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.port == 9100);
    CHECK(config.detection.confidence_threshold == doctest::Approx(0.4));
    CHECK(config.detection.overlap_threshold == doctest::Approx(0.6));
    CHECK(config.camera.source == "rtsp://cam/1");
    CHECK(config.camera.width == 1280);
    CHECK(config.retry.max_attempts == 9);
    CHECK(config.reports_dir == "/tmp/from_file");
    CHECK(config.model.classes == vector<string>{"crack", "leak"});
}

TEST_CASE("unreadable or malformed config files are reported")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    AppConfig config;
    string error;
    CHECK_FALSE(config.loadFile("/nonexistent/pipescope.json", error));
    CHECK_FALSE(error.empty());

    string path = writeConfigFile("{ not json");
    error.clear();
    CHECK_FALSE(config.loadFile(path, error));
    CHECK(error.find("Invalid JSON") != string::npos);
    fs::remove(path);
}

TEST_CASE("wrongly typed file values keep the previous value")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    string path = writeConfigFile(R"({"server": {"port": "eighty"}, "stream": {"queue_depth": 4}})");
    AppConfig config;
    string error;
    REQUIRE(config.loadFile(path, error));
    fs::remove(path);

    CHECK(config.server.port == 8000);
    CHECK(config.stream.queue_depth == 4);
}

TEST_CASE("invalid numbers on the command line keep the defaults")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    Argv args{"--port", "80x", "--conf", "high", "--width", "800"};
    AppConfig config;
    config.applyArgs(args.argc(), args.argv());
    CHECK(config.server.port == 8000);
    CHECK(config.detection.confidence_threshold == doctest::Approx(0.5));
    CHECK(config.camera.width == 800);
}

TEST_CASE("validate clamps thresholds and restores bad sizes")
{
    AppConfig config;
    config.detection.confidence_threshold = 1.7;
    config.detection.overlap_threshold = -0.2;
    config.server.port = 70000;
    config.stream.queue_depth = 0;
    config.stream.jpeg_quality = 0;
    config.model.classes.clear();

    auto corrections = config.validate();
    CHECK(corrections.size() == 6);
    CHECK(config.detection.confidence_threshold == 1.0);
    CHECK(config.detection.overlap_threshold == 0.0);
    CHECK(config.server.port == 8000);
    CHECK(config.stream.queue_depth == 2);
    CHECK(config.stream.jpeg_quality == 80);
    CHECK_FALSE(config.model.classes.empty());
}

TEST_CASE("descriptors built from the config")
{
    AppConfig config;
    config.camera.source = "clip.mp4";
    config.camera.loop_playback = true;
    config.model.backend = "accelerated";
    config.model.delegate = "npu";

    SourceDescriptor source;
    BackendDescriptor backend;
    string error;
    REQUIRE(config.sourceDescriptor(source, error));
    CHECK(source.kind == SourceKind::FILE);
    CHECK(source.loop_playback);

    REQUIRE(config.backendDescriptor(backend, error));
    CHECK(backend.kind == BackendKind::ACCELERATED);
    CHECK(backend.precision == Precision::INT8);
    CHECK(backend.class_names == config.model.classes);

    config.model.precision = "fp16";
    REQUIRE(config.backendDescriptor(backend, error));
    CHECK(backend.precision == Precision::FP16);

    config.model.precision = "fp8";
    CHECK_FALSE(config.backendDescriptor(backend, error));

    config.model.backend = "quantum";
    CHECK_FALSE(config.backendDescriptor(backend, error));

    config.camera.source = "-1";
    CHECK_FALSE(config.sourceDescriptor(source, error));
}

TEST_CASE("pipeline settings follow the detection section")
{
    AppConfig config;
    config.detection.confidence_threshold = 0.25;
    config.detection.crawler_speed_mps = 0.5;
    config.stop_timeout_ms = 1500;
    config.switch_timeout_ms = 12000;

    PipelineSettings settings = config.pipelineSettings();
    CHECK(settings.confidence_threshold == doctest::Approx(0.25f));
    CHECK(settings.crawler_speed_mps == doctest::Approx(0.5));
    CHECK(settings.stop_timeout_ms == 1500);
    CHECK(settings.switch_timeout_ms == 12000);
}

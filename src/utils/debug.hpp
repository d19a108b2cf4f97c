#pragma once
#include <cstdlib>
#include <iostream>
#include <string>
#include "config.hpp"

namespace debug
{

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print the effective configuration after all layers were applied
    inline void printConfig(const AppConfig &config)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Server: http://" << config.server.host << ":" << config.server.port
                  << " (" << config.server.worker_threads << " threads)\n";
        std::cout << "  - Source: " << config.camera.source << (config.camera.loop_playback ? " (loop)" : "") << "\n";
        std::cout << "  - Resolution: " << config.camera.width << "x" << config.camera.height << "\n";
        std::cout << "  - FPS: " << config.camera.fps << " (stream cap " << config.detection.max_fps << ")\n";
        std::cout << "  - Backend: " << config.model.backend;
        if (config.model.backend != "full")
            std::cout << " [" << config.model.delegate << "]";
        std::cout << "\n";
        std::cout << "  - Model: " << config.model.path << " (" << config.model.input_size << "px)\n";
        std::cout << "  - Thresholds: confidence " << config.detection.confidence_threshold
                  << ", overlap " << config.detection.overlap_threshold << "\n";
        std::cout << "  - Classes (" << config.model.classes.size() << "):\n";
        for (size_t i = 0; i < config.model.classes.size(); i++)
        {
            std::cout << "      " + std::to_string(i) + ": " + config.model.classes[i] << std::endl;
        }
        std::cout << "  - Reports: " << config.reports_dir << "\n";
        std::cout << "  - Log level: " << config.logging.level;
        if (!config.logging.file.empty())
            std::cout << " (file " << config.logging.file << ")";
        std::cout << "\n";
        std::cout << "-------------------------------------" << std::endl;
    }

    // Print version information and exit
    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "PipeScope runtime version: " << version << std::endl;
        exit(0);
    }

    // Print help message and exit
    inline void printHelpAndExit()
    {
        std::cout << "Usage: pipescope [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --config <path>      JSON config file, applied before environment and flags\n";
        std::cout << "  --host <addr>        Listen address (default: 0.0.0.0)\n";
        std::cout << "  --port <port>        Listen port (default: 8000)\n";
        std::cout << "  --threads <n>        HTTP worker threads (default: 8)\n";
        std::cout << "  --source <src>       Device index, rtsp:// URI, http(s):// URL or file (default: 0)\n";
        std::cout << "  --width <width>      Frame width for local devices (default: 640)\n";
        std::cout << "  --height <height>    Frame height for local devices (default: 480)\n";
        std::cout << "  --fps <fps>          Frames per second for local devices (default: 30)\n";
        std::cout << "  --loop               Restart file playback at end of stream\n";
        std::cout << "  --model <path>       ONNX model file (default: models/pipescope.onnx)\n";
        std::cout << "  --backend <kind>     full or accelerated (default: full)\n";
        std::cout << "  --delegate <name>    Accelerator: auto, cuda, opencl, vulkan, npu (default: auto)\n";
        std::cout << "  --precision <p>      fp32, fp16 or int8 (default: per backend)\n";
        std::cout << "  --classes <list>     Comma-separated class names in model order\n";
        std::cout << "  --conf <value>       Confidence threshold (default: 0.5)\n";
        std::cout << "  --iou <value>        Overlap suppression threshold (default: 0.45)\n";
        std::cout << "  --max-fps <value>    Stream rate cap (default: 30)\n";
        std::cout << "  --speed <m/s>        Crawler speed, enables frame positions\n";
        std::cout << "  --reports <dir>      Reports directory (default: reports)\n";
        std::cout << "  --autostart          Start the pipeline immediately\n";
        std::cout << "  --log-level <level>  error, warning, info or debug (default: info)\n";
        std::cout << "  --log-file <path>    Also append log lines to a file\n";
        std::cout << "  --timestamps         Prefix console log lines with the time\n";
        std::cout << "  --debug, -d          Show all log messages\n";
        std::cout << "  --quiet, -q          Quiet mode (only show errors)\n";
        std::cout << "  --version            Show version information\n";
        std::cout << "  --help               Show this help message\n";
        exit(0);
    }

} // namespace debug

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Most important - always show
        WARNING = 1, // Important - usually show
        INFO = 2,    // Normal - sometimes show
        DEBUG = 3    // Least important - rarely show
    };

    // Global settings, shared by every translation unit
    inline LogLevel globalLogLevel = LogLevel::INFO;
    inline bool showTimestamp = false;
    inline bool enableFileLogging = false;
    inline std::string logFilePath = "logs/pipescope.log";

    // Capture loop, HTTP handlers and stream writers all log concurrently
    inline std::mutex &logMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    // Parse "error", "warning"/"warn", "info", "debug" (case-insensitive)
    // Returns false and leaves level untouched for anything else
    inline bool parseLogLevel(const std::string &name, LogLevel &level)
    {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lower == "error")
            level = LogLevel::ERROR;
        else if (lower == "warning" || lower == "warn")
            level = LogLevel::WARNING;
        else if (lower == "info")
            level = LogLevel::INFO;
        else if (lower == "debug")
            level = LogLevel::DEBUG;
        else
            return false;
        return true;
    }

    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    // Enable/disable file logging, the parent directory is created on demand
    inline bool setFileLogging(bool enable, const std::string &filepath = "logs/pipescope.log")
    {
        std::lock_guard<std::mutex> lock(logMutex());
        enableFileLogging = enable;
        logFilePath = filepath;

        if (!enable)
            return true;

        auto slash = filepath.find_last_of('/');
        if (slash != std::string::npos && slash > 0)
        {
            std::string dir = filepath.substr(0, slash);
            std::string command = "mkdir -p '" + dir + "'";
            if (system(command.c_str()) != 0)
            {
                enableFileLogging = false;
                return false;
            }
        }

        std::ofstream logFile(logFilePath, std::ios::app);
        if (!logFile.is_open())
        {
            enableFileLogging = false;
            return false;
        }
        logFile << "\n========== PipeScope Session Started ==========\n";
        return true;
    }

    inline std::string getCurrentTimestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    inline std::string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNKNOWN";
        }
    }

// Highlight a number in cyan inside a log line
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")
// Same for values that are already strings (paths, URIs, names)
#define log_string_src(value) ("\033[36m" + std::string(value) + "\033[0m")

    // Extract module name from function signature
    // "bool PipelineController::start(...)" -> "PIPELINECONTROLLER"
    inline std::string extractModuleName(const std::string &function)
    {
        if (function.find("logging::") != std::string::npos ||
            function.find("extractModuleName") != std::string::npos)
        {
            return "SYSTEM";
        }

        // Ignore the argument list, it may contain qualified types
        std::string signature = function.substr(0, function.find('('));

        size_t colonPos = signature.rfind("::");
        if (colonPos == std::string::npos)
            return "SYSTEM";

        size_t startPos = signature.rfind("::", colonPos > 0 ? colonPos - 1 : 0);
        startPos = (startPos == std::string::npos || startPos >= colonPos) ? 0 : startPos + 2;

        size_t spacePos = signature.rfind(' ', colonPos);
        if (spacePos != std::string::npos && spacePos + 1 > startPos)
            startPos = spacePos + 1;

        std::string moduleName = signature.substr(startPos, colonPos - startPos);
        if (moduleName.empty())
            return "SYSTEM";

        std::transform(moduleName.begin(), moduleName.end(), moduleName.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return moduleName;
    }

    // Strip ANSI color codes (for file logging)
    inline std::string stripColorCodes(const std::string &text)
    {
        std::string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != std::string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos == std::string::npos)
                break; // Malformed escape sequence
            result.erase(pos, endPos - pos + 1);
        }

        return result;
    }

    inline void log(const std::string &message, LogLevel level = LogLevel::INFO, const std::string &moduleName = "SYSTEM")
    {
        // Lower number = higher priority
        if (level > globalLogLevel)
            return;

        std::string timestamp = getCurrentTimestamp();
        std::string levelStr = logLevelToString(level);

        const std::string timestampColor = "\033[32m";
        const std::string bracketColor = "\033[37m";
        const std::string moduleColor = "\033[90m";
        const std::string resetCode = "\033[0m";
        std::string levelColor;

        switch (level)
        {
        case LogLevel::ERROR:
            levelColor = "\033[91m";
            break;
        case LogLevel::WARNING:
            levelColor = "\033[33m";
            break;
        case LogLevel::INFO:
            levelColor = "\033[92m";
            break;
        case LogLevel::DEBUG:
            levelColor = "\033[34m";
            break;
        }

        std::string consoleMessage;
        if (showTimestamp)
        {
            consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
        }
        consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
        consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
        consoleMessage += " - " + message;

        std::lock_guard<std::mutex> lock(logMutex());
        std::cout << consoleMessage << std::endl;

        // File logging (always with timestamp, no colors)
        if (enableFileLogging)
        {
            std::ofstream logFile(logFilePath, std::ios::app);
            if (logFile.is_open())
            {
                logFile << "[" << timestamp << "][" << levelStr << "][" << moduleName << "] - "
                        << stripColorCodes(message) << std::endl;
            }
        }
    }

    inline void error(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::ERROR, module);
    }

    inline void warning(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::WARNING, module);
    }

    inline void info(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::INFO, module);
    }

    inline void debug(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::DEBUG, module);
    }

// Macros that auto-detect the module name
#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

} // namespace logging

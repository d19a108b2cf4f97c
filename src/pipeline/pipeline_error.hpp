#pragma once
#include <string>
#include <utility>

// Everything that can go wrong between the capture loop and its callers
enum class ErrorCode
{
    NONE,
    ALREADY_RUNNING,
    NOT_RUNNING,
    INVALID_ARGUMENT,
    SOURCE_OPEN_FAILED,
    SOURCE_READ_FAILED,
    SOURCE_END_OF_STREAM,
    SOURCE_DISCONNECTED,
    MODEL_LOAD_FAILED,
    ACCELERATOR_UNAVAILABLE,
    INFERENCE_FAILED,
    SWITCH_FAILED,
    TIMEOUT,
    REPORT_WRITE_FAILED
};

// Coarse grouping used by the control surface ("source problem" vs "model problem" ...)
enum class ErrorCategory
{
    NONE,
    SOURCE,
    MODEL,
    INFERENCE,
    SWITCH,
    STATE,
    REQUEST,
    REPORT
};

struct PipelineError
{
    ErrorCode code = ErrorCode::NONE;
    ErrorCode cause = ErrorCode::NONE; // Wrapped source/model error when code == SWITCH_FAILED
    std::string message;

    PipelineError() = default;
    PipelineError(ErrorCode code, std::string message, ErrorCode cause = ErrorCode::NONE)
        : code(code), cause(cause), message(std::move(message)) {}

    // True when an error is present
    explicit operator bool() const { return code != ErrorCode::NONE; }

    // Matches the error itself or the error it wraps
    bool is(ErrorCode c) const { return code == c || cause == c; }

    ErrorCategory category() const;

    // Wrap a source/model failure that happened while switching
    static PipelineError switchFailure(const PipelineError &inner);
};

ErrorCategory categoryOf(ErrorCode code);
std::string errorCodeToString(ErrorCode code);
std::string errorCategoryToString(ErrorCategory category);

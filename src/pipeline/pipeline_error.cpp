#include "pipeline_error.hpp"

using namespace std;

ErrorCategory categoryOf(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::NONE:
        return ErrorCategory::NONE;
    case ErrorCode::ALREADY_RUNNING:
    case ErrorCode::NOT_RUNNING:
    case ErrorCode::TIMEOUT:
        return ErrorCategory::STATE;
    case ErrorCode::INVALID_ARGUMENT:
        return ErrorCategory::REQUEST;
    case ErrorCode::SOURCE_OPEN_FAILED:
    case ErrorCode::SOURCE_READ_FAILED:
    case ErrorCode::SOURCE_END_OF_STREAM:
    case ErrorCode::SOURCE_DISCONNECTED:
        return ErrorCategory::SOURCE;
    case ErrorCode::MODEL_LOAD_FAILED:
    case ErrorCode::ACCELERATOR_UNAVAILABLE:
        return ErrorCategory::MODEL;
    case ErrorCode::INFERENCE_FAILED:
        return ErrorCategory::INFERENCE;
    case ErrorCode::SWITCH_FAILED:
        return ErrorCategory::SWITCH;
    case ErrorCode::REPORT_WRITE_FAILED:
        return ErrorCategory::REPORT;
    }
    return ErrorCategory::NONE;
}

ErrorCategory PipelineError::category() const
{
    return categoryOf(code);
}

PipelineError PipelineError::switchFailure(const PipelineError &inner)
{
    return PipelineError(ErrorCode::SWITCH_FAILED, inner.message,
                         inner.cause != ErrorCode::NONE ? inner.cause : inner.code);
}

string errorCodeToString(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::NONE:
        return "none";
    case ErrorCode::ALREADY_RUNNING:
        return "already_running";
    case ErrorCode::NOT_RUNNING:
        return "not_running";
    case ErrorCode::INVALID_ARGUMENT:
        return "invalid_argument";
    case ErrorCode::SOURCE_OPEN_FAILED:
        return "source_open_failed";
    case ErrorCode::SOURCE_READ_FAILED:
        return "source_read_failed";
    case ErrorCode::SOURCE_END_OF_STREAM:
        return "source_end_of_stream";
    case ErrorCode::SOURCE_DISCONNECTED:
        return "source_disconnected";
    case ErrorCode::MODEL_LOAD_FAILED:
        return "model_load_failed";
    case ErrorCode::ACCELERATOR_UNAVAILABLE:
        return "accelerator_unavailable";
    case ErrorCode::INFERENCE_FAILED:
        return "inference_failed";
    case ErrorCode::SWITCH_FAILED:
        return "switch_failed";
    case ErrorCode::TIMEOUT:
        return "timeout";
    case ErrorCode::REPORT_WRITE_FAILED:
        return "report_write_failed";
    }
    return "unknown";
}

string errorCategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::NONE:
        return "none";
    case ErrorCategory::SOURCE:
        return "source";
    case ErrorCategory::MODEL:
        return "model";
    case ErrorCategory::INFERENCE:
        return "inference";
    case ErrorCategory::SWITCH:
        return "switch";
    case ErrorCategory::STATE:
        return "state";
    case ErrorCategory::REQUEST:
        return "request";
    case ErrorCategory::REPORT:
        return "report";
    }
    return "unknown";
}

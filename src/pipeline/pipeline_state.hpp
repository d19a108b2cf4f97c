#pragma once
#include <string>

// Stopped -> Starting -> Running -> Stopping -> Stopped
// Running -> Switching -> Running (or Stopped on an unrecoverable switch failure)
enum class PipelineState
{
    STOPPED,
    STARTING,
    RUNNING,
    SWITCHING,
    STOPPING
};

inline std::string pipelineStateToString(PipelineState state)
{
    switch (state)
    {
    case PipelineState::STOPPED:
        return "stopped";
    case PipelineState::STARTING:
        return "starting";
    case PipelineState::RUNNING:
        return "running";
    case PipelineState::SWITCHING:
        return "switching";
    case PipelineState::STOPPING:
        return "stopping";
    }
    return "unknown";
}

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "backend/backend_interface.hpp"
#include "communication/stream_broadcaster.hpp"
#include "history/detection_store.hpp"
#include "pipeline_error.hpp"
#include "pipeline_state.hpp"
#include "source/frame_source.hpp"
#include "source/retry_state.hpp"

struct PipelineSettings
{
    float confidence_threshold = 0.5f;
    float overlap_threshold = 0.45f;

    // Output cadence cap, frames above it are not read early
    double max_fps = 30.0;

    RetryPolicy retry;

    // Upper bound for stop() to wait on an in-flight frame
    int stop_timeout_ms = 5000;

    // How long a switch caller waits for the loop to apply its request
    int switch_timeout_ms = 30000;

    // Position along the pipe: offset + speed * seconds since start, disabled when speed <= 0
    double crawler_speed_mps = 0.0;
    double position_offset_m = 0.0;
};

// Point-in-time view for the status endpoint
struct PipelineStatus
{
    PipelineState state = PipelineState::STOPPED;
    SourceDescriptor source;
    SourceInfo source_info;
    bool source_open = false;
    BackendDescriptor backend;
    bool backend_loaded = false;
    std::string session_id;
    uint64_t frames_processed = 0;
    uint64_t frames_skipped = 0;
    double fps = 0.0;
    double uptime_s = 0.0;
    PipelineError last_error;
};

using SourceFactoryFn = std::function<std::unique_ptr<FrameSource>(const SourceDescriptor &)>;
using BackendFactoryFn = std::function<std::unique_ptr<InferenceBackend>(BackendKind)>;

// Owns the capture -> infer -> post-process -> (publish, append) loop
//
// The loop thread is the only user of the FrameSource and InferenceBackend handles
// while running. Source and backend switches are queued as control messages and
// applied by the loop between two frames; all control calls are serialised.
class PipelineController
{
public:
    PipelineController(std::shared_ptr<DetectionStore> store,
                       std::shared_ptr<StreamBroadcaster> broadcaster,
                       PipelineSettings settings = PipelineSettings(),
                       SourceFactoryFn source_factory = nullptr,
                       BackendFactoryFn backend_factory = nullptr);
    ~PipelineController();

    PipelineController(const PipelineController &) = delete;
    PipelineController &operator=(const PipelineController &) = delete;

    // Open the source, load the model and spawn the loop
    // ALREADY_RUNNING unless Stopped; the state is left untouched in that case
    PipelineError start(const SourceDescriptor &source, const BackendDescriptor &backend);

    // Start with the configured descriptors
    PipelineError start();

    // Request a stop and wait up to stop_timeout_ms for the loop to release its handles
    // History is kept
    PipelineError stop();

    // Running only; blocks until the loop has applied the switch
    PipelineError switchSource(const SourceDescriptor &source);
    PipelineError switchBackend(const BackendDescriptor &backend);

    // Replace the descriptors used by the next start(), Stopped only
    PipelineError configure(const SourceDescriptor &source, const BackendDescriptor &backend);

    PipelineState state() const;
    bool isRunning() const;
    PipelineError lastError() const;
    PipelineStatus status() const;

    SourceDescriptor sourceDescriptor() const;
    BackendDescriptor backendDescriptor() const;
    const PipelineSettings &settings() const { return settings_; }

    // Block until the controller reaches state or the timeout expires
    bool waitForState(PipelineState state, int timeout_ms) const;

private:
    struct ControlCommand
    {
        enum class Type
        {
            SWITCH_SOURCE,
            SWITCH_BACKEND
        };

        Type type = Type::SWITCH_SOURCE;
        SourceDescriptor source;
        BackendDescriptor backend;
        std::promise<PipelineError> result;
    };

    PipelineError submit(std::unique_ptr<ControlCommand> command);

    void runLoop(std::unique_ptr<FrameSource> source, std::unique_ptr<InferenceBackend> backend);
    void processFrame(Frame &frame, InferenceBackend &backend);
    bool handleSourceFailure(SourceStatus status, FrameSource &source, RetryState &retry, PipelineError &fatal);

    PipelineError applyCommand(ControlCommand &command,
                               std::unique_ptr<FrameSource> &source,
                               std::unique_ptr<InferenceBackend> &backend,
                               bool &fatal);
    PipelineError applySourceSwitch(const SourceDescriptor &descriptor, std::unique_ptr<FrameSource> &source, bool &fatal);
    PipelineError applyBackendSwitch(const BackendDescriptor &descriptor, std::unique_ptr<InferenceBackend> &backend);

    // Sleep until the deadline unless a stop or a control message arrives first
    void waitInterruptible(std::chrono::steady_clock::time_point deadline);

    void setState(PipelineState state);
    void updateFps();

    std::shared_ptr<DetectionStore> store_;
    std::shared_ptr<StreamBroadcaster> broadcaster_;
    const PipelineSettings settings_;
    SourceFactoryFn source_factory_;
    BackendFactoryFn backend_factory_;

    // Serialises start / stop / configure and the enqueue step of a switch
    std::mutex control_mutex_;

    // One switch in flight at a time, held while its caller waits for the result
    std::mutex switch_mutex_;

    // Guards everything below, state_cv_ signals state changes and new control messages
    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    PipelineState state_ = PipelineState::STOPPED;
    PipelineError last_error_;
    bool stop_requested_ = false;
    std::unique_ptr<ControlCommand> pending_;
    SourceDescriptor source_desc_;
    BackendDescriptor backend_desc_;
    SourceInfo source_info_;
    bool source_open_ = false;
    bool backend_loaded_ = false;
    std::string session_id_;
    std::chrono::steady_clock::time_point started_at_;

    std::thread loop_thread_;

    // Loop statistics
    std::atomic<uint64_t> frames_processed_{0};
    std::atomic<uint64_t> frames_skipped_{0};
    std::atomic<double> fps_{0.0};
    std::chrono::steady_clock::time_point fps_window_start_;
    uint64_t fps_window_frames_ = 0;
};

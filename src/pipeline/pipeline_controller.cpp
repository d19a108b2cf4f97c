#include "pipeline_controller.hpp"
#include "backend/backend_factory.hpp"
#include "postprocess/annotation.hpp"
#include "postprocess/detection_processing.hpp"
#include "source/video_source.hpp"
#include "utils.hpp"

using namespace std;

namespace
{
    PipelineError modelError(ModelStatus status, const string &message)
    {
        ErrorCode code = status == ModelStatus::ACCELERATOR_UNAVAILABLE ? ErrorCode::ACCELERATOR_UNAVAILABLE
                                                                        : ErrorCode::MODEL_LOAD_FAILED;
        return PipelineError(code, message);
    }
}

PipelineController::PipelineController(shared_ptr<DetectionStore> store,
                                       shared_ptr<StreamBroadcaster> broadcaster,
                                       PipelineSettings settings,
                                       SourceFactoryFn source_factory,
                                       BackendFactoryFn backend_factory)
    : store_(move(store)),
      broadcaster_(move(broadcaster)),
      settings_(settings),
      source_factory_(move(source_factory)),
      backend_factory_(move(backend_factory))
{
    if (!source_factory_)
    {
        source_factory_ = [](const SourceDescriptor &)
        { return unique_ptr<FrameSource>(new VideoSource()); };
    }
    if (!backend_factory_)
    {
        backend_factory_ = [](BackendKind kind)
        { return BackendFactory::createBackend(kind); };
    }
}

PipelineController::~PipelineController()
{
    stop();
    if (loop_thread_.joinable())
        loop_thread_.join();
}

PipelineError PipelineController::start()
{
    return start(sourceDescriptor(), backendDescriptor());
}

PipelineError PipelineController::start(const SourceDescriptor &source_desc, const BackendDescriptor &backend_desc)
{
    lock_guard<mutex> control(control_mutex_);

    {
        lock_guard<mutex> lock(state_mutex_);
        if (state_ != PipelineState::STOPPED)
        {
            PipelineError err(ErrorCode::ALREADY_RUNNING, "Pipeline is already " + pipelineStateToString(state_));
            log_warning(err.message);
            return err;
        }
        state_ = PipelineState::STARTING;
        last_error_ = PipelineError();
        stop_requested_ = false;
        source_desc_ = source_desc;
        backend_desc_ = backend_desc;
    }
    state_cv_.notify_all();

    // A loop that finished on its own (end of stream, retry budget) is reaped here
    if (loop_thread_.joinable())
        loop_thread_.join();

    log_info("Starting pipeline: source " + log_string_src(source_desc.toString()) + ", backend " +
             log_string_src(backendKindToString(backend_desc.kind)) + " (" + backend_desc.model_path + ")");

    auto fail = [this](const PipelineError &err)
    {
        log_error(err.message);
        {
            lock_guard<mutex> lock(state_mutex_);
            last_error_ = err;
            state_ = PipelineState::STOPPED;
        }
        state_cv_.notify_all();
        return err;
    };

    unique_ptr<FrameSource> source = source_factory_(source_desc);
    if (!source || !source->open(source_desc))
    {
        string reason = source ? source->lastError() : "no source implementation";
        return fail(PipelineError(ErrorCode::SOURCE_OPEN_FAILED,
                                  "Failed to open source " + source_desc.toString() + ": " + reason));
    }

    unique_ptr<InferenceBackend> backend = backend_factory_(backend_desc.kind);
    if (!backend)
    {
        source->close();
        return fail(PipelineError(ErrorCode::MODEL_LOAD_FAILED,
                                  "No implementation for backend " + backendKindToString(backend_desc.kind)));
    }

    ModelStatus status = backend->load(backend_desc);
    if (status != ModelStatus::OK)
    {
        source->close();
        return fail(modelError(status, "Failed to load model " + backend_desc.model_path + ": " + backend->lastError()));
    }

    string session = store_->currentSession();
    frames_processed_ = 0;
    frames_skipped_ = 0;
    fps_ = 0.0;

    {
        lock_guard<mutex> lock(state_mutex_);
        source_info_ = source->info();
        source_open_ = true;
        backend_desc_ = backend->descriptor();
        backend_loaded_ = true;
        session_id_ = session;
        started_at_ = chrono::steady_clock::now();
        state_ = PipelineState::RUNNING;
    }
    state_cv_.notify_all();

    loop_thread_ = thread(&PipelineController::runLoop, this, move(source), move(backend));
    log_info("Pipeline running, session " + log_string_src(session));
    return PipelineError();
}

PipelineError PipelineController::stop()
{
    lock_guard<mutex> control(control_mutex_);

    unique_lock<mutex> lock(state_mutex_);
    if (state_ == PipelineState::STOPPED)
        return PipelineError(ErrorCode::NOT_RUNNING, "Pipeline is not running");

    log_info("Stopping pipeline");
    stop_requested_ = true;
    state_ = PipelineState::STOPPING;
    state_cv_.notify_all();

    bool stopped = state_cv_.wait_for(lock, chrono::milliseconds(settings_.stop_timeout_ms), [this]
                                      { return state_ == PipelineState::STOPPED; });
    lock.unlock();

    if (!stopped)
    {
        // The loop finishes its current frame in the background and is reaped by the next start()
        PipelineError err(ErrorCode::TIMEOUT, "Pipeline did not stop within " + to_string(settings_.stop_timeout_ms) + "ms");
        log_warning(err.message);
        return err;
    }

    if (loop_thread_.joinable())
        loop_thread_.join();
    return PipelineError();
}

PipelineError PipelineController::switchSource(const SourceDescriptor &source)
{
    auto command = make_unique<ControlCommand>();
    command->type = ControlCommand::Type::SWITCH_SOURCE;
    command->source = source;
    return submit(move(command));
}

PipelineError PipelineController::switchBackend(const BackendDescriptor &backend)
{
    auto command = make_unique<ControlCommand>();
    command->type = ControlCommand::Type::SWITCH_BACKEND;
    command->backend = backend;
    return submit(move(command));
}

PipelineError PipelineController::submit(unique_ptr<ControlCommand> command)
{
    lock_guard<mutex> serial(switch_mutex_);

    future<PipelineError> result = command->result.get_future();
    {
        // control_mutex_ only covers the hand-off so stop() never queues behind a switch
        lock_guard<mutex> control(control_mutex_);
        lock_guard<mutex> lock(state_mutex_);
        if (state_ != PipelineState::RUNNING)
            return PipelineError(ErrorCode::NOT_RUNNING, "Pipeline is " + pipelineStateToString(state_) + ", nothing to switch");
        pending_ = move(command);
    }
    state_cv_.notify_all();

    // The loop either applies the command or fails it on its way out
    if (result.wait_for(chrono::milliseconds(settings_.switch_timeout_ms)) != future_status::ready)
    {
        PipelineError err(ErrorCode::TIMEOUT, "Switch not applied within " + to_string(settings_.switch_timeout_ms) + "ms");
        log_warning(err.message);
        return err;
    }
    return result.get();
}

PipelineError PipelineController::configure(const SourceDescriptor &source, const BackendDescriptor &backend)
{
    lock_guard<mutex> control(control_mutex_);
    lock_guard<mutex> lock(state_mutex_);
    if (state_ != PipelineState::STOPPED)
        return PipelineError(ErrorCode::ALREADY_RUNNING, "Cannot reconfigure a " + pipelineStateToString(state_) + " pipeline");

    source_desc_ = source;
    backend_desc_ = backend;
    return PipelineError();
}

PipelineState PipelineController::state() const
{
    lock_guard<mutex> lock(state_mutex_);
    return state_;
}

bool PipelineController::isRunning() const
{
    return state() == PipelineState::RUNNING;
}

PipelineError PipelineController::lastError() const
{
    lock_guard<mutex> lock(state_mutex_);
    return last_error_;
}

PipelineStatus PipelineController::status() const
{
    PipelineStatus status;
    {
        lock_guard<mutex> lock(state_mutex_);
        status.state = state_;
        status.source = source_desc_;
        status.source_info = source_info_;
        status.source_open = source_open_;
        status.backend = backend_desc_;
        status.backend_loaded = backend_loaded_;
        status.session_id = session_id_;
        status.last_error = last_error_;
        if (state_ != PipelineState::STOPPED)
            status.uptime_s = chrono::duration<double>(chrono::steady_clock::now() - started_at_).count();
    }
    status.frames_processed = frames_processed_;
    status.frames_skipped = frames_skipped_;
    status.fps = fps_;
    return status;
}

SourceDescriptor PipelineController::sourceDescriptor() const
{
    lock_guard<mutex> lock(state_mutex_);
    return source_desc_;
}

BackendDescriptor PipelineController::backendDescriptor() const
{
    lock_guard<mutex> lock(state_mutex_);
    return backend_desc_;
}

bool PipelineController::waitForState(PipelineState state, int timeout_ms) const
{
    unique_lock<mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, chrono::milliseconds(timeout_ms), [&]
                              { return state_ == state; });
}

void PipelineController::setState(PipelineState state)
{
    {
        lock_guard<mutex> lock(state_mutex_);
        state_ = state;
    }
    state_cv_.notify_all();
}

void PipelineController::runLoop(unique_ptr<FrameSource> source, unique_ptr<InferenceBackend> backend)
{
    RetryState retry(settings_.retry);
    PipelineError fatal;

    const auto frame_interval = settings_.max_fps > 0
                                    ? chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(1.0 / settings_.max_fps))
                                    : chrono::steady_clock::duration::zero();
    auto next_due = chrono::steady_clock::now();
    fps_window_start_ = next_due;
    fps_window_frames_ = 0;

    while (true)
    {
        unique_ptr<ControlCommand> command;
        {
            lock_guard<mutex> lock(state_mutex_);
            if (stop_requested_)
                break;
            if (pending_)
            {
                command = move(pending_);
                state_ = PipelineState::SWITCHING;
            }
        }

        if (command)
        {
            state_cv_.notify_all();
            bool is_fatal = false;
            PipelineError result = applyCommand(*command, source, backend, is_fatal);
            if (is_fatal)
            {
                fatal = result;
                command->result.set_value(result);
                break;
            }

            retry.reset();
            {
                // A stop that arrived mid-switch keeps STOPPING
                lock_guard<mutex> lock(state_mutex_);
                if (!stop_requested_)
                    state_ = PipelineState::RUNNING;
            }
            state_cv_.notify_all();
            command->result.set_value(result);
            continue;
        }

        Frame frame;
        SourceStatus status = source->nextFrame(frame);
        if (status != SourceStatus::OK)
        {
            if (!handleSourceFailure(status, *source, retry, fatal))
                break;
            continue;
        }
        retry.reset();

        processFrame(frame, *backend);
        updateFps();

        if (frame_interval.count() > 0)
        {
            next_due += frame_interval;
            auto now = chrono::steady_clock::now();
            if (next_due < now)
                next_due = now;
            else
                waitInterruptible(next_due);
        }
    }

    // Release the handles before reporting Stopped
    if (source)
        source->close();
    if (backend)
        backend->unload();
    source.reset();
    backend.reset();
    broadcaster_->closeAll();

    unique_ptr<ControlCommand> orphan;
    {
        lock_guard<mutex> lock(state_mutex_);
        if (fatal)
            last_error_ = fatal;
        source_open_ = false;
        backend_loaded_ = false;
        orphan = move(pending_);
        state_ = PipelineState::STOPPED;
    }
    state_cv_.notify_all();

    if (orphan)
        orphan->result.set_value(PipelineError(ErrorCode::NOT_RUNNING, "Pipeline stopped before the switch was applied"));

    fps_ = 0.0;
    if (fatal)
        log_error("Pipeline stopped: " + fatal.message);
    else
        log_info("Pipeline stopped after " + log_string(frames_processed_.load()) + " frames");
}

void PipelineController::processFrame(Frame &frame, InferenceBackend &backend)
{
    frame.sequence = store_->nextSequence(session_id_);

    vector<RawDetection> raw;
    if (!backend.infer(frame, raw))
    {
        frames_skipped_++;
        log_warning("Inference failed on frame " + log_string(frame.sequence) + ", skipping: " + backend.lastError());
        return;
    }

    optional<double> position;
    if (settings_.crawler_speed_mps > 0)
    {
        double elapsed = chrono::duration<double>(chrono::steady_clock::now() - started_at_).count();
        position = settings_.position_offset_m + settings_.crawler_speed_mps * elapsed;
    }

    vector<Detection> detections = detection_processing::process(
        raw, frame, settings_.confidence_threshold, settings_.overlap_threshold, position);

    if (!detections.empty())
        log_debug("Frame " + log_string(frame.sequence) + ": " + log_string(detections.size()) + " detections");

    // Same list to both destinations
    broadcaster_->publish(annotation::drawDetections(frame.image, detections), detections,
                          frame.sequence, frame.captured_at);
    store_->append(session_id_, detections);
    frames_processed_++;
}

bool PipelineController::handleSourceFailure(SourceStatus status, FrameSource &source, RetryState &retry, PipelineError &fatal)
{
    if (status == SourceStatus::END_OF_STREAM)
    {
        fatal = PipelineError(ErrorCode::SOURCE_END_OF_STREAM, "Source " + source.descriptor().toString() + " reached end of stream");
        return false;
    }

    bool disconnected = status == SourceStatus::DISCONNECTED || status == SourceStatus::NOT_OPEN;
    auto delay = retry.recordFailure();

    if (retry.exhausted())
    {
        ErrorCode code = disconnected ? ErrorCode::SOURCE_DISCONNECTED : ErrorCode::SOURCE_READ_FAILED;
        fatal = PipelineError(code, "Giving up on source " + source.descriptor().toString() + " after " +
                                        to_string(retry.attempts()) + " consecutive failures: " + source.lastError());
        return false;
    }

    log_warning(string(disconnected ? "Source disconnected" : "Frame read failed") + " (attempt " +
                log_string(retry.attempts()) + "/" + log_string(retry.policy().max_attempts) + "), retrying in " +
                log_string(delay.count()) + "ms: " + source.lastError());

    waitInterruptible(chrono::steady_clock::now() + delay);

    if (disconnected)
    {
        {
            lock_guard<mutex> lock(state_mutex_);
            if (stop_requested_)
                return true;
        }
        if (source.reconnect())
        {
            log_info("Source reconnected");
            lock_guard<mutex> lock(state_mutex_);
            source_info_ = source.info();
        }
    }
    return true;
}

PipelineError PipelineController::applyCommand(ControlCommand &command,
                                               unique_ptr<FrameSource> &source,
                                               unique_ptr<InferenceBackend> &backend,
                                               bool &fatal)
{
    if (command.type == ControlCommand::Type::SWITCH_SOURCE)
        return applySourceSwitch(command.source, source, fatal);
    return applyBackendSwitch(command.backend, backend);
}

PipelineError PipelineController::applySourceSwitch(const SourceDescriptor &descriptor, unique_ptr<FrameSource> &source, bool &fatal)
{
    log_info("Switching source to " + log_string_src(descriptor.toString()));

    // Devices are exclusive, the old handle goes first
    source->close();
    {
        lock_guard<mutex> lock(state_mutex_);
        source_open_ = false;
    }

    unique_ptr<FrameSource> next = source_factory_(descriptor);
    if (!next || !next->open(descriptor))
    {
        fatal = true;
        string reason = next ? next->lastError() : "no source implementation";
        return PipelineError::switchFailure(PipelineError(ErrorCode::SOURCE_OPEN_FAILED,
                                                          "Failed to open source " + descriptor.toString() + ": " + reason));
    }

    source = move(next);
    {
        lock_guard<mutex> lock(state_mutex_);
        source_desc_ = descriptor;
        source_info_ = source->info();
        source_open_ = true;
    }
    log_info("Source switched to " + log_string_src(descriptor.toString()));
    return PipelineError();
}

PipelineError PipelineController::applyBackendSwitch(const BackendDescriptor &descriptor, unique_ptr<InferenceBackend> &backend)
{
    log_info("Switching backend to " + log_string_src(backendKindToString(descriptor.kind)) + " (" + descriptor.model_path + ")");

    unique_ptr<InferenceBackend> next = backend_factory_(descriptor.kind);
    if (!next)
    {
        return PipelineError::switchFailure(PipelineError(ErrorCode::MODEL_LOAD_FAILED,
                                                          "No implementation for backend " + backendKindToString(descriptor.kind)));
    }

    // Nothing has been torn down yet, a missing delegate leaves the current backend running
    ModelStatus probe = next->probe(descriptor);
    if (probe != ModelStatus::OK)
    {
        PipelineError err = PipelineError::switchFailure(
            modelError(probe, "Backend " + backendKindToString(descriptor.kind) + " is not usable: " + modelStatusToString(probe)));
        log_warning(err.message + ", keeping " + backendKindToString(backend->descriptor().kind));
        return err;
    }

    // The old model stays loaded until the new one is ready
    ModelStatus status = next->load(descriptor);
    if (status != ModelStatus::OK)
    {
        PipelineError err = PipelineError::switchFailure(
            modelError(status, "Failed to load model " + descriptor.model_path + ": " + next->lastError()));
        log_warning(err.message + ", keeping " + backendKindToString(backend->descriptor().kind));
        next->unload();
        return err;
    }

    backend->unload();
    backend = move(next);
    {
        lock_guard<mutex> lock(state_mutex_);
        backend_desc_ = backend->descriptor();
        backend_loaded_ = true;
    }
    log_info("Backend switched to " + log_string_src(backendKindToString(descriptor.kind)));
    return PipelineError();
}

void PipelineController::waitInterruptible(chrono::steady_clock::time_point deadline)
{
    unique_lock<mutex> lock(state_mutex_);
    state_cv_.wait_until(lock, deadline, [this]
                         { return stop_requested_ || pending_ != nullptr; });
}

void PipelineController::updateFps()
{
    fps_window_frames_++;
    auto now = chrono::steady_clock::now();
    double elapsed = chrono::duration<double>(now - fps_window_start_).count();
    if (elapsed >= 1.0)
    {
        fps_ = fps_window_frames_ / elapsed;
        fps_window_frames_ = 0;
        fps_window_start_ = now;
    }
}

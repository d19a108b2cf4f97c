#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <opencv2/core.hpp>
#include "backend/backend_interface.hpp"
#include "source/frame_source.hpp"

// Counters shared between a test and the fakes owned by the controller
struct SourceLog
{
    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<int> reconnects{0};
    std::atomic<int> frames{0};
};

// Plays back a fixed list of read outcomes, then repeats `after` forever
class ScriptedSource : public FrameSource
{
public:
    ScriptedSource(std::deque<SourceStatus> script,
                   SourceStatus after = SourceStatus::END_OF_STREAM,
                   std::shared_ptr<SourceLog> log = std::make_shared<SourceLog>(),
                   bool open_ok = true,
                   cv::Size size = cv::Size(200, 200))
        : script_(std::move(script)), after_(after), log_(std::move(log)), open_ok_(open_ok), size_(size)
    {
    }

    bool open(const SourceDescriptor &descriptor) override
    {
        descriptor_ = descriptor;
        log_->opens++;
        opened_ = open_ok_;
        if (!open_ok_)
            error_ = "scripted open failure";
        return open_ok_;
    }

    SourceStatus nextFrame(Frame &frame) override
    {
        if (!opened_)
            return SourceStatus::NOT_OPEN;

        SourceStatus status = after_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!script_.empty())
            {
                status = script_.front();
                script_.pop_front();
            }
        }

        if (status != SourceStatus::OK)
        {
            error_ = "scripted " + sourceStatusToString(status);
            return status;
        }

        frame.image = cv::Mat(size_, CV_8UC3, cv::Scalar(40, 40, 40));
        frame.captured_at = std::chrono::system_clock::now();
        log_->frames++;
        return SourceStatus::OK;
    }

    bool reconnect() override
    {
        log_->reconnects++;
        opened_ = true;
        return true;
    }

    void close() override
    {
        if (opened_)
            log_->closes++;
        opened_ = false;
    }

    bool isOpened() const override { return opened_; }
    const SourceDescriptor &descriptor() const override { return descriptor_; }
    SourceInfo info() const override { return SourceInfo{size_.width, size_.height, 30.0, 0}; }
    std::string lastError() const override { return error_; }

private:
    std::mutex mutex_;
    std::deque<SourceStatus> script_;
    SourceStatus after_;
    std::shared_ptr<SourceLog> log_;
    bool open_ok_;
    cv::Size size_;
    bool opened_ = false;
    SourceDescriptor descriptor_;
    std::string error_;
};

struct BackendLog
{
    std::atomic<int> loads{0};
    std::atomic<int> unloads{0};
    std::atomic<int> infers{0};
};

// Returns whatever `detect` produces, fails on chosen frame sequence numbers
class FakeBackend : public InferenceBackend
{
public:
    using DetectFn = std::function<std::vector<RawDetection>(const Frame &)>;

    explicit FakeBackend(DetectFn detect = nullptr,
                         std::shared_ptr<BackendLog> log = std::make_shared<BackendLog>())
        : detect_(std::move(detect)), log_(std::move(log))
    {
    }

    ModelStatus probe_status = ModelStatus::OK;
    ModelStatus load_status = ModelStatus::OK;
    std::set<uint64_t> fail_sequences;

    // Simulated model latency
    std::chrono::milliseconds load_delay{0};
    std::chrono::milliseconds infer_delay{0};

    ModelStatus probe(const BackendDescriptor &) const override { return probe_status; }

    ModelStatus load(const BackendDescriptor &descriptor) override
    {
        log_->loads++;
        std::this_thread::sleep_for(load_delay);
        descriptor_ = descriptor;
        if (load_status != ModelStatus::OK)
        {
            error_ = "scripted " + modelStatusToString(load_status);
            return load_status;
        }
        loaded_ = true;
        return ModelStatus::OK;
    }

    bool infer(const Frame &frame, std::vector<RawDetection> &detections) override
    {
        log_->infers++;
        std::this_thread::sleep_for(infer_delay);
        detections.clear();
        if (fail_sequences.count(frame.sequence))
        {
            error_ = "scripted inference failure";
            return false;
        }
        if (detect_)
            detections = detect_(frame);
        return true;
    }

    void unload() override
    {
        if (loaded_)
            log_->unloads++;
        loaded_ = false;
    }

    bool isLoaded() const override { return loaded_; }
    const BackendDescriptor &descriptor() const override { return descriptor_; }
    std::string lastError() const override { return error_; }

private:
    DetectFn detect_;
    std::shared_ptr<BackendLog> log_;
    BackendDescriptor descriptor_;
    bool loaded_ = false;
    std::string error_;
};

inline RawDetection rawDetection(const std::string &label, float confidence, float x1, float y1, float x2, float y2)
{
    RawDetection det;
    det.label = label;
    det.confidence = confidence;
    det.x1 = x1;
    det.y1 = y1;
    det.x2 = x2;
    det.y2 = y2;
    return det;
}

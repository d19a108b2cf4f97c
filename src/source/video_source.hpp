#pragma once

#include <opencv2/videoio.hpp>
#include <string>
#include <vector>
#include "frame_source.hpp"

// OpenCV VideoCapture backed source for USB devices, network streams and files
class VideoSource : public FrameSource
{
public:
    VideoSource() = default;
    ~VideoSource() override;

    bool open(const SourceDescriptor &descriptor) override;
    SourceStatus nextFrame(Frame &frame) override;
    bool reconnect() override;
    void close() override;
    bool isOpened() const override { return opened_; }

    const SourceDescriptor &descriptor() const override { return descriptor_; }
    SourceInfo info() const override { return info_; }
    std::string lastError() const override { return last_error_; }

    // Probe local device indices [0, max_index) and return the ones that open
    static std::vector<int> listAvailableDevices(int max_index = 5);

    // Status for a read that returned no frame. A network stream that stops
    // delivering is treated as dropped even while the capture still reports open.
    static SourceStatus classifyReadFailure(SourceKind kind, bool capture_open, double position, int frame_count);

private:
    bool openCapture();
    SourceStatus readFailure();

    cv::VideoCapture cap_;
    SourceDescriptor descriptor_;
    SourceInfo info_;
    bool opened_ = false;
    std::string last_error_;
};

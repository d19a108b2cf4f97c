#include "video_source.hpp"
#include "utils.hpp"
#include <opencv2/videoio.hpp>

using namespace cv;
using namespace std;

namespace
{
    // Decode a fourcc code to a human-readable string
    string decodeFourCC(int fourcc)
    {
        char code[5];
        code[0] = static_cast<char>(fourcc & 0xFF);
        code[1] = static_cast<char>((fourcc >> 8) & 0xFF);
        code[2] = static_cast<char>((fourcc >> 16) & 0xFF);
        code[3] = static_cast<char>((fourcc >> 24) & 0xFF);
        code[4] = '\0';
        return string(code);
    }

    // Long stream URLs are truncated in log lines
    string displayName(const SourceDescriptor &descriptor)
    {
        if (descriptor.kind == SourceKind::DEVICE)
            return "USB Camera " + to_string(descriptor.device_index);

        string uri = descriptor.uri;
        if (uri.size() > 60)
            uri = uri.substr(0, 60) + "...";
        return descriptor.typeName() + ": " + uri;
    }
}

VideoSource::~VideoSource()
{
    close();
}

bool VideoSource::open(const SourceDescriptor &descriptor)
{
    close();
    descriptor_ = descriptor;
    return openCapture();
}

bool VideoSource::openCapture()
{
    last_error_.clear();
    info_ = SourceInfo();

    try
    {
        if (descriptor_.kind == SourceKind::DEVICE)
        {
            log_debug("Opening capture device " + log_string(descriptor_.device_index));
            cap_.open(descriptor_.device_index);

            if (cap_.isOpened())
            {
                // Local devices honour the requested resolution and rate
                cap_.set(CAP_PROP_FRAME_WIDTH, descriptor_.width);
                cap_.set(CAP_PROP_FRAME_HEIGHT, descriptor_.height);
                cap_.set(CAP_PROP_FPS, descriptor_.fps);
                cap_.set(CAP_PROP_BUFFERSIZE, 1);
            }
        }
        else
        {
            log_debug("Opening " + descriptor_.typeName() + " source: " + log_string_src(descriptor_.uri));
            vector<int> params;
            if (descriptor_.kind == SourceKind::NETWORK_STREAM || descriptor_.typeName() == "HTTP")
            {
                params = {CAP_PROP_OPEN_TIMEOUT_MSEC, descriptor_.open_timeout_ms,
                          CAP_PROP_READ_TIMEOUT_MSEC, descriptor_.read_timeout_ms};
            }
            cap_.open(descriptor_.uri, CAP_ANY, params);
        }
    }
    catch (const cv::Exception &e)
    {
        last_error_ = "OpenCV error while opening " + displayName(descriptor_) + ": " + e.what();
        log_error(last_error_);
        cap_.release();
        return false;
    }

    if (!cap_.isOpened())
    {
        last_error_ = "Failed to open " + displayName(descriptor_);
        log_error(last_error_);
        return false;
    }

    info_.width = static_cast<int>(cap_.get(CAP_PROP_FRAME_WIDTH));
    info_.height = static_cast<int>(cap_.get(CAP_PROP_FRAME_HEIGHT));
    info_.fps = cap_.get(CAP_PROP_FPS);
    if (descriptor_.kind == SourceKind::FILE)
        info_.frame_count = max(0, static_cast<int>(cap_.get(CAP_PROP_FRAME_COUNT)));

    if (descriptor_.kind == SourceKind::DEVICE)
    {
        log_debug("Device verification:");
        log_debug("  Resolution: " + log_string(info_.width) + "x" + log_string(info_.height) +
                  " (expected: " + log_string(descriptor_.width) + "x" + log_string(descriptor_.height) + ")");
        log_debug("  FPS: " + log_string(static_cast<int>(info_.fps)) + " (expected: " + log_string(descriptor_.fps) + ")");
        log_debug("  FOURCC: " + log_string_src(decodeFourCC(static_cast<int>(cap_.get(CAP_PROP_FOURCC)))));
        log_debug("  Backend: " + log_string_src(cap_.getBackendName()));
    }
    else
    {
        log_info(descriptor_.typeName() + " source opened - using native resolution/fps");
    }

    log_info(displayName(descriptor_) + " opened: " + to_string(info_.width) + "x" + to_string(info_.height) +
             " @ " + to_string(static_cast<int>(info_.fps)) + "fps");
    opened_ = true;
    return true;
}

SourceStatus VideoSource::nextFrame(Frame &frame)
{
    if (!opened_)
        return SourceStatus::NOT_OPEN;

    Mat image;
    bool ok = false;
    try
    {
        ok = cap_.read(image) && !image.empty();
    }
    catch (const cv::Exception &e)
    {
        last_error_ = string("OpenCV read error: ") + e.what();
        log_warning(last_error_);
        ok = false;
    }

    if (!ok)
    {
        SourceStatus status = readFailure();
        if (status != SourceStatus::END_OF_STREAM || !descriptor_.loop_playback)
            return status;

        // Looping playback: rewind once and try again
        log_info("Video ended, looping back to start");
        cap_.set(CAP_PROP_POS_FRAMES, 0);
        if (!cap_.read(image) || image.empty())
        {
            last_error_ = "Failed to read first frame after rewinding";
            return SourceStatus::END_OF_STREAM;
        }
    }

    frame.image = image;
    frame.captured_at = chrono::system_clock::now();
    return SourceStatus::OK;
}

SourceStatus VideoSource::classifyReadFailure(SourceKind kind, bool capture_open, double position, int frame_count)
{
    if (!capture_open || kind == SourceKind::NETWORK_STREAM)
        return SourceStatus::DISCONNECTED;

    // A decoder that stops before the known frame count hit a bad packet
    if (kind == SourceKind::FILE)
        return frame_count > 0 && position < frame_count - 1 ? SourceStatus::TRANSIENT_ERROR : SourceStatus::END_OF_STREAM;

    return SourceStatus::TRANSIENT_ERROR;
}

SourceStatus VideoSource::readFailure()
{
    bool capture_open = cap_.isOpened();
    double position = capture_open ? cap_.get(CAP_PROP_POS_FRAMES) : 0.0;
    SourceStatus status = classifyReadFailure(descriptor_.kind, capture_open, position, info_.frame_count);

    switch (status)
    {
    case SourceStatus::DISCONNECTED:
        last_error_ = capture_open ? "Lost stream " + displayName(descriptor_) : displayName(descriptor_) + " disconnected";
        break;
    case SourceStatus::END_OF_STREAM:
        last_error_ = "End of stream";
        break;
    default:
        last_error_ = descriptor_.kind == SourceKind::FILE
                          ? "Failed to decode frame " + to_string(static_cast<int>(position))
                          : "Failed to read frame from " + displayName(descriptor_);
        break;
    }
    return status;
}

bool VideoSource::reconnect()
{
    log_warning("Reconnecting " + displayName(descriptor_));
    close();
    return openCapture();
}

void VideoSource::close()
{
    if (cap_.isOpened())
    {
        cap_.release();
        log_info(displayName(descriptor_) + " closed");
    }
    opened_ = false;
}

vector<int> VideoSource::listAvailableDevices(int max_index)
{
    vector<int> available;
    for (int i = 0; i < max_index; i++)
    {
        try
        {
            VideoCapture cap(i);
            if (cap.isOpened())
            {
                available.push_back(i);
                cap.release();
            }
        }
        catch (const cv::Exception &e)
        {
            log_debug("Probing device " + to_string(i) + " failed: " + e.what());
        }
    }
    return available;
}

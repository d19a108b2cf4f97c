#pragma once
#include <string>
#include <vector>
#include "frame.hpp"

enum class SourceKind
{
    DEVICE,         // Local capture device by index (/dev/videoN)
    NETWORK_STREAM, // rtsp://, rtsps://, rtmp://, udp://, tcp://
    FILE            // Local file or http(s):// video URL
};

// Which source to open and how
struct SourceDescriptor
{
    SourceKind kind = SourceKind::DEVICE;
    int device_index = 0; // DEVICE only
    std::string uri;      // NETWORK_STREAM / FILE

    // Requested capture properties, honoured by local devices only
    int width = 640;
    int height = 480;
    int fps = 30;

    bool loop_playback = false; // FILE: restart at end of stream instead of ending

    // Network open/read timeouts so a dead stream cannot block the loop forever
    int open_timeout_ms = 10000;
    int read_timeout_ms = 5000;

    // "0" for devices, the URI otherwise
    std::string toString() const;

    // "USB", "RTSP", "HTTP" or "FILE"
    std::string typeName() const;
};

// Parse a user supplied source string: all digits -> device index,
// known stream schemes -> network stream, anything else -> file/HTTP playback
// Returns false for an empty or negative source
bool parseSourceDescriptor(const std::string &text, SourceDescriptor &descriptor);

// Outcome of a single read
enum class SourceStatus
{
    OK,
    TRANSIENT_ERROR, // Read failed, the source is still usable, retrying makes sense
    END_OF_STREAM,   // File playback reached its end
    DISCONNECTED,    // Network stream dropped, needs a reconnect
    NOT_OPEN         // nextFrame() called without a successful open()
};

std::string sourceStatusToString(SourceStatus status);

// Negotiated properties, read back from the source after opening
struct SourceInfo
{
    int width = 0;
    int height = 0;
    double fps = 0.0;
    int frame_count = 0; // FILE only, 0 when unknown
};

// Abstract frame provider owned by the pipeline controller
// Not thread safe: open/nextFrame/close are only called from one thread at a time
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    // Open the source, returns false and fills lastError() on failure
    virtual bool open(const SourceDescriptor &descriptor) = 0;

    // Block until a frame is available or the source fails/ends
    virtual SourceStatus nextFrame(Frame &frame) = 0;

    // Close and re-open the current descriptor (network sources)
    virtual bool reconnect() = 0;

    virtual void close() = 0;
    virtual bool isOpened() const = 0;

    virtual const SourceDescriptor &descriptor() const = 0;
    virtual SourceInfo info() const = 0;
    virtual std::string lastError() const = 0;
};

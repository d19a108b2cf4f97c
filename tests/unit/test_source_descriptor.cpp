#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "source/frame_source.hpp"
#include "source/video_source.hpp"

using namespace std;

TEST_CASE("digits select a capture device")
{
    SourceDescriptor d;
    REQUIRE(parseSourceDescriptor("2", d));
    CHECK(d.kind == SourceKind::DEVICE);
    CHECK(d.device_index == 2);
    CHECK(d.toString() == "2");
    CHECK(d.typeName() == "USB");

    REQUIRE(parseSourceDescriptor(" 0 ", d));
    CHECK(d.device_index == 0);
}

TEST_CASE("stream schemes select a network stream")
{
    SourceDescriptor d;
    for (const char *uri : {"rtsp://10.0.0.5/live", "RTSPS://cam/x", "rtmp://host/app", "udp://@:5000", "tcp://host:9000"})
    {
        CAPTURE(uri);
        REQUIRE(parseSourceDescriptor(uri, d));
        CHECK(d.kind == SourceKind::NETWORK_STREAM);
        CHECK(d.typeName() == "RTSP");
    }
    CHECK(d.toString() == "tcp://host:9000");
}

TEST_CASE("anything else plays back as a file")
{
    SourceDescriptor d;
    REQUIRE(parseSourceDescriptor("/data/run_04.mp4", d));
    CHECK(d.kind == SourceKind::FILE);
    CHECK(d.typeName() == "FILE");

    REQUIRE(parseSourceDescriptor("https://example.com/clip.mp4", d));
    CHECK(d.kind == SourceKind::FILE);
    CHECK(d.typeName() == "HTTP");
}

TEST_CASE("empty, blank and negative sources are rejected")
{
    SourceDescriptor d;
    d.device_index = 5;
    CHECK_FALSE(parseSourceDescriptor("", d));
    CHECK_FALSE(parseSourceDescriptor("   ", d));
    CHECK_FALSE(parseSourceDescriptor("-1", d));
    CHECK_FALSE(parseSourceDescriptor("99999999999999999999", d));
    CHECK(d.device_index == 5);
}

TEST_CASE("a stream that stops delivering frames counts as dropped")
{
    // Capture handle still open, as OpenCV leaves it after an RTSP drop
    CHECK(VideoSource::classifyReadFailure(SourceKind::NETWORK_STREAM, true, 0.0, 0) == SourceStatus::DISCONNECTED);
    CHECK(VideoSource::classifyReadFailure(SourceKind::NETWORK_STREAM, false, 0.0, 0) == SourceStatus::DISCONNECTED);
}

TEST_CASE("read failures on devices and files are classified by what is left")
{
    CHECK(VideoSource::classifyReadFailure(SourceKind::DEVICE, true, 0.0, 0) == SourceStatus::TRANSIENT_ERROR);
    CHECK(VideoSource::classifyReadFailure(SourceKind::DEVICE, false, 0.0, 0) == SourceStatus::DISCONNECTED);

    SUBCASE("bad packet before the last frame")
    {
        CHECK(VideoSource::classifyReadFailure(SourceKind::FILE, true, 40.0, 100) == SourceStatus::TRANSIENT_ERROR);
    }
    SUBCASE("past the last frame")
    {
        CHECK(VideoSource::classifyReadFailure(SourceKind::FILE, true, 99.0, 100) == SourceStatus::END_OF_STREAM);
    }
    SUBCASE("unknown length")
    {
        CHECK(VideoSource::classifyReadFailure(SourceKind::FILE, true, 40.0, 0) == SourceStatus::END_OF_STREAM);
    }
}

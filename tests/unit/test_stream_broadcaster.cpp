#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include "communication/stream_broadcaster.hpp"
#include "utils/logging.hpp"

using namespace std;
using json = nlohmann::json;

namespace
{
    void publishFrame(StreamBroadcaster &broadcaster, uint64_t sequence, vector<Detection> detections = {})
    {
        cv::Mat image(48, 64, CV_8UC3, cv::Scalar(10, 20, 30));
        broadcaster.publish(image, move(detections), sequence, chrono::system_clock::now());
    }
}

TEST_CASE("a slow subscriber keeps only the newest messages")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    StreamBroadcaster broadcaster(2);
    auto subscriber = broadcaster.subscribe();

    for (uint64_t seq = 1; seq <= 5; seq++)
        publishFrame(broadcaster, seq);

    CHECK(subscriber->size() == 2);
    CHECK(subscriber->dropped() == 3);
    CHECK(broadcaster.publishedCount() == 5);

    StreamSubscriber::MessagePtr message;
    REQUIRE(subscriber->pop(message, 10));
    CHECK(message->sequence() == 4);
    REQUIRE(subscriber->pop(message, 10));
    CHECK(message->sequence() == 5);
    CHECK_FALSE(subscriber->pop(message, 10));
}

TEST_CASE("publishing without consumers never blocks")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    StreamBroadcaster broadcaster(1);
    auto idle = broadcaster.subscribe();

    auto begin = chrono::steady_clock::now();
    for (uint64_t seq = 1; seq <= 200; seq++)
        publishFrame(broadcaster, seq);
    auto elapsed = chrono::steady_clock::now() - begin;

    CHECK(elapsed < chrono::seconds(2));
    CHECK(idle->size() == 1);
    CHECK(idle->dropped() == 199);
}

TEST_CASE("every subscriber receives the same message")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    StreamBroadcaster broadcaster(2);
    auto a = broadcaster.subscribe();
    auto b = broadcaster.subscribe();
    CHECK(a->id() != b->id());

    Detection det;
    det.class_name = "crack";
    det.confidence = 0.8f;
    det.bbox = BoundingBox{1, 2, 30, 40};
    det.frame_sequence = 9;
    publishFrame(broadcaster, 9, {det});

    StreamSubscriber::MessagePtr first, second;
    REQUIRE(a->pop(first, 10));
    REQUIRE(b->pop(second, 10));
    CHECK(first == second);

    json payload = json::parse(first->payload());
    CHECK(payload["sequence"] == 9);
    CHECK_FALSE(payload["frame"].get<string>().empty());
    REQUIRE(payload["detections"].size() == 1);
    CHECK(payload["detections"][0]["class_name"] == "crack");
    CHECK(payload["detections"][0]["bbox"]["x2"] == 30);
}

TEST_CASE("unsubscribe and closeAll release subscribers")
{
    logging::setLogLevel(logging::LogLevel::ERROR);
    StreamBroadcaster broadcaster(2);
    auto a = broadcaster.subscribe();
    auto b = broadcaster.subscribe();
    CHECK(broadcaster.subscriberCount() == 2);

    broadcaster.unsubscribe(a);
    CHECK(a->isClosed());
    CHECK(broadcaster.subscriberCount() == 1);

    publishFrame(broadcaster, 1);
    CHECK(a->size() == 0);
    CHECK(b->size() == 1);

    broadcaster.closeAll();
    CHECK(b->isClosed());
    CHECK(b->size() == 0);
    CHECK(broadcaster.subscriberCount() == 0);

    StreamSubscriber::MessagePtr message;
    CHECK_FALSE(b->pop(message, 10));
    CHECK_FALSE(b->push(message));
}

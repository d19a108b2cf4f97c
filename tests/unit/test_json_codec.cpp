#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "communication/json_codec.hpp"

using namespace std;
using json = nlohmann::json;

TEST_CASE("detection fields")
{
    Detection det;
    det.class_name = "corrosion";
    det.confidence = 0.75f;
    det.bbox = BoundingBox{10.6f, 20.2f, 110.9f, 220.0f};
    det.frame_sequence = 17;
    det.timestamp = chrono::system_clock::now();

    json j = det;
    CHECK(j["class_name"] == "corrosion");
    CHECK(j["confidence"].get<double>() == doctest::Approx(0.75));
    CHECK(j["bbox"]["x1"] == 10);
    CHECK(j["bbox"]["y2"] == 220);
    CHECK(j["sequence"] == 17);
    CHECK(j["timestamp"].get<string>().find('T') != string::npos);
    CHECK(j["frame_position"].is_null());

    det.frame_position = 3.25;
    j = det;
    CHECK(j["frame_position"].get<double>() == doctest::Approx(3.25));
}

TEST_CASE("summary without data has a null average")
{
    json empty = DetectionSummary();
    CHECK(empty["total_detections"] == 0);
    CHECK(empty["average_confidence"].is_null());
    CHECK(empty["by_class"].empty());

    Detection det;
    det.class_name = "rust";
    det.confidence = 0.5f;
    json full = DetectionSummary::fromDetections({det});
    CHECK(full["average_confidence"].get<double>() == doctest::Approx(0.5));
    CHECK(full["by_class"]["rust"] == 1);
}

TEST_CASE("errors carry code, category and cause")
{
    json plain = PipelineError(ErrorCode::ALREADY_RUNNING, "Pipeline is already running");
    CHECK(plain["error"] == "Pipeline is already running");
    CHECK(plain["code"] == "already_running");
    CHECK(plain["category"] == "state");
    CHECK_FALSE(plain.contains("cause"));

    json wrapped = PipelineError::switchFailure(PipelineError(ErrorCode::ACCELERATOR_UNAVAILABLE, "no npu"));
    CHECK(wrapped["code"] == "switch_failed");
    CHECK(wrapped["category"] == "switch");
    CHECK(wrapped["cause"] == "accelerator_unavailable");
}

TEST_CASE("report metadata reads missing keys as empty")
{
    ReportMetadata metadata = json{{"location", "Sector 7"}}.get<ReportMetadata>();
    CHECK(metadata.location == "Sector 7");
    CHECK(metadata.inspector.empty());
    CHECK_THROWS_AS(json({{"notes", 5}}).get<ReportMetadata>(), json::type_error);
}

TEST_CASE("status of a stopped pipeline")
{
    PipelineStatus status;
    status.last_error = PipelineError(ErrorCode::SOURCE_END_OF_STREAM, "done");
    json j = status;
    CHECK(j["state"] == "stopped");
    CHECK(j["running"] == false);
    CHECK(j["source"]["open"] == false);
    CHECK_FALSE(j["source"].contains("width"));
    CHECK(j["last_error"]["category"] == "source");
}

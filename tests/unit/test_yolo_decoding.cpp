#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "backend/dnn/yolo_decoding.hpp"

using namespace std;
using namespace yolo_decoding;

namespace
{
    cv::Mat tensor(int a, int b)
    {
        int sizes[] = {1, a, b};
        return cv::Mat(3, sizes, CV_32F, cv::Scalar(0));
    }

    float &at(cv::Mat &m, int i, int j)
    {
        return m.ptr<float>()[i * m.size[2] + j];
    }
}

TEST_CASE("layout detection")
{
    vector<string> names{"crack", "rust"};

    // [1, rows, dims] with objectness
    OutputLayout v5 = detectLayout(tensor(25, 7), names.size());
    CHECK(v5.valid);
    CHECK_FALSE(v5.channel_first);
    CHECK(v5.has_objectness);
    CHECK(v5.rows == 25);
    CHECK(v5.dims == 7);

    // [1, dims, rows] without objectness
    OutputLayout v8 = detectLayout(tensor(6, 8400), names.size());
    CHECK(v8.valid);
    CHECK(v8.channel_first);
    CHECK_FALSE(v8.has_objectness);
    CHECK(v8.rows == 8400);

    // Unknown class count falls back to the layout
    CHECK(detectLayout(tensor(25, 10), 0).has_objectness);
    CHECK_FALSE(detectLayout(tensor(10, 25), 0).has_objectness);

    CHECK_FALSE(detectLayout(tensor(10, 4), 0).valid);
}

TEST_CASE("rows with objectness are scaled to the frame")
{
    vector<string> names{"crack", "rust"};
    cv::Mat out = tensor(10, 7);
    // cx, cy, w, h, obj, crack, rust
    at(out, 3, 0) = 320;
    at(out, 3, 1) = 320;
    at(out, 3, 2) = 64;
    at(out, 3, 3) = 32;
    at(out, 3, 4) = 0.9f;
    at(out, 3, 5) = 0.2f;
    at(out, 3, 6) = 0.8f;

    DecodeParams params;
    params.frame_width = 1280;
    params.frame_height = 320;
    params.class_names = &names;

    auto dets = decodeOutput(out, params);
    REQUIRE(dets.size() == 1);
    CHECK(dets[0].label == "rust");
    CHECK(dets[0].class_id == 1);
    CHECK(dets[0].confidence == doctest::Approx(0.72f));
    CHECK(dets[0].x1 == doctest::Approx(576.0f));
    CHECK(dets[0].x2 == doctest::Approx(704.0f));
    CHECK(dets[0].y1 == doctest::Approx(152.0f));
    CHECK(dets[0].y2 == doctest::Approx(168.0f));
}

TEST_CASE("channel-first output without objectness")
{
    vector<string> names{"leak", "crack"};
    cv::Mat out = tensor(6, 20);
    // Column 5 holds one candidate
    at(out, 0, 5) = 100;
    at(out, 1, 5) = 200;
    at(out, 2, 5) = 20;
    at(out, 3, 5) = 40;
    at(out, 4, 5) = 0.65f;

    DecodeParams params;
    params.frame_width = 640;
    params.frame_height = 640;
    params.class_names = &names;

    auto dets = decodeOutput(out, params);
    REQUIRE(dets.size() == 1);
    CHECK(dets[0].label == "leak");
    CHECK(dets[0].confidence == doctest::Approx(0.65f));
    CHECK(dets[0].x1 == doctest::Approx(90.0f));
    CHECK(dets[0].y2 == doctest::Approx(220.0f));
}

TEST_CASE("class ids without a name get a generic label")
{
    vector<string> names{"crack"};
    CHECK(labelFor(0, &names) == "crack");
    CHECK(labelFor(3, &names) == "cls_3");
    CHECK(labelFor(1, nullptr) == "cls_1");
}

TEST_CASE("non-float output decodes to nothing")
{
    int sizes[] = {1, 10, 7};
    cv::Mat out(3, sizes, CV_8U, cv::Scalar(1));
    DecodeParams params;
    params.frame_width = 640;
    params.frame_height = 640;
    CHECK(decodeOutput(out, params).empty());
}

#include "stream_message.hpp"
#include "json_codec.hpp"
#include "utils.hpp"

using namespace std;
using json = nlohmann::json;

StreamMessage::StreamMessage(cv::Mat annotated,
                             vector<Detection> detections,
                             uint64_t sequence,
                             chrono::system_clock::time_point timestamp,
                             int jpeg_quality)
    : frame_(move(annotated)),
      detections_(move(detections)),
      sequence_(sequence),
      timestamp_(timestamp),
      jpeg_quality_(jpeg_quality)
{
}

const string &StreamMessage::payload() const
{
    call_once(encoded_, [this]()
              {
        json j;
        j["frame"] = encoding::jpegBase64(frame_, jpeg_quality_);
        j["detections"] = detections_;
        j["timestamp"] = timefmt::toIsoString(timestamp_);
        j["sequence"] = sequence_;
        payload_ = j.dump(); });
    return payload_;
}

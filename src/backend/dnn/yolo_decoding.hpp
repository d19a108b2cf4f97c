#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include "backend/backend_interface.hpp"

namespace yolo_decoding
{
    // Geometry needed to map model space back to the source frame
    struct DecodeParams
    {
        int input_width = 640;
        int input_height = 640;
        int frame_width = 0;
        int frame_height = 0;
        float score_floor = 0.01f;
        const std::vector<std::string> *class_names = nullptr;
    };

    // Tensor layout detected from the output shape
    struct OutputLayout
    {
        int rows = 0;               // Number of candidates
        int dims = 0;               // Values per candidate (4 box + optional objectness + classes)
        bool channel_first = false; // [1, dims, rows] instead of [1, rows, dims]
        bool has_objectness = false;
        bool valid = false;
    };

    // Work out layout and whether an objectness column is present
    // With known class names: dims == nc + 5 means objectness (YOLOv5 style),
    // otherwise channel-first exports are treated as YOLOv8 style (no objectness)
    OutputLayout detectLayout(const cv::Mat &output, size_t num_classes);

    // Decode one output tensor into raw detections in frame pixels
    std::vector<RawDetection> decodeOutput(const cv::Mat &output, const DecodeParams &params);

    // Label for a class id, "cls_<id>" when the id is out of range
    std::string labelFor(int class_id, const std::vector<std::string> *class_names);

} // namespace yolo_decoding

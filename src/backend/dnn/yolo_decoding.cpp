#include "yolo_decoding.hpp"
#include <algorithm>

using namespace cv;
using namespace std;

namespace yolo_decoding
{
    OutputLayout detectLayout(const Mat &output, size_t num_classes)
    {
        OutputLayout layout;

        if (output.dims == 3)
        {
            layout.rows = output.size[1];
            layout.dims = output.size[2];
            if (output.size[2] > output.size[1])
            {
                layout.rows = output.size[2];
                layout.dims = output.size[1];
                layout.channel_first = true;
            }
        }
        else if (output.dims == 2)
        {
            layout.rows = output.size[0];
            layout.dims = output.size[1];
        }
        else
        {
            return layout;
        }

        if (layout.dims < 5 || layout.rows <= 0)
            return layout;

        if (num_classes > 0)
            layout.has_objectness = layout.dims == static_cast<int>(num_classes) + 5;
        else
            layout.has_objectness = !layout.channel_first;

        layout.valid = true;
        return layout;
    }

    string labelFor(int class_id, const vector<string> *class_names)
    {
        if (class_names && class_id >= 0 && class_id < static_cast<int>(class_names->size()))
            return (*class_names)[class_id];
        return "cls_" + to_string(class_id);
    }

    vector<RawDetection> decodeOutput(const Mat &output, const DecodeParams &params)
    {
        vector<RawDetection> detections;
        if (output.empty() || output.type() != CV_32F)
            return detections;

        size_t num_classes = params.class_names ? params.class_names->size() : 0;
        OutputLayout layout = detectLayout(output, num_classes);
        if (!layout.valid)
            return detections;

        Mat contiguous = output.isContinuous() ? output : output.clone();
        const float *data = contiguous.ptr<float>();
        const int rows = layout.rows;
        const int class_start = layout.has_objectness ? 5 : 4;
        const int classes = layout.dims - class_start;

        const float scale_x = static_cast<float>(params.frame_width) / static_cast<float>(params.input_width);
        const float scale_y = static_cast<float>(params.frame_height) / static_cast<float>(params.input_height);

        for (int i = 0; i < rows; ++i)
        {
            const float *ptr = layout.channel_first ? (data + i) : (data + static_cast<size_t>(i) * layout.dims);
            auto item = [&](int idx) -> float
            {
                return layout.channel_first ? ptr[static_cast<size_t>(idx) * rows] : ptr[idx];
            };

            const float objectness = layout.has_objectness ? item(4) : 1.0f;
            if (objectness < params.score_floor)
                continue;

            int best_cls = -1;
            float best_score = 0.0f;
            for (int c = 0; c < classes; ++c)
            {
                float score = objectness * item(class_start + c);
                if (score > best_score)
                {
                    best_score = score;
                    best_cls = c;
                }
            }

            if (best_cls < 0 || best_score < params.score_floor)
                continue;

            const float cx = item(0);
            const float cy = item(1);
            const float w = item(2);
            const float h = item(3);

            RawDetection det;
            det.class_id = best_cls;
            det.label = labelFor(best_cls, params.class_names);
            det.confidence = min(1.0f, best_score);
            det.x1 = (cx - 0.5f * w) * scale_x;
            det.y1 = (cy - 0.5f * h) * scale_y;
            det.x2 = (cx + 0.5f * w) * scale_x;
            det.y2 = (cy + 0.5f * h) * scale_y;
            detections.push_back(det);
        }

        return detections;
    }

} // namespace yolo_decoding

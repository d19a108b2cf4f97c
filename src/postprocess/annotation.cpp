#include "annotation.hpp"
#include "defect_classes.hpp"
#include <algorithm>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

namespace annotation
{
    Mat drawDetections(const Mat &frame, const vector<Detection> &detections)
    {
        Mat annotated = frame.clone();
        if (annotated.empty())
            return annotated;

        for (const auto &det : detections)
        {
            Scalar color = defect_classes::colorOf(det.class_name);
            Point topLeft(static_cast<int>(det.bbox.x1), static_cast<int>(det.bbox.y1));
            Point bottomRight(static_cast<int>(det.bbox.x2), static_cast<int>(det.bbox.y2));

            rectangle(annotated, topLeft, bottomRight, color, 2);

            string label = det.class_name + ": " + format("%.2f", det.confidence);
            int baseline = 0;
            Size textSize = getTextSize(label, FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);

            // Label sits above the box, or inside it when the box touches the top edge
            int labelTop = max(0, topLeft.y - textSize.height - 10);
            rectangle(annotated,
                      Point(topLeft.x, labelTop),
                      Point(topLeft.x + textSize.width, labelTop + textSize.height + 10),
                      color, FILLED);
            putText(annotated, label, Point(topLeft.x, labelTop + textSize.height + 5),
                    FONT_HERSHEY_SIMPLEX, 0.5, Scalar(255, 255, 255), 1, LINE_AA);
        }

        return annotated;
    }

} // namespace annotation

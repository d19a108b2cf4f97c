#include "dnn_backend.hpp"
#include "yolo_decoding.hpp"
#include "utils.hpp"
#include <fstream>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

ModelStatus DnnBackend::probe(const BackendDescriptor &descriptor) const
{
    DnnTarget target;
    string reason;
    return selectTarget(descriptor, target, reason);
}

ModelStatus DnnBackend::load(const BackendDescriptor &descriptor)
{
    unload();
    last_error_.clear();

    DnnTarget target;
    string reason;
    ModelStatus status = selectTarget(descriptor, target, reason);
    if (status != ModelStatus::OK)
    {
        last_error_ = reason;
        log_error("Cannot load " + descriptor.model_path + ": " + reason);
        return status;
    }

    if (descriptor.input_width <= 0 || descriptor.input_height <= 0)
    {
        last_error_ = "Invalid model input size";
        log_error(last_error_);
        return ModelStatus::LOAD_FAILED;
    }

    BackendDescriptor resolved = descriptor;
    resolved.precision = target.precision;
    if (!descriptor.class_names_path.empty())
    {
        vector<string> names;
        if (!loadClassNames(descriptor.class_names_path, names))
            return ModelStatus::LOAD_FAILED;
        resolved.class_names = names;
    }

    try
    {
        net_ = dnn::readNet(descriptor.model_path);
        if (net_.empty())
        {
            last_error_ = "Model file produced an empty network: " + descriptor.model_path;
            log_error(last_error_);
            return ModelStatus::LOAD_FAILED;
        }
        net_.setPreferableBackend(target.backend);
        net_.setPreferableTarget(target.target);
        output_names_ = net_.getUnconnectedOutLayersNames();
    }
    catch (const cv::Exception &e)
    {
        last_error_ = "Could not load model " + descriptor.model_path + ": " + e.what();
        log_error(last_error_);
        net_ = dnn::Net();
        return ModelStatus::LOAD_FAILED;
    }

    descriptor_ = resolved;
    target_ = target;

    // First forward pass initialises the delegate, keep its latency out of the live stream
    if (!warmUp())
    {
        net_ = dnn::Net();
        output_names_.clear();
        return targetFailureStatus();
    }

    loaded_ = true;
    log_info("Loaded model " + log_string_src(descriptor.model_path) + " on " + target.name +
             " (" + precisionToString(target.precision) + ", " + to_string(descriptor_.class_names.size()) + " classes)");
    return ModelStatus::OK;
}

bool DnnBackend::warmUp()
{
    try
    {
        Mat dummy = Mat::zeros(descriptor_.input_height, descriptor_.input_width, CV_8UC3);
        Mat blob = dnn::blobFromImage(dummy, 1.0 / 255.0, Size(descriptor_.input_width, descriptor_.input_height),
                                      Scalar(), true, false);
        net_.setInput(blob);
        vector<Mat> outputs;
        net_.forward(outputs, output_names_);
        return true;
    }
    catch (const cv::Exception &e)
    {
        last_error_ = "Warm-up inference failed on " + target_.name + ": " + e.what();
        log_error(last_error_);
        return false;
    }
}

bool DnnBackend::infer(const Frame &frame, vector<RawDetection> &detections)
{
    detections.clear();
    if (!loaded_)
    {
        last_error_ = "No model loaded";
        return false;
    }
    if (frame.empty())
    {
        last_error_ = "Empty frame";
        return false;
    }

    vector<Mat> outputs;
    try
    {
        Mat blob = dnn::blobFromImage(frame.image, 1.0 / 255.0, Size(descriptor_.input_width, descriptor_.input_height),
                                      Scalar(), true, false);
        net_.setInput(blob);
        net_.forward(outputs, output_names_);
    }
    catch (const cv::Exception &e)
    {
        last_error_ = string("Inference failed: ") + e.what();
        return false;
    }

    if (outputs.empty())
    {
        last_error_ = "Model produced no output";
        return false;
    }

    yolo_decoding::DecodeParams params;
    params.input_width = descriptor_.input_width;
    params.input_height = descriptor_.input_height;
    params.frame_width = frame.width();
    params.frame_height = frame.height();
    params.score_floor = descriptor_.score_floor;
    params.class_names = &descriptor_.class_names;

    yolo_decoding::OutputLayout layout = yolo_decoding::detectLayout(outputs.front(), descriptor_.class_names.size());
    if (!layout.valid)
    {
        last_error_ = "Unsupported output tensor shape";
        return false;
    }

    detections = yolo_decoding::decodeOutput(outputs.front(), params);
    return true;
}

void DnnBackend::unload()
{
    if (loaded_)
        log_info("Unloading model " + descriptor_.model_path);
    net_ = dnn::Net();
    output_names_.clear();
    loaded_ = false;
}

bool DnnBackend::loadClassNames(const string &path, vector<string> &names)
{
    ifstream f(path);
    if (!f)
    {
        last_error_ = "Unable to open class names file: " + path;
        log_error(last_error_);
        return false;
    }

    string line;
    while (getline(f, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!line.empty())
            names.push_back(line);
    }

    if (names.empty())
    {
        last_error_ = "Class names file is empty: " + path;
        log_error(last_error_);
        return false;
    }
    return true;
}

#pragma once

#include <opencv2/dnn.hpp>
#include <string>
#include <vector>
#include "backend/backend_interface.hpp"

// Shared OpenCV DNN plumbing for both backend variants
// Subclasses only decide which DNN backend/target pair runs the network
class DnnBackend : public InferenceBackend
{
public:
    ModelStatus probe(const BackendDescriptor &descriptor) const override;
    ModelStatus load(const BackendDescriptor &descriptor) override;
    bool infer(const Frame &frame, std::vector<RawDetection> &detections) override;
    void unload() override;
    bool isLoaded() const override { return loaded_; }

    const BackendDescriptor &descriptor() const override { return descriptor_; }
    std::string lastError() const override { return last_error_; }

protected:
    struct DnnTarget
    {
        int backend = cv::dnn::DNN_BACKEND_OPENCV;
        int target = cv::dnn::DNN_TARGET_CPU;
        Precision precision = Precision::FP32;
        std::string name = "cpu";
    };

    // Pick the backend/target pair, reason is filled when the status is not OK
    virtual ModelStatus selectTarget(const BackendDescriptor &descriptor, DnnTarget &target, std::string &reason) const = 0;

    // Status reported when the network cannot run on the selected target
    virtual ModelStatus targetFailureStatus() const = 0;

private:
    bool loadClassNames(const std::string &path, std::vector<std::string> &names);
    bool warmUp();

    cv::dnn::Net net_;
    std::vector<std::string> output_names_;
    BackendDescriptor descriptor_;
    DnnTarget target_;
    bool loaded_ = false;
    std::string last_error_;
};

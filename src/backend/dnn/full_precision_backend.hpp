#pragma once
#include "dnn_backend.hpp"

// FP32 inference on the CPU through the default OpenCV DNN backend
// Always available, higher latency than the accelerated variant
class FullPrecisionBackend : public DnnBackend
{
protected:
    ModelStatus selectTarget(const BackendDescriptor &descriptor, DnnTarget &target, std::string &reason) const override;
    ModelStatus targetFailureStatus() const override { return ModelStatus::LOAD_FAILED; }
};

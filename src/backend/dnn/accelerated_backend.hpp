#pragma once
#include <string>
#include "dnn_backend.hpp"

// Reduced precision inference on a hardware delegate
//   cuda   -> DNN_BACKEND_CUDA,   DNN_TARGET_CUDA_FP16 (or CUDA for FP32)
//   opencl -> DNN_BACKEND_OPENCV, DNN_TARGET_OPENCL_FP16 (or OPENCL for FP32)
//   vulkan -> DNN_BACKEND_VKCOM,  DNN_TARGET_VULKAN
//   npu    -> DNN_BACKEND_TIMVX,  DNN_TARGET_NPU (INT8 quantized models only)
//   auto   -> first available of cuda, opencl, vulkan, npu
// Loading fails with ACCELERATOR_UNAVAILABLE when the delegate cannot be initialised,
// it never falls back to the CPU on its own
class AcceleratedBackend : public DnnBackend
{
public:
    // Whether OpenCV reports the delegate's backend/target pair as usable
    static bool delegateAvailable(const std::string &delegate, Precision precision);

protected:
    ModelStatus selectTarget(const BackendDescriptor &descriptor, DnnTarget &target, std::string &reason) const override;
    ModelStatus targetFailureStatus() const override { return ModelStatus::ACCELERATOR_UNAVAILABLE; }

private:
    static bool resolveDelegate(const std::string &delegate, Precision precision, DnnTarget &target);
};

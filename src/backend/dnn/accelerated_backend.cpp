#include "accelerated_backend.hpp"
#include "utils.hpp"
#include <algorithm>
#include <opencv2/core/ocl.hpp>

using namespace cv;
using namespace std;

namespace
{
    bool targetListed(dnn::Backend backend, dnn::Target target)
    {
        try
        {
            vector<dnn::Target> targets = dnn::getAvailableTargets(backend);
            return find(targets.begin(), targets.end(), target) != targets.end();
        }
        catch (const cv::Exception &e)
        {
            log_debug(string("Querying DNN targets failed: ") + e.what());
            return false;
        }
    }
}

bool AcceleratedBackend::resolveDelegate(const string &delegate, Precision precision, DnnTarget &target)
{
    if (delegate == "cuda")
    {
        dnn::Target t = precision == Precision::FP32 ? dnn::DNN_TARGET_CUDA : dnn::DNN_TARGET_CUDA_FP16;
        target.backend = dnn::DNN_BACKEND_CUDA;
        target.target = t;
        target.precision = precision == Precision::FP32 ? Precision::FP32 : Precision::FP16;
        target.name = "cuda";
        return targetListed(dnn::DNN_BACKEND_CUDA, t);
    }

    if (delegate == "opencl")
    {
        dnn::Target t = precision == Precision::FP32 ? dnn::DNN_TARGET_OPENCL : dnn::DNN_TARGET_OPENCL_FP16;
        target.backend = dnn::DNN_BACKEND_OPENCV;
        target.target = t;
        target.precision = precision == Precision::FP32 ? Precision::FP32 : Precision::FP16;
        target.name = "opencl";
        return ocl::haveOpenCL() && targetListed(dnn::DNN_BACKEND_OPENCV, t);
    }

    if (delegate == "vulkan")
    {
        target.backend = dnn::DNN_BACKEND_VKCOM;
        target.target = dnn::DNN_TARGET_VULKAN;
        target.precision = Precision::FP32;
        target.name = "vulkan";
        return targetListed(dnn::DNN_BACKEND_VKCOM, dnn::DNN_TARGET_VULKAN);
    }

    if (delegate == "npu")
    {
        target.backend = dnn::DNN_BACKEND_TIMVX;
        target.target = dnn::DNN_TARGET_NPU;
        target.precision = Precision::INT8;
        target.name = "npu";
        return targetListed(dnn::DNN_BACKEND_TIMVX, dnn::DNN_TARGET_NPU);
    }

    return false;
}

bool AcceleratedBackend::delegateAvailable(const string &delegate, Precision precision)
{
    DnnTarget target;
    if (delegate == "auto")
    {
        for (const char *candidate : {"cuda", "opencl", "vulkan", "npu"})
        {
            if (resolveDelegate(candidate, precision, target))
                return true;
        }
        return false;
    }
    return resolveDelegate(delegate, precision, target);
}

ModelStatus AcceleratedBackend::selectTarget(const BackendDescriptor &descriptor, DnnTarget &target, string &reason) const
{
    if (descriptor.model_path.empty())
    {
        reason = "No model path given";
        return ModelStatus::LOAD_FAILED;
    }

    static const vector<string> known = {"auto", "cuda", "opencl", "vulkan", "npu"};
    if (find(known.begin(), known.end(), descriptor.delegate) == known.end())
    {
        reason = "Unknown accelerator delegate '" + descriptor.delegate + "'";
        return ModelStatus::ACCELERATOR_UNAVAILABLE;
    }

    if (descriptor.delegate == "npu" && descriptor.precision != Precision::INT8)
        log_warning("NPU delegate runs INT8 models, requested " + precisionToString(descriptor.precision) + " is ignored");

    if (descriptor.delegate != "auto")
    {
        if (resolveDelegate(descriptor.delegate, descriptor.precision, target))
            return ModelStatus::OK;
        reason = "Accelerator delegate '" + descriptor.delegate + "' is not available on this machine";
        return ModelStatus::ACCELERATOR_UNAVAILABLE;
    }

    for (const char *candidate : {"cuda", "opencl", "vulkan", "npu"})
    {
        if (resolveDelegate(candidate, descriptor.precision, target))
        {
            log_debug(string("Auto-selected accelerator delegate ") + candidate);
            return ModelStatus::OK;
        }
    }

    reason = "No accelerator delegate is available on this machine";
    return ModelStatus::ACCELERATOR_UNAVAILABLE;
}

#include "full_precision_backend.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

ModelStatus FullPrecisionBackend::selectTarget(const BackendDescriptor &descriptor, DnnTarget &target, string &reason) const
{
    if (descriptor.precision != Precision::FP32)
    {
        log_warning("Full precision backend ignores requested " + precisionToString(descriptor.precision) + ", running FP32");
    }

    if (descriptor.model_path.empty())
    {
        reason = "No model path given";
        return ModelStatus::LOAD_FAILED;
    }

    target.backend = dnn::DNN_BACKEND_OPENCV;
    target.target = dnn::DNN_TARGET_CPU;
    target.precision = Precision::FP32;
    target.name = "cpu";
    return ModelStatus::OK;
}

#include "backend_factory.hpp"
#include "dnn/full_precision_backend.hpp"
#include "dnn/accelerated_backend.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>

using namespace std;

string backendKindToString(BackendKind kind)
{
    switch (kind)
    {
    case BackendKind::FULL_PRECISION:
        return "full_precision";
    case BackendKind::ACCELERATED:
        return "accelerated";
    }
    return "unknown";
}

string precisionToString(Precision precision)
{
    switch (precision)
    {
    case Precision::FP32:
        return "fp32";
    case Precision::FP16:
        return "fp16";
    case Precision::INT8:
        return "int8";
    }
    return "unknown";
}

string modelStatusToString(ModelStatus status)
{
    switch (status)
    {
    case ModelStatus::OK:
        return "ok";
    case ModelStatus::LOAD_FAILED:
        return "load_failed";
    case ModelStatus::ACCELERATOR_UNAVAILABLE:
        return "accelerator_unavailable";
    }
    return "unknown";
}

bool BackendFactory::parseKind(const string &text, BackendKind &kind)
{
    string lower = text;
    transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
              { return static_cast<char>(tolower(c)); });

    if (lower == "full" || lower == "full_precision" || lower == "fp32" || lower == "cpu")
    {
        kind = BackendKind::FULL_PRECISION;
        return true;
    }
    if (lower == "accelerated" || lower == "fp16" || lower == "int8" || lower == "gpu" || lower == "npu")
    {
        kind = BackendKind::ACCELERATED;
        return true;
    }
    return false;
}

bool BackendFactory::parsePrecision(const string &text, Precision &precision)
{
    string lower = text;
    transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c)
              { return static_cast<char>(tolower(c)); });

    if (lower == "fp32")
        precision = Precision::FP32;
    else if (lower == "fp16")
        precision = Precision::FP16;
    else if (lower == "int8")
        precision = Precision::INT8;
    else
        return false;
    return true;
}

Precision BackendFactory::defaultPrecision(BackendKind kind, const string &delegate)
{
    if (kind == BackendKind::FULL_PRECISION)
        return Precision::FP32;
    return delegate == "npu" ? Precision::INT8 : Precision::FP16;
}

unique_ptr<InferenceBackend> BackendFactory::createBackend(BackendKind kind)
{
    switch (kind)
    {
    case BackendKind::FULL_PRECISION:
        log_debug("Creating full precision backend");
        return make_unique<FullPrecisionBackend>();

    case BackendKind::ACCELERATED:
        log_debug("Creating accelerated backend");
        return make_unique<AcceleratedBackend>();
    }

    log_error("Unknown backend kind");
    return nullptr;
}

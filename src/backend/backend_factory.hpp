#pragma once
#include <memory>
#include <string>
#include "backend_interface.hpp"

// Creates inference backends from a BackendKind
class BackendFactory
{
public:
    // "full", "fp32", "cpu" -> FULL_PRECISION
    // "accelerated", "fp16", "int8", "gpu", "npu" -> ACCELERATED
    static bool parseKind(const std::string &text, BackendKind &kind);

    // "fp32", "fp16", "int8" (case-insensitive)
    static bool parsePrecision(const std::string &text, Precision &precision);

    // Default precision for a kind (FP32 / FP16), NPU delegates run INT8
    static Precision defaultPrecision(BackendKind kind, const std::string &delegate);

    static std::unique_ptr<InferenceBackend> createBackend(BackendKind kind);
};

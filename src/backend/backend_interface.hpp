#pragma once
#include <string>
#include <vector>
#include "source/frame.hpp"

// Which inference variant runs the model
enum class BackendKind
{
    FULL_PRECISION, // FP32 on the CPU, no special hardware
    ACCELERATED     // Reduced precision on a hardware delegate (CUDA, OpenCL, NPU)
};

enum class Precision
{
    FP32,
    FP16,
    INT8
};

// Identifies the active backend, its model artifact and numeric precision
struct BackendDescriptor
{
    BackendKind kind = BackendKind::FULL_PRECISION;
    std::string model_path = "models/pipescope.onnx";
    Precision precision = Precision::FP32;
    std::string delegate = "auto"; // ACCELERATED only: auto | cuda | opencl | npu

    // Model input geometry
    int input_width = 640;
    int input_height = 640;

    // Label for class id i, ids past the end become "cls_<id>"
    std::vector<std::string> class_names;
    std::string class_names_path; // Optional names file, one label per line, overrides class_names

    float score_floor = 0.01f; // Candidates below this never leave the backend
};

std::string backendKindToString(BackendKind kind);
std::string precisionToString(Precision precision);

// One candidate straight out of the model, before any filtering or suppression
// Coordinates are in source frame pixels
struct RawDetection
{
    int class_id = -1;
    std::string label;
    float confidence = 0.0f;
    float x1 = 0.0f, y1 = 0.0f, x2 = 0.0f, y2 = 0.0f;
};

enum class ModelStatus
{
    OK,
    LOAD_FAILED,            // Missing or unreadable model artifact
    ACCELERATOR_UNAVAILABLE // The hardware delegate could not be initialised
};

std::string modelStatusToString(ModelStatus status);

// Abstract "run the model on a frame" strategy
// One instance holds at most one loaded model; infer() is not re-entrant,
// the pipeline controller serialises every call
class InferenceBackend
{
public:
    virtual ~InferenceBackend() = default;

    // Check that the hardware this backend needs is present without loading anything
    virtual ModelStatus probe(const BackendDescriptor &descriptor) const = 0;

    // Load the model described by descriptor, replaces any model loaded before
    virtual ModelStatus load(const BackendDescriptor &descriptor) = 0;

    // Run one frame, returns false on a per-frame inference failure (see lastError())
    virtual bool infer(const Frame &frame, std::vector<RawDetection> &detections) = 0;

    virtual void unload() = 0;
    virtual bool isLoaded() const = 0;

    virtual const BackendDescriptor &descriptor() const = 0;
    virtual std::string lastError() const = 0;
};

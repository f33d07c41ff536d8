#pragma once

#include <memory>
#include <string>
#include <vector>

#include "maia/engine.hpp"
#include "maia/model_config.hpp"
#include "maia/session.hpp"

namespace maia
{

enum class Backend
{
    TensorRt,
    TorchScript,
    Onnx,
};

/// "tensorrt"/"trt", "torchscript"/"torch" or "onnx". Throws std::invalid_argument.
Backend parse_backend(const std::string& text);

struct EngineOptions
{
    Backend backend{Backend::TensorRt};
    /// Model file; ignored when model_bytes is non-empty.
    std::string model_path;
    std::vector<char> model_bytes;
    /// "cpu", "cuda" or "cuda:N". TensorRT requires a CUDA device.
    std::string device{"cuda"};
    ModelConfig config;
};

/// Throws ModelLoadError when the backend was not built or the model cannot be loaded.
std::unique_ptr<InferenceEngine> make_engine(const EngineOptions& options);

std::unique_ptr<Session> open_session(const EngineOptions& options);

} // namespace maia

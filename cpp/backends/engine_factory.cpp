#include "engine_factory.hpp"

#include <stdexcept>

#include "maia/errors.hpp"

#ifdef MAIA_HAS_TENSORRT
#include "trt_engine.hpp"
#endif
#ifdef MAIA_HAS_TORCH
#include "torch_engine.hpp"
#endif
#ifdef MAIA_HAS_ONNXRUNTIME
#include "onnx_engine.hpp"
#endif

namespace maia
{

Backend parse_backend(const std::string& text)
{
    if (text == "tensorrt" || text == "trt")
    {
        return Backend::TensorRt;
    }
    if (text == "torchscript" || text == "torch")
    {
        return Backend::TorchScript;
    }
    if (text == "onnx")
    {
        return Backend::Onnx;
    }
    throw std::invalid_argument("Unknown backend: " + text + " (expected tensorrt, torchscript or onnx)");
}

std::unique_ptr<InferenceEngine> make_engine(const EngineOptions& options)
{
    if (options.model_bytes.empty() && options.model_path.empty())
    {
        throw ModelLoadError("No model path or model bytes given.");
    }

    switch (options.backend)
    {
    case Backend::TensorRt:
#ifdef MAIA_HAS_TENSORRT
    {
        const int device = parse_cuda_device(options.device);
        if (!options.model_bytes.empty())
        {
            return std::make_unique<TensorRtEngine>(options.model_bytes, options.config, device);
        }
        return std::make_unique<TensorRtEngine>(options.model_path, options.config, device);
    }
#else
        throw ModelLoadError("This build has no TensorRT backend (configure with MAIA_WITH_TENSORRT=ON).");
#endif
    case Backend::TorchScript:
#ifdef MAIA_HAS_TORCH
        if (!options.model_bytes.empty())
        {
            return std::make_unique<TorchScriptEngine>(options.model_bytes, options.config, options.device);
        }
        return std::make_unique<TorchScriptEngine>(options.model_path, options.config, options.device);
#else
        throw ModelLoadError("This build has no TorchScript backend (configure with MAIA_WITH_TORCH=ON).");
#endif
    case Backend::Onnx:
#ifdef MAIA_HAS_ONNXRUNTIME
        if (!options.model_bytes.empty())
        {
            return std::make_unique<OnnxEngine>(options.model_bytes, options.config, options.device);
        }
        return std::make_unique<OnnxEngine>(options.model_path, options.config, options.device);
#else
        throw ModelLoadError("This build has no ONNX Runtime backend (configure with MAIA_WITH_ONNXRUNTIME=ON).");
#endif
    }
    throw ModelLoadError("Unknown backend.");
}

std::unique_ptr<Session> open_session(const EngineOptions& options)
{
    return std::make_unique<Session>(make_engine(options), options.config);
}

} // namespace maia

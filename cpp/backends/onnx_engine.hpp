#pragma once

#include <onnxruntime_cxx_api.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "maia/engine.hpp"
#include "maia/model_config.hpp"

namespace maia
{

/// The published Maia2 ONNX export, run through ONNX Runtime.
///
/// Inputs and outputs are looked up by the names in ModelConfig. Elo inputs
/// may be declared int64 or int32; board, policy and value tensors must be
/// float. "cpu" runs on the default provider, "cuda" / "cuda:N" appends the
/// CUDA execution provider. Ort::Session::Run is safe to call concurrently.
class OnnxEngine : public InferenceEngine
{
public:
    OnnxEngine(const std::string& model_path, const ModelConfig& config, const std::string& device = "cpu");
    OnnxEngine(const std::vector<char>& model_bytes, const ModelConfig& config, const std::string& device = "cpu");

    EngineOutputs run(const Batch& batch) override;
    std::string name() const override { return "ONNX[" + label_ + "]"; }
    std::size_t max_batch_size() const override { return maxBatch_; }
    bool supports_concurrent_runs() const override { return true; }

private:
    struct TensorInfo
    {
        std::string name;
        std::vector<int64_t> shape;
        ONNXTensorElementDataType type{ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT};
    };

    static Ort::SessionOptions makeOptions(const std::string& device);
    void describeIo();
    TensorInfo findTensor(const std::string& tensor, bool input) const;

    ModelConfig config_;
    std::string label_;
    std::string device_;
    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo memoryInfo_;

    TensorInfo boards_;
    TensorInfo eloSelf_;
    TensorInfo eloOppo_;
    TensorInfo policy_;
    TensorInfo value_;

    std::size_t maxBatch_{0};
};

/// "cpu" -> nullopt, "cuda" / "cuda:N" -> device ordinal. Throws ModelLoadError otherwise.
std::optional<int> parse_onnx_device(const std::string& device);

} // namespace maia

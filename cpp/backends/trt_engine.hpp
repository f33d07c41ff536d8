#pragma once

#include <NvInfer.h>
#include <cuda_runtime_api.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "maia/engine.hpp"
#include "maia/model_config.hpp"

namespace maia
{

/// RAII CUDA device allocation.
class DeviceBuffer
{
public:
    explicit DeviceBuffer(size_t bytes);
    ~DeviceBuffer();
    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;

    void* data() const noexcept { return ptr_; }

private:
    void* ptr_{nullptr};
};

/// RAII CUDA stream
class CudaStream
{
public:
    CudaStream();
    ~CudaStream();
    CudaStream(const CudaStream&) = delete;
    CudaStream& operator=(const CudaStream&) = delete;

    cudaStream_t get() const noexcept { return stream_; }

private:
    cudaStream_t stream_{};
};

/// Serialized TensorRT plan exported from a Maia2 model.
///
/// The IO tensors named in ModelConfig are checked at load time. Engines
/// with a dynamic batch dimension accept up to the optimization profile's
/// maximum; fixed-batch engines get short batches padded with copies of the
/// last sample. Every run() creates its own execution context and stream.
class TensorRtEngine : public InferenceEngine
{
public:
    TensorRtEngine(const std::string& plan_path, const ModelConfig& config, int device = 0);
    TensorRtEngine(const std::vector<char>& plan, const ModelConfig& config, int device = 0);

    EngineOutputs run(const Batch& batch) override;
    std::string name() const override { return "TensorRT[" + label_ + "]"; }
    std::size_t max_batch_size() const override { return maxBatch_; }
    bool supports_concurrent_runs() const override { return true; }

private:
    class Logger : public nvinfer1::ILogger
    {
    public:
        void log(Severity severity, const char* msg) noexcept override;
    };

    struct TensorInfo
    {
        std::string name;
        nvinfer1::Dims dims{};
        nvinfer1::DataType type{nvinfer1::DataType::kFLOAT};
    };

    void load(const std::vector<char>& plan);
    TensorInfo describe(const std::string& tensor, nvinfer1::TensorIOMode mode) const;

    ModelConfig config_;
    std::string label_;
    int device_;
    Logger logger_;
    std::unique_ptr<nvinfer1::IRuntime> runtime_;
    std::unique_ptr<nvinfer1::ICudaEngine> engine_;

    TensorInfo boards_;
    TensorInfo eloSelf_;
    TensorInfo eloOppo_;
    TensorInfo policy_;
    TensorInfo value_;

    bool dynamicBatch_{false};
    std::size_t maxBatch_{0};
};

/// Parse "cuda" / "cuda:N" into a CUDA device ordinal.
int parse_cuda_device(const std::string& device);

} // namespace maia

#include "trt_engine.hpp"

#include <cuda_fp16.h>

#include <charconv>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>

#include "maia/errors.hpp"

namespace maia
{

namespace
{

size_t getElementSize(nvinfer1::DataType dtype)
{
    switch (dtype)
    {
    case nvinfer1::DataType::kFLOAT:
        return 4;
    case nvinfer1::DataType::kHALF:
        return 2;
    case nvinfer1::DataType::kINT32:
        return 4;
    case nvinfer1::DataType::kINT64:
        return 8;
    default:
        throw ShapeError("Unsupported TensorRT data type");
    }
}

std::string describeDims(const nvinfer1::Dims& dims)
{
    std::string text = "[";
    for (int i = 0; i < dims.nbDims; ++i)
    {
        if (i > 0)
        {
            text += ", ";
        }
        text += std::to_string(static_cast<int64_t>(dims.d[i]));
    }
    return text + "]";
}

std::vector<char> readPlan(const std::string& path)
{
    std::ifstream planFile(path, std::ios::binary);
    if (!planFile)
    {
        throw ModelLoadError("Failed to open engine file: " + path);
    }

    planFile.seekg(0, std::ifstream::end);
    const auto fsize = planFile.tellg();
    planFile.seekg(0, std::ifstream::beg);

    std::vector<char> plan(static_cast<size_t>(fsize));
    planFile.read(plan.data(), fsize);
    if (!planFile)
    {
        throw ModelLoadError("Failed to read engine file: " + path);
    }
    return plan;
}

// Host bytes of a float tensor in the engine's declared precision.
std::vector<char> packFloats(const std::vector<float>& values, nvinfer1::DataType type, const std::string& tensor)
{
    std::vector<char> bytes(values.size() * getElementSize(type));
    if (type == nvinfer1::DataType::kFLOAT)
    {
        std::memcpy(bytes.data(), values.data(), bytes.size());
    }
    else if (type == nvinfer1::DataType::kHALF)
    {
        auto* out = reinterpret_cast<__half*>(bytes.data());
        for (size_t i = 0; i < values.size(); ++i)
        {
            out[i] = __float2half(values[i]);
        }
    }
    else
    {
        throw ShapeError("Unsupported data type for float tensor '" + tensor + "'");
    }
    return bytes;
}

std::vector<char> packInts(const std::vector<int64_t>& values, nvinfer1::DataType type, const std::string& tensor)
{
    std::vector<char> bytes(values.size() * getElementSize(type));
    if (type == nvinfer1::DataType::kINT64)
    {
        std::memcpy(bytes.data(), values.data(), bytes.size());
    }
    else if (type == nvinfer1::DataType::kINT32)
    {
        auto* out = reinterpret_cast<int32_t*>(bytes.data());
        for (size_t i = 0; i < values.size(); ++i)
        {
            out[i] = static_cast<int32_t>(values[i]);
        }
    }
    else
    {
        throw ShapeError("Unsupported data type for integer tensor '" + tensor + "'");
    }
    return bytes;
}

std::vector<float> unpackFloats(const std::vector<char>& bytes, size_t count, nvinfer1::DataType type)
{
    std::vector<float> values(count);
    if (type == nvinfer1::DataType::kFLOAT)
    {
        std::memcpy(values.data(), bytes.data(), count * sizeof(float));
    }
    else
    {
        const auto* in = reinterpret_cast<const __half*>(bytes.data());
        for (size_t i = 0; i < count; ++i)
        {
            values[i] = __half2float(in[i]);
        }
    }
    return values;
}

// Repeat the last sample until the batch holds `rows` samples.
template <typename T>
std::vector<T> padRows(const std::vector<T>& values, size_t samples, size_t rows)
{
    std::vector<T> padded(values);
    const size_t width = values.size() / samples;
    padded.reserve(width * rows);
    for (size_t r = samples; r < rows; ++r)
    {
        padded.insert(padded.end(), values.end() - static_cast<std::ptrdiff_t>(width), values.end());
    }
    return padded;
}

} // anonymous namespace

DeviceBuffer::DeviceBuffer(size_t bytes)
{
    if (cudaMalloc(&ptr_, bytes) != cudaSuccess)
    {
        throw EngineError("cudaMalloc failed for " + std::to_string(bytes) + " bytes");
    }
}

DeviceBuffer::~DeviceBuffer()
{
    if (ptr_)
    {
        cudaFree(ptr_);
    }
}

CudaStream::CudaStream()
{
    if (cudaStreamCreate(&stream_) != cudaSuccess)
    {
        throw EngineError("Failed to create CUDA stream.");
    }
}

CudaStream::~CudaStream()
{
    if (stream_)
    {
        cudaStreamDestroy(stream_);
    }
}

int parse_cuda_device(const std::string& device)
{
    if (device == "cuda")
    {
        return 0;
    }
    if (device.rfind("cuda:", 0) == 0)
    {
        int ordinal = -1;
        const char* begin = device.data() + 5;
        const char* end = device.data() + device.size();
        const auto [ptr, ec] = std::from_chars(begin, end, ordinal);
        if (ec == std::errc() && ptr == end && ordinal >= 0)
        {
            return ordinal;
        }
    }
    throw ModelLoadError("TensorRT requires a CUDA device ('cuda' or 'cuda:N'), got: " + device);
}

void TensorRtEngine::Logger::log(Severity severity, const char* msg) noexcept
{
    if (severity <= Severity::kWARNING)
    {
        std::cerr << "[TensorRT] " << msg << std::endl;
    }
}

TensorRtEngine::TensorRtEngine(const std::string& plan_path, const ModelConfig& config, int device)
    : config_(config)
    , label_(plan_path)
    , device_(device)
{
    load(readPlan(plan_path));
    std::cout << "[TensorRT] Loaded: " << plan_path << " (max batch " << maxBatch_
              << (dynamicBatch_ ? ", dynamic" : ", fixed") << ")" << std::endl;
}

TensorRtEngine::TensorRtEngine(const std::vector<char>& plan, const ModelConfig& config, int device)
    : config_(config)
    , label_("<memory>")
    , device_(device)
{
    load(plan);
}

void TensorRtEngine::load(const std::vector<char>& plan)
{
    validate(config_);
    if (plan.empty())
    {
        throw ModelLoadError("TensorRT plan is empty: " + label_);
    }
    if (cudaSetDevice(device_) != cudaSuccess)
    {
        throw ModelLoadError("Failed to select CUDA device " + std::to_string(device_));
    }

    runtime_.reset(nvinfer1::createInferRuntime(logger_));
    if (!runtime_)
    {
        throw ModelLoadError("Failed to create TensorRT runtime.");
    }

    engine_.reset(runtime_->deserializeCudaEngine(plan.data(), plan.size()));
    if (!engine_)
    {
        throw ModelLoadError("Failed to deserialize TensorRT engine: " + label_);
    }

    boards_ = describe(config_.boards_tensor, nvinfer1::TensorIOMode::kINPUT);
    eloSelf_ = describe(config_.elo_self_tensor, nvinfer1::TensorIOMode::kINPUT);
    eloOppo_ = describe(config_.elo_oppo_tensor, nvinfer1::TensorIOMode::kINPUT);
    policy_ = describe(config_.policy_tensor, nvinfer1::TensorIOMode::kOUTPUT);
    value_ = describe(config_.value_tensor, nvinfer1::TensorIOMode::kOUTPUT);

    const auto& bd = boards_.dims;
    if (bd.nbDims != 4 || bd.d[1] != config_.board_planes || bd.d[2] != config_.board_size
        || bd.d[3] != config_.board_size)
    {
        throw ShapeError("Input '" + boards_.name + "' has shape " + describeDims(bd) + ", expected [N, "
                         + std::to_string(config_.board_planes) + ", " + std::to_string(config_.board_size) + ", "
                         + std::to_string(config_.board_size) + "]");
    }
    for (const auto* elo : {&eloSelf_, &eloOppo_})
    {
        if (elo->dims.nbDims != 1)
        {
            throw ShapeError("Input '" + elo->name + "' has shape " + describeDims(elo->dims) + ", expected [N]");
        }
    }
    if (policy_.dims.nbDims != 2 || policy_.dims.d[1] != config_.policy_size)
    {
        throw ShapeError("Output '" + policy_.name + "' has shape " + describeDims(policy_.dims) + ", expected [N, "
                         + std::to_string(config_.policy_size) + "]");
    }
    if (value_.dims.nbDims != 1 && !(value_.dims.nbDims == 2 && value_.dims.d[1] == 1))
    {
        throw ShapeError("Output '" + value_.name + "' has shape " + describeDims(value_.dims) + ", expected [N]");
    }

    if (bd.d[0] < 0)
    {
        dynamicBatch_ = true;
        const auto maxDims
            = engine_->getProfileShape(boards_.name.c_str(), 0, nvinfer1::OptProfileSelector::kMAX);
        if (maxDims.nbDims < 1 || maxDims.d[0] <= 0)
        {
            throw ModelLoadError("Dynamic engine has no usable optimization profile for '" + boards_.name + "'");
        }
        maxBatch_ = static_cast<size_t>(maxDims.d[0]);
    }
    else
    {
        maxBatch_ = static_cast<size_t>(bd.d[0]);
    }

    for (const auto* tensor : {&boards_, &policy_, &value_})
    {
        if (tensor->type != nvinfer1::DataType::kFLOAT && tensor->type != nvinfer1::DataType::kHALF)
        {
            throw ShapeError("Tensor '" + tensor->name + "' must be FP32 or FP16.");
        }
    }
    for (const auto* tensor : {&eloSelf_, &eloOppo_})
    {
        if (tensor->type != nvinfer1::DataType::kINT64 && tensor->type != nvinfer1::DataType::kINT32)
        {
            throw ShapeError("Tensor '" + tensor->name + "' must be INT64 or INT32.");
        }
    }
}

TensorRtEngine::TensorInfo TensorRtEngine::describe(const std::string& tensor, nvinfer1::TensorIOMode mode) const
{
    if (engine_->getTensorIOMode(tensor.c_str()) != mode)
    {
        std::string declared;
        for (int i = 0; i < engine_->getNbIOTensors(); ++i)
        {
            declared += (i > 0 ? ", " : "") + std::string(engine_->getIOTensorName(i));
        }
        throw ModelLoadError("Engine has no " + std::string(mode == nvinfer1::TensorIOMode::kINPUT ? "input" : "output")
                             + " tensor named '" + tensor + "' (declared: " + declared + ")");
    }

    TensorInfo info;
    info.name = tensor;
    info.dims = engine_->getTensorShape(tensor.c_str());
    info.type = engine_->getTensorDataType(tensor.c_str());
    return info;
}

EngineOutputs TensorRtEngine::run(const Batch& batch)
{
    if (batch.size == 0)
    {
        throw InputError("TensorRT engine received an empty batch.");
    }
    if (batch.sample_elements != config_.board_elements())
    {
        throw ShapeError("Batch samples have " + std::to_string(batch.sample_elements) + " board elements, engine expects "
                         + std::to_string(config_.board_elements()));
    }
    if (batch.size > maxBatch_)
    {
        throw ShapeError("Batch of " + std::to_string(batch.size) + " exceeds engine maximum " + std::to_string(maxBatch_));
    }

    if (cudaSetDevice(device_) != cudaSuccess)
    {
        throw EngineError("Failed to select CUDA device " + std::to_string(device_));
    }

    const size_t rows = dynamicBatch_ ? batch.size : maxBatch_;
    const size_t policySize = static_cast<size_t>(config_.policy_size);

    const auto boardsHost = packFloats(padRows(batch.boards, batch.size, rows), boards_.type, boards_.name);
    const auto eloSelfHost = packInts(padRows(batch.elo_self, batch.size, rows), eloSelf_.type, eloSelf_.name);
    const auto eloOppoHost = packInts(padRows(batch.elo_oppo, batch.size, rows), eloOppo_.type, eloOppo_.name);

    std::unique_ptr<nvinfer1::IExecutionContext> executionContext(engine_->createExecutionContext());
    if (!executionContext)
    {
        throw EngineError("Failed to create TensorRT execution context.");
    }

    if (dynamicBatch_)
    {
        auto boardDims = boards_.dims;
        boardDims.d[0] = static_cast<int64_t>(rows);
        nvinfer1::Dims eloDims{};
        eloDims.nbDims = 1;
        eloDims.d[0] = static_cast<int64_t>(rows);
        if (!executionContext->setInputShape(boards_.name.c_str(), boardDims)
            || !executionContext->setInputShape(eloSelf_.name.c_str(), eloDims)
            || !executionContext->setInputShape(eloOppo_.name.c_str(), eloDims))
        {
            throw EngineError("Failed to set TensorRT input shapes for batch " + std::to_string(rows));
        }
    }

    const size_t policyBytes = rows * policySize * getElementSize(policy_.type);
    const size_t valueBytes = rows * getElementSize(value_.type);

    DeviceBuffer boardsDevice(boardsHost.size());
    DeviceBuffer eloSelfDevice(eloSelfHost.size());
    DeviceBuffer eloOppoDevice(eloOppoHost.size());
    DeviceBuffer policyDevice(policyBytes);
    DeviceBuffer valueDevice(valueBytes);
    CudaStream stream;

    const std::pair<const std::vector<char>*, const DeviceBuffer*> uploads[] = {
        {&boardsHost, &boardsDevice}, {&eloSelfHost, &eloSelfDevice}, {&eloOppoHost, &eloOppoDevice}};
    for (const auto& [host, device] : uploads)
    {
        if (cudaMemcpyAsync(device->data(), host->data(), host->size(), cudaMemcpyHostToDevice, stream.get()) != cudaSuccess)
        {
            throw EngineError("cudaMemcpyAsync (H2D) failed.");
        }
    }

    if (!executionContext->setTensorAddress(boards_.name.c_str(), boardsDevice.data())
        || !executionContext->setTensorAddress(eloSelf_.name.c_str(), eloSelfDevice.data())
        || !executionContext->setTensorAddress(eloOppo_.name.c_str(), eloOppoDevice.data())
        || !executionContext->setTensorAddress(policy_.name.c_str(), policyDevice.data())
        || !executionContext->setTensorAddress(value_.name.c_str(), valueDevice.data()))
    {
        throw EngineError("Failed to set TensorRT tensor addresses.");
    }

    if (!executionContext->enqueueV3(stream.get()))
    {
        throw EngineError("TensorRT enqueue failed.");
    }

    std::vector<char> policyHost(policyBytes);
    std::vector<char> valueHost(valueBytes);
    if (cudaMemcpyAsync(policyHost.data(), policyDevice.data(), policyBytes, cudaMemcpyDeviceToHost, stream.get()) != cudaSuccess)
    {
        throw EngineError("cudaMemcpyAsync (policy D2H) failed.");
    }
    if (cudaMemcpyAsync(valueHost.data(), valueDevice.data(), valueBytes, cudaMemcpyDeviceToHost, stream.get()) != cudaSuccess)
    {
        throw EngineError("cudaMemcpyAsync (value D2H) failed.");
    }
    if (cudaStreamSynchronize(stream.get()) != cudaSuccess)
    {
        throw EngineError("cudaStreamSynchronize failed.");
    }

    // Padding rows are dropped here.
    EngineOutputs outputs;
    outputs.policy = unpackFloats(policyHost, batch.size * policySize, policy_.type);
    outputs.value = unpackFloats(valueHost, batch.size, value_.type);
    return outputs;
}

} // namespace maia

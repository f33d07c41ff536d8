#include "onnx_engine.hpp"

#include <charconv>
#include <iostream>

#include "maia/errors.hpp"

namespace maia
{

namespace
{

std::string shapeString(const std::vector<int64_t>& shape)
{
    std::string out = "[";
    for (size_t i = 0; i < shape.size(); ++i)
    {
        if (i > 0) out += ", ";
        out += std::to_string(shape[i]);
    }
    return out + "]";
}

// Dimensions after the batch axis must match where the model declares them.
void checkTrailingDims(const std::string& name, const std::vector<int64_t>& shape, const std::vector<int64_t>& expected)
{
    if (shape.size() != expected.size() + 1)
    {
        throw ShapeError("Tensor " + name + " has shape " + shapeString(shape) + ", expected rank "
                         + std::to_string(expected.size() + 1));
    }
    for (size_t i = 0; i < expected.size(); ++i)
    {
        if (shape[i + 1] > 0 && shape[i + 1] != expected[i])
        {
            throw ShapeError("Tensor " + name + " has shape " + shapeString(shape) + ", dimension " + std::to_string(i + 1)
                             + " should be " + std::to_string(expected[i]));
        }
    }
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

std::vector<int32_t> narrowElos(const std::vector<int64_t>& elos)
{
    return std::vector<int32_t>(elos.begin(), elos.end());
}

} // anonymous namespace

std::optional<int> parse_onnx_device(const std::string& device)
{
    if (device == "cpu")
    {
        return std::nullopt;
    }
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
    throw ModelLoadError("ONNX device must be 'cpu', 'cuda' or 'cuda:N', got: " + device);
}

Ort::SessionOptions OnnxEngine::makeOptions(const std::string& device)
{
    const auto ordinal = parse_onnx_device(device);

    Ort::SessionOptions options;
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    if (ordinal)
    {
        OrtCUDAProviderOptions cuda{};
        cuda.device_id = *ordinal;
        options.AppendExecutionProvider_CUDA(cuda);
    }
    return options;
}

OnnxEngine::OnnxEngine(const std::string& model_path, const ModelConfig& config, const std::string& device)
    : config_(config)
    , label_(model_path)
    , device_(device)
    , env_(ORT_LOGGING_LEVEL_WARNING, "maia")
    , memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
{
    validate(config_);
    try
    {
        const Ort::SessionOptions options = makeOptions(device_);
        session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), options);
        describeIo();
    }
    catch (const Ort::Exception& e)
    {
        throw ModelLoadError("Failed to load ONNX model " + model_path + ": " + e.what());
    }

    std::cout << "[ONNX] Loaded: " << model_path << " (" << device_ << ")" << std::endl;
}

OnnxEngine::OnnxEngine(const std::vector<char>& model_bytes, const ModelConfig& config, const std::string& device)
    : config_(config)
    , label_("<memory>")
    , device_(device)
    , env_(ORT_LOGGING_LEVEL_WARNING, "maia")
    , memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault))
{
    validate(config_);
    if (model_bytes.empty())
    {
        throw ModelLoadError("ONNX model buffer is empty.");
    }
    try
    {
        const Ort::SessionOptions options = makeOptions(device_);
        session_ = std::make_unique<Ort::Session>(env_, model_bytes.data(), model_bytes.size(), options);
        describeIo();
    }
    catch (const Ort::Exception& e)
    {
        throw ModelLoadError(std::string("Failed to load ONNX model from memory: ") + e.what());
    }
}

OnnxEngine::TensorInfo OnnxEngine::findTensor(const std::string& tensor, bool input) const
{
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = input ? session_->GetInputCount() : session_->GetOutputCount();
    for (size_t i = 0; i < count; ++i)
    {
        const auto name = input ? session_->GetInputNameAllocated(i, allocator)
                                : session_->GetOutputNameAllocated(i, allocator);
        if (tensor != name.get())
        {
            continue;
        }
        const auto typeInfo = input ? session_->GetInputTypeInfo(i) : session_->GetOutputTypeInfo(i);
        const auto tensorInfo = typeInfo.GetTensorTypeAndShapeInfo();
        return {tensor, tensorInfo.GetShape(), tensorInfo.GetElementType()};
    }
    throw ModelLoadError(std::string("ONNX model ") + label_ + " has no " + (input ? "input" : "output") + " named '"
                         + tensor + "'");
}

void OnnxEngine::describeIo()
{
    boards_ = findTensor(config_.boards_tensor, true);
    eloSelf_ = findTensor(config_.elo_self_tensor, true);
    eloOppo_ = findTensor(config_.elo_oppo_tensor, true);
    policy_ = findTensor(config_.policy_tensor, false);
    value_ = findTensor(config_.value_tensor, false);

    checkTrailingDims(boards_.name, boards_.shape, {config_.board_planes, config_.board_size, config_.board_size});
    checkTrailingDims(eloSelf_.name, eloSelf_.shape, {});
    checkTrailingDims(eloOppo_.name, eloOppo_.shape, {});
    checkTrailingDims(policy_.name, policy_.shape, {config_.policy_size});
    if (value_.shape.size() == 2)
    {
        checkTrailingDims(value_.name, value_.shape, {1});
    }
    else
    {
        checkTrailingDims(value_.name, value_.shape, {});
    }

    for (const TensorInfo* info : {&boards_, &policy_, &value_})
    {
        if (info->type != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT)
        {
            throw ModelLoadError("ONNX tensor " + info->name + " must be float32.");
        }
    }
    for (const TensorInfo* info : {&eloSelf_, &eloOppo_})
    {
        if (info->type != ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64 && info->type != ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32)
        {
            throw ModelLoadError("ONNX tensor " + info->name + " must be int64 or int32.");
        }
    }

    maxBatch_ = boards_.shape.front() > 0 ? static_cast<std::size_t>(boards_.shape.front()) : 0;
}

EngineOutputs OnnxEngine::run(const Batch& batch)
{
    if (batch.size == 0)
    {
        throw InputError("ONNX engine received an empty batch.");
    }
    if (batch.sample_elements != config_.board_elements())
    {
        throw ShapeError("Batch samples have " + std::to_string(batch.sample_elements) + " board elements, model expects "
                         + std::to_string(config_.board_elements()));
    }
    if (maxBatch_ != 0 && batch.size > maxBatch_)
    {
        throw InputError("Batch of " + std::to_string(batch.size) + " exceeds the model's fixed batch of "
                         + std::to_string(maxBatch_));
    }

    const size_t rows = maxBatch_ == 0 ? batch.size : maxBatch_;
    const size_t policySize = static_cast<size_t>(config_.policy_size);

    auto boards = padRows(batch.boards, batch.size, rows);
    auto eloSelf = padRows(batch.elo_self, batch.size, rows);
    auto eloOppo = padRows(batch.elo_oppo, batch.size, rows);
    std::vector<int32_t> eloSelf32;
    std::vector<int32_t> eloOppo32;

    const std::vector<int64_t> boardShape{static_cast<int64_t>(rows), config_.board_planes, config_.board_size,
                                          config_.board_size};
    const std::vector<int64_t> eloShape{static_cast<int64_t>(rows)};

    const auto eloTensor = [&](const TensorInfo& info, std::vector<int64_t>& wide, std::vector<int32_t>& narrow) {
        if (info.type == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32)
        {
            narrow = narrowElos(wide);
            return Ort::Value::CreateTensor<int32_t>(memoryInfo_, narrow.data(), narrow.size(), eloShape.data(),
                                                     eloShape.size());
        }
        return Ort::Value::CreateTensor<int64_t>(memoryInfo_, wide.data(), wide.size(), eloShape.data(), eloShape.size());
    };

    EngineOutputs outputs;
    try
    {
        std::vector<Ort::Value> inputs;
        inputs.push_back(
            Ort::Value::CreateTensor<float>(memoryInfo_, boards.data(), boards.size(), boardShape.data(), boardShape.size()));
        inputs.push_back(eloTensor(eloSelf_, eloSelf, eloSelf32));
        inputs.push_back(eloTensor(eloOppo_, eloOppo, eloOppo32));

        const char* inputNames[] = {boards_.name.c_str(), eloSelf_.name.c_str(), eloOppo_.name.c_str()};
        const char* outputNames[] = {policy_.name.c_str(), value_.name.c_str()};

        auto results = session_->Run(Ort::RunOptions{nullptr}, inputNames, inputs.data(), inputs.size(), outputNames, 2);

        const auto policyCount = results[0].GetTensorTypeAndShapeInfo().GetElementCount();
        const auto valueCount = results[1].GetTensorTypeAndShapeInfo().GetElementCount();
        if (policyCount != rows * policySize)
        {
            throw ShapeError("Policy output has " + std::to_string(policyCount) + " elements, expected "
                             + std::to_string(rows) + " x " + std::to_string(policySize));
        }
        if (valueCount != rows)
        {
            throw ShapeError("Value output has " + std::to_string(valueCount) + " elements, expected "
                             + std::to_string(rows));
        }

        const float* policyData = results[0].GetTensorData<float>();
        const float* valueData = results[1].GetTensorData<float>();
        outputs.policy.assign(policyData, policyData + batch.size * policySize);
        outputs.value.assign(valueData, valueData + batch.size);
    }
    catch (const Ort::Exception& e)
    {
        throw EngineError(std::string("ONNX Runtime run failed: ") + e.what());
    }
    return outputs;
}

} // namespace maia

#include "torch_engine.hpp"

#include <iostream>
#include <sstream>

#include "maia/errors.hpp"

namespace maia
{

namespace
{

torch::Device parseDevice(const std::string& device)
{
    try
    {
        return torch::Device(device);
    }
    catch (const c10::Error& e)
    {
        throw ModelLoadError("Invalid torch device '" + device + "': " + e.what_without_backtrace());
    }
}

} // anonymous namespace

TorchScriptEngine::TorchScriptEngine(const std::string& module_path, const ModelConfig& config, const std::string& device)
    : config_(config)
    , label_(module_path)
    , device_(parseDevice(device))
{
    validate(config_);
    try
    {
        module_ = torch::jit::load(module_path, device_);
    }
    catch (const c10::Error& e)
    {
        throw ModelLoadError("Failed to load TorchScript module " + module_path + ": " + e.what_without_backtrace());
    }
    finishLoad();

    std::cout << "[TorchScript] Loaded: " << module_path << " (" << device_.str() << ")" << std::endl;
}

TorchScriptEngine::TorchScriptEngine(const std::vector<char>& module_bytes, const ModelConfig& config,
                                     const std::string& device)
    : config_(config)
    , label_("<memory>")
    , device_(parseDevice(device))
{
    validate(config_);
    if (module_bytes.empty())
    {
        throw ModelLoadError("TorchScript module buffer is empty.");
    }
    try
    {
        std::istringstream stream(std::string(module_bytes.begin(), module_bytes.end()));
        module_ = torch::jit::load(stream, device_);
    }
    catch (const c10::Error& e)
    {
        throw ModelLoadError(std::string("Failed to load TorchScript module from memory: ") + e.what_without_backtrace());
    }
    finishLoad();
}

void TorchScriptEngine::finishLoad()
{
    module_.eval();
    if (!module_.find_method("forward"))
    {
        throw ModelLoadError("TorchScript module " + label_ + " has no forward method.");
    }
}

EngineOutputs TorchScriptEngine::run(const Batch& batch)
{
    if (batch.size == 0)
    {
        throw InputError("TorchScript engine received an empty batch.");
    }
    if (batch.sample_elements != config_.board_elements())
    {
        throw ShapeError("Batch samples have " + std::to_string(batch.sample_elements) + " board elements, model expects "
                         + std::to_string(config_.board_elements()));
    }

    const auto n = static_cast<int64_t>(batch.size);
    const size_t policySize = static_cast<size_t>(config_.policy_size);

    torch::NoGradGuard no_grad;

    torch::Tensor policy;
    torch::Tensor value;
    try
    {
        auto opts_fp32 = torch::TensorOptions().dtype(torch::kFloat32);
        auto opts_int = torch::TensorOptions().dtype(torch::kInt64);

        // from_blob does not own the host data; clone before it leaves this scope.
        auto boards = torch::from_blob(const_cast<float*>(batch.boards.data()),
                                       {n, config_.board_planes, config_.board_size, config_.board_size}, opts_fp32)
                          .to(device_, /*non_blocking=*/false, /*copy=*/true);
        auto eloSelf = torch::from_blob(const_cast<int64_t*>(batch.elo_self.data()), {n}, opts_int)
                           .to(device_, false, true);
        auto eloOppo = torch::from_blob(const_cast<int64_t*>(batch.elo_oppo.data()), {n}, opts_int)
                           .to(device_, false, true);

        std::vector<torch::jit::IValue> inputs = {boards, eloSelf, eloOppo};
        auto output = module_.forward(inputs);
        if (!output.isTuple())
        {
            throw ShapeError("TorchScript forward must return a (policy, ..., value) tuple.");
        }
        auto elements = output.toTuple()->elements();
        if (elements.size() < 2)
        {
            throw ShapeError("TorchScript forward returned " + std::to_string(elements.size()) + " outputs, expected at least 2.");
        }

        policy = elements.front().toTensor().to(torch::kCPU).to(torch::kFloat32).contiguous();
        value = elements.back().toTensor().to(torch::kCPU).to(torch::kFloat32).contiguous().view({-1});
    }
    catch (const c10::Error& e)
    {
        throw EngineError(std::string("TorchScript forward failed: ") + e.what_without_backtrace());
    }

    if (static_cast<size_t>(policy.numel()) != batch.size * policySize)
    {
        throw ShapeError("Policy output has " + std::to_string(policy.numel()) + " elements, expected "
                         + std::to_string(batch.size) + " x " + std::to_string(policySize));
    }
    if (static_cast<size_t>(value.numel()) != batch.size)
    {
        throw ShapeError("Value output has " + std::to_string(value.numel()) + " elements, expected "
                         + std::to_string(batch.size));
    }

    EngineOutputs outputs;
    const float* policyData = policy.data_ptr<float>();
    const float* valueData = value.data_ptr<float>();
    outputs.policy.assign(policyData, policyData + policy.numel());
    outputs.value.assign(valueData, valueData + value.numel());
    return outputs;
}

} // namespace maia

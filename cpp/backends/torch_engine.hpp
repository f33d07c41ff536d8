#pragma once

#include <torch/script.h>

#include <string>
#include <vector>

#include "maia/engine.hpp"
#include "maia/model_config.hpp"

namespace maia
{

/// TorchScript export of a Maia2 model.
///
/// forward(boards, elo_self, elo_oppo) must return a tuple whose first element
/// is the policy logits [N, policy_size] and whose last element is the value [N].
class TorchScriptEngine : public InferenceEngine
{
public:
    TorchScriptEngine(const std::string& module_path, const ModelConfig& config, const std::string& device = "cpu");
    TorchScriptEngine(const std::vector<char>& module_bytes, const ModelConfig& config,
                      const std::string& device = "cpu");

    EngineOutputs run(const Batch& batch) override;
    std::string name() const override { return "TorchScript[" + label_ + "]"; }

private:
    void finishLoad();

    ModelConfig config_;
    std::string label_;
    torch::Device device_;
    torch::jit::Module module_;
};

} // namespace maia

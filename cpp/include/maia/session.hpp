#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "maia/engine.hpp"
#include "maia/evaluation.hpp"
#include "maia/model_config.hpp"
#include "maia/move_index.hpp"
#include "maia/position.hpp"

namespace maia
{

/// Evaluates positions against one loaded engine.
///
/// Each call runs encode -> engine -> decode synchronously. Batches above the
/// effective maximum batch size are split into consecutive engine calls and
/// results come back in input order. Calls from several threads are safe;
/// engine calls are serialized unless the engine supports concurrent runs.
class Session
{
public:
    /// `moves` defaults to config.vocab_path when set, otherwise the built-in table.
    explicit Session(std::unique_ptr<InferenceEngine> engine, ModelConfig config = {},
                     std::shared_ptr<const MoveIndex> moves = nullptr);

    EvaluationResult evaluate(std::string_view fen, int elo_self, int elo_oppo);
    EvaluationResult evaluate(const Position& position, int elo_self, int elo_oppo);

    std::vector<EvaluationResult> batch_evaluate(
        const std::vector<std::string>& fens, const std::vector<int>& elo_selfs, const std::vector<int>& elo_oppos);
    std::vector<EvaluationResult> batch_evaluate(
        const std::vector<Position>& positions, const std::vector<int>& elo_selfs, const std::vector<int>& elo_oppos);

    TimedEvaluation batch_evaluate_timed(
        const std::vector<std::string>& fens, const std::vector<int>& elo_selfs, const std::vector<int>& elo_oppos);

    /// Samples per engine call; 0 means the whole batch goes in one call.
    std::size_t effective_max_batch_size() const;

    const ModelConfig& config() const noexcept { return config_; }
    const MoveIndex& move_index() const noexcept { return *moves_; }
    const InferenceEngine& engine() const noexcept { return *engine_; }

private:
    TimedEvaluation run(const std::vector<Position>& positions, const std::vector<int>& elo_selfs,
                        const std::vector<int>& elo_oppos, const char* call);
    EngineOutputs run_engine(const Batch& batch, std::size_t first, const char* call);

    std::unique_ptr<InferenceEngine> engine_;
    ModelConfig config_;
    std::shared_ptr<const MoveIndex> moves_;
    std::mutex engine_mutex_;
};

} // namespace maia

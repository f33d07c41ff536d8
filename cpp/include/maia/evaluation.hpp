#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maia
{

struct MoveProbability
{
    std::string uci;
    float probability{0.0F};
    int index{-1};
};

/// Policy over the legal moves (descending) and the side to move's win probability.
struct EvaluationResult
{
    std::vector<MoveProbability> policy;
    float value{0.0F};

    std::optional<std::string> best_move() const
    {
        if (policy.empty())
        {
            return std::nullopt;
        }
        return policy.front().uci;
    }

    /// 0 for moves that are not legal in the evaluated position.
    float probability_of(std::string_view uci) const
    {
        for (const auto& entry : policy)
        {
            if (entry.uci == uci)
            {
                return entry.probability;
            }
        }
        return 0.0F;
    }
};

struct InferenceTimings
{
    double encodeMs{0.0};
    double inferMs{0.0};
    double decodeMs{0.0};
    double totalMs{0.0};
};

struct TimedEvaluation
{
    std::vector<EvaluationResult> results;
    InferenceTimings timings;
};

} // namespace maia

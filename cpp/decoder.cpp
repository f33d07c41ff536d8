#include "maia/decoder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "maia/encoder.hpp"
#include "maia/errors.hpp"

namespace maia
{
namespace
{

struct Candidate
{
    std::string uci;
    int index{-1};
    double weight{0.0};
    float probability{0.0F};
};

// Softmax over the retained logits. Returns false when the mass is unusable.
bool softmax(std::vector<Candidate>& candidates, const std::vector<float>& row)
{
    double maxVal = -std::numeric_limits<double>::infinity();
    for (auto& candidate : candidates)
    {
        const float logit = row[static_cast<std::size_t>(candidate.index)];
        candidate.weight = std::isnan(logit) ? -std::numeric_limits<double>::infinity() : logit;
        maxVal = std::max(maxVal, candidate.weight);
    }
    if (!std::isfinite(maxVal))
    {
        return false;
    }

    double sum = 0.0;
    for (auto& candidate : candidates)
    {
        candidate.weight = std::exp(candidate.weight - maxVal);
        sum += candidate.weight;
    }
    if (!(sum > 0.0) || !std::isfinite(sum))
    {
        return false;
    }
    for (auto& candidate : candidates)
    {
        candidate.weight /= sum;
    }
    return true;
}

bool renormalize(std::vector<Candidate>& candidates, const std::vector<float>& row)
{
    double sum = 0.0;
    for (auto& candidate : candidates)
    {
        const float p = row[static_cast<std::size_t>(candidate.index)];
        candidate.weight = (std::isnan(p) || p < 0.0F) ? 0.0 : p;
        sum += candidate.weight;
    }
    if (!(sum > 0.0) || !std::isfinite(sum))
    {
        return false;
    }
    for (auto& candidate : candidates)
    {
        candidate.weight /= sum;
    }
    return true;
}

} // namespace

float value_to_win_probability(float raw, ValueTransform transform)
{
    if (std::isnan(raw))
    {
        return 0.5F;
    }
    switch (transform)
    {
    case ValueTransform::Maia2:
        return std::clamp(raw / 2.0F + 0.5F, 0.0F, 1.0F);
    case ValueTransform::Sigmoid:
        return static_cast<float>(1.0 / (1.0 + std::exp(-static_cast<double>(raw))));
    case ValueTransform::Identity:
        return std::clamp(raw, 0.0F, 1.0F);
    }
    return std::clamp(raw, 0.0F, 1.0F);
}

EvaluationResult decode(const RawOutputs& raw, const Position& position, const MoveIndex& moves, const DecodeOptions& options)
{
    if (raw.policy.size() != moves.size())
    {
        throw ShapeError("Policy row has " + std::to_string(raw.policy.size()) + " entries, move table has "
                         + std::to_string(moves.size()));
    }

    const OrientedPosition oriented = orient(position);

    std::vector<Candidate> candidates;
    for (auto& uci : legal_moves(oriented.position))
    {
        const int index = moves.require(uci);
        candidates.push_back({std::move(uci), index, 0.0});
    }

    const bool normalized = options.policy_format == PolicyFormat::Logits ? softmax(candidates, raw.policy)
                                                                          : renormalize(candidates, raw.policy);
    if (!normalized)
    {
        const double uniform = candidates.empty() ? 0.0 : 1.0 / static_cast<double>(candidates.size());
        for (auto& candidate : candidates)
        {
            candidate.weight = uniform;
        }
    }

    // Order on the reported float so equal reported probabilities fall back to index order.
    for (auto& candidate : candidates)
    {
        candidate.probability = static_cast<float>(candidate.weight);
    }
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.probability != b.probability)
        {
            return a.probability > b.probability;
        }
        return a.index < b.index;
    });

    EvaluationResult result;
    result.policy.reserve(candidates.size());
    for (auto& candidate : candidates)
    {
        result.policy.push_back({oriented.mirrored ? mirror_uci(candidate.uci) : std::move(candidate.uci),
                                 candidate.probability, candidate.index});
    }
    result.value = value_to_win_probability(raw.value, options.value_transform);
    return result;
}

} // namespace maia

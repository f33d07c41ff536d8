#pragma once

#include "maia/batch.hpp"
#include "maia/evaluation.hpp"
#include "maia/move_index.hpp"
#include "maia/position.hpp"

namespace maia
{

/// How the policy head's raw row is interpreted.
enum class PolicyFormat
{
    Logits,
    Probabilities,
};

/// How the value head's raw scalar maps to a win probability.
enum class ValueTransform
{
    Maia2,    // clamp(raw / 2 + 0.5, 0, 1)
    Sigmoid,
    Identity, // clamp(raw, 0, 1)
};

struct DecodeOptions
{
    PolicyFormat policy_format{PolicyFormat::Logits};
    ValueTransform value_transform{ValueTransform::Maia2};
};

float value_to_win_probability(float raw, ValueTransform transform);

/// Mask the raw policy to the legal moves of `position`, normalize, sort and
/// report moves in the caller's frame. Throws ShapeError when the row length
/// differs from the move table and InternalConsistencyError when a legal
/// move has no index.
EvaluationResult decode(
    const RawOutputs& raw, const Position& position, const MoveIndex& moves, const DecodeOptions& options = {});

} // namespace maia

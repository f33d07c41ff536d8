#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "maia/encoder.hpp"

namespace maia
{

/// N encoded samples laid out row-major along the leading dimension.
struct Batch
{
    std::size_t size{0};
    std::size_t sample_elements{0};
    std::vector<float> boards;
    std::vector<std::int64_t> elo_self;
    std::vector<std::int64_t> elo_oppo;
};

/// What an engine returns for a batch: [N, policy_size] and [N].
struct EngineOutputs
{
    std::vector<float> policy;
    std::vector<float> value;
};

/// One sample's slice of the engine outputs.
struct RawOutputs
{
    std::vector<float> policy;
    float value{0.0F};
};

/// Throws InputError on an empty input and ShapeError when board sizes differ.
Batch pack(const std::vector<EncodedSample>& samples);

/// Split engine outputs into per-sample rows, in input order.
std::vector<RawOutputs> unpack(const EngineOutputs& outputs, std::size_t count, std::size_t policy_size);

} // namespace maia

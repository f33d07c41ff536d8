#include "maia/batch.hpp"

#include <string>

#include "maia/errors.hpp"

namespace maia
{

Batch pack(const std::vector<EncodedSample>& samples)
{
    if (samples.empty())
    {
        throw InputError("Cannot pack an empty batch.");
    }

    Batch batch;
    batch.size = samples.size();
    batch.sample_elements = samples.front().board.size();
    batch.boards.reserve(batch.size * batch.sample_elements);
    batch.elo_self.reserve(batch.size);
    batch.elo_oppo.reserve(batch.size);

    for (std::size_t i = 0; i < samples.size(); ++i)
    {
        const auto& sample = samples[i];
        if (sample.board.size() != batch.sample_elements)
        {
            throw ShapeError("Sample " + std::to_string(i) + " has " + std::to_string(sample.board.size())
                             + " board elements, expected " + std::to_string(batch.sample_elements));
        }
        batch.boards.insert(batch.boards.end(), sample.board.begin(), sample.board.end());
        batch.elo_self.push_back(sample.elo_self);
        batch.elo_oppo.push_back(sample.elo_oppo);
    }

    return batch;
}

std::vector<RawOutputs> unpack(const EngineOutputs& outputs, std::size_t count, std::size_t policy_size)
{
    if (count == 0)
    {
        throw InputError("Cannot unpack outputs for an empty batch.");
    }
    if (outputs.policy.size() != count * policy_size)
    {
        throw ShapeError("Policy output has " + std::to_string(outputs.policy.size()) + " elements, expected "
                         + std::to_string(count) + " x " + std::to_string(policy_size));
    }
    if (outputs.value.size() != count)
    {
        throw ShapeError("Value output has " + std::to_string(outputs.value.size()) + " elements, expected "
                         + std::to_string(count));
    }

    std::vector<RawOutputs> rows(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const auto begin = outputs.policy.begin() + static_cast<std::ptrdiff_t>(i * policy_size);
        rows[i].policy.assign(begin, begin + static_cast<std::ptrdiff_t>(policy_size));
        rows[i].value = outputs.value[i];
    }
    return rows;
}

} // namespace maia

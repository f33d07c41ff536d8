#pragma once

#include <cstddef>
#include <string>

#include "maia/batch.hpp"

namespace maia
{

/// A loaded policy/value network.
///
/// run() takes boards [N, planes, 8, 8] with elo_self/elo_oppo [N] and
/// returns policy [N, policy_size] and value [N]. Failures are thrown.
class InferenceEngine
{
public:
    virtual ~InferenceEngine() = default;

    virtual EngineOutputs run(const Batch& batch) = 0;

    virtual std::string name() const = 0;

    /// Largest batch one run() accepts; 0 means unbounded.
    virtual std::size_t max_batch_size() const { return 0; }

    /// Whether run() may be called from several threads at once.
    virtual bool supports_concurrent_runs() const { return false; }
};

} // namespace maia

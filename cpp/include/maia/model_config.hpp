#pragma once

#include <cstddef>
#include <string>

#include "maia/decoder.hpp"
#include "maia/elo.hpp"
#include "maia/encoder.hpp"
#include "maia/move_index.hpp"

namespace maia
{

/// The declared tensor contract of a Maia2 export.
struct ModelConfig
{
    std::string boards_tensor{"boards"};
    std::string elo_self_tensor{"elo_self"};
    std::string elo_oppo_tensor{"elo_oppo"};
    std::string policy_tensor{"logits_maia"};
    std::string value_tensor{"logits_value"};

    int board_planes{kBoardPlanes};
    int board_size{kBoardSize};
    int policy_size{kMaia2PolicySize};
    int elo_buckets{kEloBucketCount};

    PolicyFormat policy_format{PolicyFormat::Logits};
    ValueTransform value_transform{ValueTransform::Maia2};

    /// Exported move vocabulary; empty selects the built-in table.
    std::string vocab_path;

    /// Upper bound on samples per engine call; 0 leaves it to the engine.
    std::size_t max_batch_size{0};

    std::size_t board_elements() const
    {
        return static_cast<std::size_t>(board_planes) * board_size * board_size;
    }

    DecodeOptions decode_options() const { return {policy_format, value_transform}; }
};

/// Throws ConfigError when a value is out of range or unsupported by the encoder.
void validate(const ModelConfig& config);

/// Read a flat JSON object. Missing keys keep their defaults, unknown keys
/// are ignored. Throws ConfigError on unreadable or malformed files.
ModelConfig load_model_config(const std::string& path);

/// Same as load_model_config() for an in-memory document.
ModelConfig parse_model_config(const std::string& json);

PolicyFormat parse_policy_format(const std::string& text);
ValueTransform parse_value_transform(const std::string& text);

} // namespace maia

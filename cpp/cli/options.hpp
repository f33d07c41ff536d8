#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace maia::cli
{

struct EvalOptions
{
    std::string model_path;
    std::string backend{"tensorrt"};
    std::string device{"cuda"};
    std::string config_path;
    std::string vocab_path;
    std::vector<std::string> fens;
    int elo_self{1500};
    int elo_oppo{1500};
    int top{5};
    std::size_t max_batch{0};
    bool timings{false};
};

/// Flags are `--name value`; a flag with no value reads as "true".
/// Throws std::invalid_argument on unknown flags or bad values.
EvalOptions parse_cli(int argc, char** argv);

/// Split a ';'-separated FEN list, trimming blanks and dropping empty entries.
std::vector<std::string> parse_fen_list(const std::string& raw);

} // namespace maia::cli

#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "maia/position.hpp"

namespace maia::cli
{

namespace
{

bool starts_with_flag(const std::string& value)
{
    return value.rfind("--", 0) == 0;
}

bool parse_bool(const std::string& value, const std::string& name)
{
    const std::string lowered = [&]() {
        std::string tmp = value;
        std::transform(tmp.begin(), tmp.end(), tmp.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return tmp;
    }();

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
    {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off")
    {
        return false;
    }
    throw std::invalid_argument("Failed to parse boolean value for " + name + ": " + value);
}

int parse_int(const std::string& value, const std::string& name)
{
    try
    {
        size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used != value.size())
        {
            throw std::invalid_argument(value);
        }
        return parsed;
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument("Failed to parse integer value for " + name + ": " + value);
    }
}

std::string trim(const std::string& s)
{
    const size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    const size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

std::vector<std::string> parse_fen_list(const std::string& raw)
{
    std::vector<std::string> fens;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ';'))
    {
        item = trim(item);
        if (!item.empty())
        {
            fens.push_back(item);
        }
    }
    return fens;
}

EvalOptions parse_cli(int argc, char** argv)
{
    static const std::unordered_set<std::string> known{"model", "backend", "device", "config", "vocab", "fen",
                                                       "elo-self", "elo-oppo", "top", "max-batch", "timings"};

    std::unordered_map<std::string, std::string> flags;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (!starts_with_flag(arg))
        {
            throw std::invalid_argument("Unexpected positional argument: " + arg);
        }

        std::string key = arg.substr(2);
        if (key.empty())
        {
            throw std::invalid_argument("Empty flag encountered.");
        }
        if (known.count(key) == 0)
        {
            throw std::invalid_argument("Unknown flag: --" + key);
        }

        std::string value;
        if (i + 1 < argc && !starts_with_flag(argv[i + 1]))
        {
            value = argv[++i];
        }
        else
        {
            value = "true";
        }

        flags[key] = value;
    }

    auto lookup = [&](const std::string& name) -> std::optional<std::string> {
        auto it = flags.find(name);
        if (it != flags.end())
        {
            return it->second;
        }
        return std::nullopt;
    };

    EvalOptions options;

    if (auto model = lookup("model"))
    {
        options.model_path = *model;
    }
    else
    {
        throw std::invalid_argument("Missing required flag: --model");
    }

    if (auto backend = lookup("backend"))
    {
        options.backend = *backend;
    }
    if (auto device = lookup("device"))
    {
        options.device = *device;
    }
    if (auto config = lookup("config"))
    {
        options.config_path = *config;
    }
    if (auto vocab = lookup("vocab"))
    {
        options.vocab_path = *vocab;
    }
    if (auto fen = lookup("fen"))
    {
        options.fens = parse_fen_list(*fen);
    }
    if (auto elo = lookup("elo-self"))
    {
        options.elo_self = parse_int(*elo, "--elo-self");
    }
    if (auto elo = lookup("elo-oppo"))
    {
        options.elo_oppo = parse_int(*elo, "--elo-oppo");
    }
    if (auto top = lookup("top"))
    {
        options.top = parse_int(*top, "--top");
    }
    if (auto maxBatch = lookup("max-batch"))
    {
        const int value = parse_int(*maxBatch, "--max-batch");
        if (value < 0)
        {
            throw std::invalid_argument("--max-batch must be non-negative");
        }
        options.max_batch = static_cast<std::size_t>(value);
    }
    if (auto timings = lookup("timings"))
    {
        options.timings = parse_bool(*timings, "--timings");
    }

    if (options.fens.empty())
    {
        options.fens.emplace_back(kStartFen);
    }
    if (options.backend != "tensorrt" && options.backend != "trt" && options.backend != "torchscript"
        && options.backend != "torch" && options.backend != "onnx")
    {
        throw std::invalid_argument("--backend must be tensorrt, torchscript or onnx, got: " + options.backend);
    }
    if (options.top <= 0)
    {
        throw std::invalid_argument("--top must be positive");
    }

    return options;
}

} // namespace maia::cli

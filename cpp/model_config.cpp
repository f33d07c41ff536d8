#include "maia/model_config.hpp"

#include <cctype>
#include <fstream>
#include <iterator>

#include "maia/errors.hpp"

namespace maia
{

namespace
{

// Minimal reader for a flat JSON object of string and integer values.

char peek(const std::string& json, size_t pos)
{
    if (pos >= json.size())
        throw ConfigError("Unexpected end of model config JSON");
    return json[pos];
}

void skipWhitespace(const std::string& json, size_t& pos)
{
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
}

// Parse a JSON string (assumes cursor is at opening quote)
std::string parseJsonString(const std::string& json, size_t& pos)
{
    if (peek(json, pos) != '"')
        throw ConfigError("Expected '\"' at position " + std::to_string(pos));
    pos++;
    std::string result;
    while (peek(json, pos) != '"')
    {
        if (json[pos] == '\\')
        {
            pos++;
            result += peek(json, pos);
        }
        else
        {
            result += json[pos];
        }
        pos++;
    }
    pos++;
    return result;
}

long long parseJsonInt(const std::string& json, size_t& pos)
{
    size_t start = pos;
    if (peek(json, pos) == '-') pos++;
    while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) pos++;
    if (pos == start || (pos == start + 1 && json[start] == '-'))
        throw ConfigError("Expected integer at position " + std::to_string(start));
    if (pos < json.size() && (json[pos] == '.' || json[pos] == 'e' || json[pos] == 'E'))
        throw ConfigError("Expected integer at position " + std::to_string(start));
    try
    {
        return std::stoll(json.substr(start, pos - start));
    }
    catch (const std::exception&)
    {
        throw ConfigError("Integer out of range at position " + std::to_string(start));
    }
}

void skipJsonValue(const std::string& json, size_t& pos)
{
    skipWhitespace(json, pos);
    const char c = peek(json, pos);
    if (c == '"')
    {
        parseJsonString(json, pos);
    }
    else if (c == '[' || c == '{')
    {
        int depth = 1;
        pos++;
        while (depth > 0)
        {
            const char d = peek(json, pos);
            if (d == '[' || d == '{') depth++;
            else if (d == ']' || d == '}') depth--;
            else if (d == '"') { parseJsonString(json, pos); continue; }
            pos++;
        }
    }
    else
    {
        // number, bool, null
        const size_t start = pos;
        while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && !std::isspace(static_cast<unsigned char>(json[pos])))
            pos++;
        if (pos == start)
            throw ConfigError("Expected value at position " + std::to_string(start));
    }
}

int toPositiveInt(long long value, const std::string& key)
{
    if (value <= 0 || value > 1'000'000'000)
        throw ConfigError("Model config '" + key + "' must be a positive integer, got " + std::to_string(value));
    return static_cast<int>(value);
}

} // anonymous namespace

PolicyFormat parse_policy_format(const std::string& text)
{
    if (text == "logits") return PolicyFormat::Logits;
    if (text == "probabilities") return PolicyFormat::Probabilities;
    throw ConfigError("Unknown policy format: " + text);
}

ValueTransform parse_value_transform(const std::string& text)
{
    if (text == "maia2") return ValueTransform::Maia2;
    if (text == "sigmoid") return ValueTransform::Sigmoid;
    if (text == "identity") return ValueTransform::Identity;
    throw ConfigError("Unknown value transform: " + text);
}

void validate(const ModelConfig& config)
{
    if (config.board_planes != kBoardPlanes || config.board_size != kBoardSize)
    {
        throw ConfigError("Model expects boards of " + std::to_string(config.board_planes) + "x"
                          + std::to_string(config.board_size) + "x" + std::to_string(config.board_size)
                          + ", the encoder produces " + std::to_string(kBoardPlanes) + "x" + std::to_string(kBoardSize)
                          + "x" + std::to_string(kBoardSize));
    }
    if (config.policy_size <= 0)
    {
        throw ConfigError("Model config policy_size must be positive.");
    }
    if (config.elo_buckets != kEloBucketCount)
    {
        throw ConfigError("Model expects " + std::to_string(config.elo_buckets) + " Elo buckets, the bucketer produces "
                          + std::to_string(kEloBucketCount));
    }
    const std::string* names[] = {&config.boards_tensor, &config.elo_self_tensor, &config.elo_oppo_tensor,
                                  &config.policy_tensor, &config.value_tensor};
    for (const auto* name : names)
    {
        if (name->empty())
        {
            throw ConfigError("Model config tensor names must not be empty.");
        }
    }
}

ModelConfig parse_model_config(const std::string& json)
{
    ModelConfig config;

    size_t pos = 0;
    skipWhitespace(json, pos);
    if (peek(json, pos) != '{')
        throw ConfigError("Model config must be a JSON object");
    pos++;

    skipWhitespace(json, pos);
    while (peek(json, pos) != '}')
    {
        std::string key = parseJsonString(json, pos);
        skipWhitespace(json, pos);
        if (peek(json, pos) != ':')
            throw ConfigError("Expected ':' at position " + std::to_string(pos));
        pos++;
        skipWhitespace(json, pos);

        if (key == "boards_tensor") config.boards_tensor = parseJsonString(json, pos);
        else if (key == "elo_self_tensor") config.elo_self_tensor = parseJsonString(json, pos);
        else if (key == "elo_oppo_tensor") config.elo_oppo_tensor = parseJsonString(json, pos);
        else if (key == "policy_tensor") config.policy_tensor = parseJsonString(json, pos);
        else if (key == "value_tensor") config.value_tensor = parseJsonString(json, pos);
        else if (key == "board_planes") config.board_planes = toPositiveInt(parseJsonInt(json, pos), key);
        else if (key == "board_size") config.board_size = toPositiveInt(parseJsonInt(json, pos), key);
        else if (key == "policy_size") config.policy_size = toPositiveInt(parseJsonInt(json, pos), key);
        else if (key == "elo_buckets") config.elo_buckets = toPositiveInt(parseJsonInt(json, pos), key);
        else if (key == "policy_format") config.policy_format = parse_policy_format(parseJsonString(json, pos));
        else if (key == "value_transform") config.value_transform = parse_value_transform(parseJsonString(json, pos));
        else if (key == "vocab") config.vocab_path = parseJsonString(json, pos);
        else if (key == "max_batch_size")
        {
            const long long value = parseJsonInt(json, pos);
            if (value < 0)
                throw ConfigError("Model config 'max_batch_size' must not be negative");
            config.max_batch_size = static_cast<std::size_t>(value);
        }
        else skipJsonValue(json, pos);

        skipWhitespace(json, pos);
        if (peek(json, pos) == ',')
        {
            pos++;
            skipWhitespace(json, pos);
        }
        else if (json[pos] != '}')
        {
            throw ConfigError("Expected ',' or '}' at position " + std::to_string(pos));
        }
    }

    validate(config);
    return config;
}

ModelConfig load_model_config(const std::string& path)
{
    std::ifstream f(path);
    if (!f) throw ConfigError("Failed to open model config: " + path);
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    try
    {
        return parse_model_config(json);
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace maia

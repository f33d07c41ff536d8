#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

#include "maia/errors.hpp"
#include "maia/model_config.hpp"

TEST_CASE("empty object keeps the Maia2 defaults")
{
    const auto config = maia::parse_model_config("{ }");
    CHECK(config.boards_tensor == "boards");
    CHECK(config.elo_self_tensor == "elo_self");
    CHECK(config.elo_oppo_tensor == "elo_oppo");
    CHECK(config.policy_tensor == "logits_maia");
    CHECK(config.value_tensor == "logits_value");
    CHECK(config.policy_size == maia::kMaia2PolicySize);
    CHECK(config.board_elements() == maia::kBoardElements);
    CHECK(config.policy_format == maia::PolicyFormat::Logits);
    CHECK(config.value_transform == maia::ValueTransform::Maia2);
    CHECK(config.max_batch_size == 0);
    CHECK(config.vocab_path.empty());
}

TEST_CASE("config values override defaults and unknown keys are skipped")
{
    const auto config = maia::parse_model_config(R"({
        "boards_tensor": "input_boards",
        "policy_tensor": "policy",
        "exported_by": {"tool": "torch.onnx", "opset": [17, 18]},
        "notes": "value head is \"tanh\"",
        "policy_format": "probabilities",
        "value_transform": "sigmoid",
        "max_batch_size": 256,
        "vocab": "maia2_moves.txt",
        "fp16": true
    })");

    CHECK(config.boards_tensor == "input_boards");
    CHECK(config.policy_tensor == "policy");
    CHECK(config.value_tensor == "logits_value");
    CHECK(config.policy_format == maia::PolicyFormat::Probabilities);
    CHECK(config.value_transform == maia::ValueTransform::Sigmoid);
    CHECK(config.max_batch_size == 256);
    CHECK(config.vocab_path == "maia2_moves.txt");
    CHECK(config.decode_options().policy_format == maia::PolicyFormat::Probabilities);
}

TEST_CASE("malformed or unsupported configs are rejected")
{
    const char* bad[] = {
        "",
        "[]",
        R"({"board_planes": "eighteen"})",
        R"({"board_planes": 18.5})",
        R"({"board_planes": 12})",
        R"({"elo_buckets": 9})",
        R"({"policy_size": 0})",
        R"({"max_batch_size": -4})",
        R"({"value_transform": "tanh"})",
        R"({"policy_format": "scores"})",
        R"({"boards_tensor": ""})",
        R"({"boards_tensor": "boards")",
        R"({"boards_tensor" "boards"})",
        R"({"boards_tensor": "boards" "policy_tensor": "p"})",
    };
    for (const char* json : bad)
    {
        CAPTURE(json);
        CHECK_THROWS_AS(maia::parse_model_config(json), maia::ConfigError);
    }
}

TEST_CASE("config files load from disk")
{
    const auto path = std::filesystem::temp_directory_path() / "maia_model_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"value_transform": "identity", "max_batch_size": 64})";
    }
    const auto config = maia::load_model_config(path.string());
    std::filesystem::remove(path);

    CHECK(config.value_transform == maia::ValueTransform::Identity);
    CHECK(config.max_batch_size == 64);

    CHECK_THROWS_AS(maia::load_model_config("/nonexistent/maia_config.json"), maia::ConfigError);
}

#include <doctest/doctest.h>

#include <stdexcept>

#include "backends/engine_factory.hpp"
#include "maia/errors.hpp"

TEST_CASE("backend names")
{
    CHECK(maia::parse_backend("tensorrt") == maia::Backend::TensorRt);
    CHECK(maia::parse_backend("trt") == maia::Backend::TensorRt);
    CHECK(maia::parse_backend("torchscript") == maia::Backend::TorchScript);
    CHECK(maia::parse_backend("torch") == maia::Backend::TorchScript);
    CHECK(maia::parse_backend("onnx") == maia::Backend::Onnx);
    CHECK_THROWS_AS(maia::parse_backend("ONNX "), std::invalid_argument);
    CHECK_THROWS_AS(maia::parse_backend(""), std::invalid_argument);
}

TEST_CASE("engines need a model")
{
    maia::EngineOptions options;
    options.backend = maia::Backend::Onnx;
    options.device = "cpu";
    CHECK_THROWS_AS(maia::make_engine(options), maia::ModelLoadError);
}

TEST_CASE("missing ONNX models fail to load")
{
    maia::EngineOptions options;
    options.backend = maia::Backend::Onnx;
    options.device = "cpu";
    options.model_path = "/nonexistent/maia2_model.onnx";
    CHECK_THROWS_AS(maia::make_engine(options), maia::ModelLoadError);

    options.model_path.clear();
    options.model_bytes = {'n', 'o', 't', ' ', 'o', 'n', 'n', 'x'};
    CHECK_THROWS_AS(maia::make_engine(options), maia::ModelLoadError);
}

TEST_CASE("ONNX devices are cpu or cuda")
{
    maia::EngineOptions options;
    options.backend = maia::Backend::Onnx;
    options.model_path = "/nonexistent/maia2_model.onnx";
    options.device = "gpu";
    CHECK_THROWS_AS(maia::make_engine(options), maia::ModelLoadError);
}

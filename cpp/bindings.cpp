#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "backends/engine_factory.hpp"
#include "maia/elo.hpp"
#include "maia/errors.hpp"
#include "maia/move_index.hpp"
#include "maia/session.hpp"

namespace py = pybind11;

namespace
{

std::unique_ptr<maia::Session> open_python_session(const std::string& model_path,
                                                   const std::string& backend,
                                                   const std::string& device,
                                                   const std::string& config_path,
                                                   const std::string& vocab_path,
                                                   std::size_t max_batch_size)
{
    maia::EngineOptions options;
    options.backend = maia::parse_backend(backend);
    options.model_path = model_path;
    options.device = device;
    if (!config_path.empty())
    {
        options.config = maia::load_model_config(config_path);
    }
    if (!vocab_path.empty())
    {
        options.config.vocab_path = vocab_path;
    }
    if (max_batch_size > 0)
    {
        options.config.max_batch_size = max_batch_size;
    }
    return maia::open_session(options);
}

} // namespace

PYBIND11_MODULE(_maia_cpp, m)
{
    auto error = py::register_exception<maia::Error>(m, "MaiaError", PyExc_RuntimeError);
    auto inputError = py::register_exception<maia::InputError>(m, "InputError", error.ptr());
    py::register_exception<maia::LengthMismatch>(m, "LengthMismatch", inputError.ptr());
    py::register_exception<maia::ParseError>(m, "ParseError", inputError.ptr());
    py::register_exception<maia::ModelLoadError>(m, "ModelLoadError", error.ptr());
    py::register_exception<maia::ShapeError>(m, "ShapeError", error.ptr());
    py::register_exception<maia::EngineError>(m, "EngineError", error.ptr());
    py::register_exception<maia::InternalConsistencyError>(m, "InternalConsistencyError", error.ptr());
    py::register_exception<maia::ConfigError>(m, "ConfigError", error.ptr());

    py::class_<maia::InferenceTimings>(m, "InferenceTimings")
        .def_readonly("encode_ms", &maia::InferenceTimings::encodeMs)
        .def_readonly("inference_ms", &maia::InferenceTimings::inferMs)
        .def_readonly("decode_ms", &maia::InferenceTimings::decodeMs)
        .def_readonly("total_ms", &maia::InferenceTimings::totalMs);

    py::class_<maia::MoveProbability>(m, "MoveProbability")
        .def_readonly("uci", &maia::MoveProbability::uci)
        .def_readonly("probability", &maia::MoveProbability::probability)
        .def_readonly("index", &maia::MoveProbability::index);

    py::class_<maia::EvaluationResult>(m, "EvaluationResult")
        .def_readonly("policy", &maia::EvaluationResult::policy)
        .def_readonly("value", &maia::EvaluationResult::value)
        .def("best_move", &maia::EvaluationResult::best_move)
        .def("probability_of", [](const maia::EvaluationResult& self, const std::string& uci) {
            return self.probability_of(uci);
        });

    py::class_<maia::TimedEvaluation>(m, "TimedEvaluation")
        .def_readonly("results", &maia::TimedEvaluation::results)
        .def_readonly("timings", &maia::TimedEvaluation::timings);

    py::class_<maia::Session>(m, "Session")
        .def(py::init(&open_python_session),
             py::arg("model_path"),
             py::arg("backend") = std::string("tensorrt"),
             py::arg("device") = std::string("cuda"),
             py::arg("config_path") = std::string(),
             py::arg("vocab_path") = std::string(),
             py::arg("max_batch_size") = 0,
             "Load a Maia2 export and open an evaluation session.")
        .def(
            "evaluate",
            [](maia::Session& self, const std::string& fen, int elo_self, int elo_oppo) {
                return self.evaluate(fen, elo_self, elo_oppo);
            },
            py::arg("fen"),
            py::arg("elo_self"),
            py::arg("elo_oppo"),
            py::call_guard<py::gil_scoped_release>(),
            "Move probabilities and side-to-move win probability for one position.")
        .def(
            "batch_evaluate",
            [](maia::Session& self,
               const std::vector<std::string>& fens,
               const std::vector<int>& elo_selfs,
               const std::vector<int>& elo_oppos) { return self.batch_evaluate(fens, elo_selfs, elo_oppos); },
            py::arg("fens"),
            py::arg("elo_selfs"),
            py::arg("elo_oppos"),
            py::call_guard<py::gil_scoped_release>(),
            "Evaluate positions in order; results match per-position evaluate calls.")
        .def(
            "batch_evaluate_timed",
            [](maia::Session& self,
               const std::vector<std::string>& fens,
               const std::vector<int>& elo_selfs,
               const std::vector<int>& elo_oppos) { return self.batch_evaluate_timed(fens, elo_selfs, elo_oppos); },
            py::arg("fens"),
            py::arg("elo_selfs"),
            py::arg("elo_oppos"),
            py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("max_batch_size", &maia::Session::effective_max_batch_size)
        .def_property_readonly("engine_name", [](const maia::Session& self) { return self.engine().name(); });

    m.def(
        "bucket_for", [](int rating) { return maia::bucket_for(rating).index(); }, py::arg("rating"),
        "Elo bucket index fed to the network for a rating.");

    m.def("maia2_move_tokens", &maia::maia2_move_tokens, "Built-in policy layout, one UCI move per index.");
}

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "backends/engine_factory.hpp"
#include "cli/options.hpp"
#include "maia/model_config.hpp"

namespace
{

void print_result(const std::string& fen, const maia::EvaluationResult& result, int top)
{
    std::cout << fen << '\n';
    std::cout << "  win probability: " << std::fixed << std::setprecision(4) << result.value << '\n';

    if (result.policy.empty())
    {
        std::cout << "  no legal moves" << '\n';
        return;
    }

    const size_t shown = std::min(result.policy.size(), static_cast<size_t>(top));
    for (size_t i = 0; i < shown; ++i)
    {
        std::cout << "  " << std::left << std::setw(6) << result.policy[i].uci << ' ' << result.policy[i].probability
                  << '\n';
    }
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        const auto options = maia::cli::parse_cli(argc, argv);

        maia::EngineOptions engine;
        engine.backend = maia::parse_backend(options.backend);
        engine.model_path = options.model_path;
        engine.device = options.device;
        if (!options.config_path.empty())
        {
            engine.config = maia::load_model_config(options.config_path);
        }
        if (!options.vocab_path.empty())
        {
            engine.config.vocab_path = options.vocab_path;
        }
        if (options.max_batch > 0)
        {
            engine.config.max_batch_size = options.max_batch;
        }

        auto session = maia::open_session(engine);
        std::cout << "[maia] " << session->engine().name() << ", " << options.fens.size() << " position(s), elo "
                  << options.elo_self << " vs " << options.elo_oppo << std::endl;

        const std::vector<int> selfs(options.fens.size(), options.elo_self);
        const std::vector<int> oppos(options.fens.size(), options.elo_oppo);
        const auto evaluation = session->batch_evaluate_timed(options.fens, selfs, oppos);

        for (size_t i = 0; i < options.fens.size(); ++i)
        {
            print_result(options.fens[i], evaluation.results[i], options.top);
        }

        if (options.timings)
        {
            const auto& t = evaluation.timings;
            std::cout << "[maia] encode " << t.encodeMs << " ms, infer " << t.inferMs << " ms, decode " << t.decodeMs
                      << " ms, total " << t.totalMs << " ms" << std::endl;
        }

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

#include "maia/session.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "maia/batch.hpp"
#include "maia/decoder.hpp"
#include "maia/elo.hpp"
#include "maia/encoder.hpp"
#include "maia/errors.hpp"

namespace maia
{
namespace
{

using Clock = std::chrono::high_resolution_clock;

double elapsedMs(Clock::time_point start, Clock::time_point end)
{
    return std::chrono::duration<double, std::milli>(end - start).count();
}

void check_lengths(std::size_t positions, std::size_t selfs, std::size_t oppos)
{
    if (positions != selfs || positions != oppos)
    {
        throw LengthMismatch("Batch inputs differ in length: " + std::to_string(positions) + " positions, "
                             + std::to_string(selfs) + " self ratings, " + std::to_string(oppos) + " opponent ratings");
    }
    if (positions == 0)
    {
        throw InputError("Batch is empty.");
    }
}

std::vector<Position> parse_all(const std::vector<std::string>& fens)
{
    std::vector<Position> positions;
    positions.reserve(fens.size());
    for (std::size_t i = 0; i < fens.size(); ++i)
    {
        try
        {
            positions.push_back(parse_position(fens[i]));
        }
        catch (const ParseError& e)
        {
            throw ParseError("Position " + std::to_string(i) + ": " + e.what());
        }
    }
    return positions;
}

} // namespace

Session::Session(std::unique_ptr<InferenceEngine> engine, ModelConfig config, std::shared_ptr<const MoveIndex> moves)
    : engine_(std::move(engine))
    , config_(std::move(config))
    , moves_(std::move(moves))
{
    if (!engine_)
    {
        throw InputError("Session requires an inference engine.");
    }
    validate(config_);

    if (!moves_)
    {
        moves_ = config_.vocab_path.empty() ? MoveIndex::maia2() : MoveIndex::from_file(config_.vocab_path);
    }
    if (moves_->size() != static_cast<std::size_t>(config_.policy_size))
    {
        throw ModelLoadError("Move table has " + std::to_string(moves_->size()) + " entries but the model policy has "
                             + std::to_string(config_.policy_size));
    }
}

std::size_t Session::effective_max_batch_size() const
{
    const std::size_t engineLimit = engine_->max_batch_size();
    const std::size_t configLimit = config_.max_batch_size;
    if (engineLimit == 0)
    {
        return configLimit;
    }
    if (configLimit == 0)
    {
        return engineLimit;
    }
    return std::min(engineLimit, configLimit);
}

EvaluationResult Session::evaluate(std::string_view fen, int elo_self, int elo_oppo)
{
    return evaluate(parse_position(fen), elo_self, elo_oppo);
}

EvaluationResult Session::evaluate(const Position& position, int elo_self, int elo_oppo)
{
    auto timed = run({position}, {elo_self}, {elo_oppo}, "evaluate");
    return std::move(timed.results.front());
}

std::vector<EvaluationResult> Session::batch_evaluate(
    const std::vector<std::string>& fens, const std::vector<int>& elo_selfs, const std::vector<int>& elo_oppos)
{
    check_lengths(fens.size(), elo_selfs.size(), elo_oppos.size());
    return run(parse_all(fens), elo_selfs, elo_oppos, "batch_evaluate").results;
}

std::vector<EvaluationResult> Session::batch_evaluate(
    const std::vector<Position>& positions, const std::vector<int>& elo_selfs, const std::vector<int>& elo_oppos)
{
    return run(positions, elo_selfs, elo_oppos, "batch_evaluate").results;
}

TimedEvaluation Session::batch_evaluate_timed(
    const std::vector<std::string>& fens, const std::vector<int>& elo_selfs, const std::vector<int>& elo_oppos)
{
    const auto totalStart = Clock::now();
    check_lengths(fens.size(), elo_selfs.size(), elo_oppos.size());

    const auto parseStart = Clock::now();
    auto positions = parse_all(fens);
    const double parseMs = elapsedMs(parseStart, Clock::now());

    auto timed = run(positions, elo_selfs, elo_oppos, "batch_evaluate_timed");
    timed.timings.encodeMs += parseMs;
    timed.timings.totalMs = elapsedMs(totalStart, Clock::now());
    return timed;
}

EngineOutputs Session::run_engine(const Batch& batch, std::size_t first, const char* call)
{
    const std::string context = std::string(call) + " on " + engine_->name() + " (samples " + std::to_string(first)
        + ".." + std::to_string(first + batch.size - 1) + "): ";

    try
    {
        if (engine_->supports_concurrent_runs())
        {
            return engine_->run(batch);
        }
        std::lock_guard<std::mutex> lock(engine_mutex_);
        return engine_->run(batch);
    }
    catch (const EngineError& e)
    {
        throw EngineError(context + e.what());
    }
    catch (const ShapeError& e)
    {
        throw ShapeError(context + e.what());
    }
    catch (const LengthMismatch& e)
    {
        throw LengthMismatch(context + e.what());
    }
    catch (const ParseError& e)
    {
        throw ParseError(context + e.what());
    }
    catch (const InputError& e)
    {
        throw InputError(context + e.what());
    }
    catch (const ModelLoadError& e)
    {
        throw ModelLoadError(context + e.what());
    }
    catch (const InternalConsistencyError& e)
    {
        throw InternalConsistencyError(context + e.what());
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(context + e.what());
    }
    catch (const Error& e)
    {
        throw Error(context + e.what());
    }
    catch (const std::exception& e)
    {
        throw EngineError(context + e.what());
    }
}

TimedEvaluation Session::run(const std::vector<Position>& positions, const std::vector<int>& elo_selfs,
                             const std::vector<int>& elo_oppos, const char* call)
{
    const auto totalStart = Clock::now();
    check_lengths(positions.size(), elo_selfs.size(), elo_oppos.size());

    TimedEvaluation timed;
    timed.results.reserve(positions.size());

    const std::size_t policySize = static_cast<std::size_t>(config_.policy_size);
    const DecodeOptions options = config_.decode_options();
    const std::size_t limit = effective_max_batch_size();
    const std::size_t chunk = limit == 0 ? positions.size() : limit;

    for (std::size_t first = 0; first < positions.size(); first += chunk)
    {
        const std::size_t last = std::min(positions.size(), first + chunk);

        const auto encodeStart = Clock::now();
        std::vector<EncodedSample> samples;
        samples.reserve(last - first);
        for (std::size_t i = first; i < last; ++i)
        {
            samples.push_back(encode(positions[i], bucket_for(elo_selfs[i]), bucket_for(elo_oppos[i])));
        }
        const Batch batch = pack(samples);
        const auto encodeEnd = Clock::now();

        const EngineOutputs outputs = run_engine(batch, first, call);
        const auto inferEnd = Clock::now();

        const auto rows = unpack(outputs, batch.size, policySize);
        for (std::size_t i = 0; i < rows.size(); ++i)
        {
            timed.results.push_back(decode(rows[i], positions[first + i], *moves_, options));
        }
        const auto decodeEnd = Clock::now();

        timed.timings.encodeMs += elapsedMs(encodeStart, encodeEnd);
        timed.timings.inferMs += elapsedMs(encodeEnd, inferEnd);
        timed.timings.decodeMs += elapsedMs(inferEnd, decodeEnd);
    }

    timed.timings.totalMs = elapsedMs(totalStart, Clock::now());
    return timed;
}

} // namespace maia

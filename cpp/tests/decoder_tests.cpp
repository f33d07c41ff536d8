#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

#include "maia/decoder.hpp"
#include "maia/errors.hpp"

using maia::MoveIndex;
using maia::RawOutputs;

namespace
{

RawOutputs zero_row()
{
    RawOutputs raw;
    raw.policy.assign(maia::kMaia2PolicySize, 0.0F);
    return raw;
}

double total(const maia::EvaluationResult& result)
{
    double sum = 0.0;
    for (const auto& entry : result.policy)
    {
        sum += entry.probability;
    }
    return sum;
}

bool sorted_with_index_ties(const maia::EvaluationResult& result)
{
    for (std::size_t i = 1; i < result.policy.size(); ++i)
    {
        const auto& a = result.policy[i - 1];
        const auto& b = result.policy[i];
        if (a.probability < b.probability || (a.probability == b.probability && a.index > b.index))
        {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("flat logits give a uniform distribution over legal moves")
{
    const auto position = maia::parse_position(maia::kStartFen);
    const auto result = maia::decode(zero_row(), position, *MoveIndex::maia2());

    REQUIRE(result.policy.size() == 20);
    CHECK(total(result) == doctest::Approx(1.0).epsilon(1e-6));
    for (const auto& entry : result.policy)
    {
        CHECK(entry.probability == doctest::Approx(0.05));
    }
    CHECK(sorted_with_index_ties(result));

    const auto legal = maia::legal_moves(position);
    std::set<std::string> expected(legal.begin(), legal.end());
    std::set<std::string> reported;
    for (const auto& entry : result.policy)
    {
        reported.insert(entry.uci);
    }
    CHECK(reported == expected);
}

TEST_CASE("softmax is taken over legal moves only")
{
    const auto& table = *MoveIndex::maia2();
    auto raw = zero_row();
    raw.policy[static_cast<std::size_t>(*table.encode("e2e4"))] = 2.0F;
    raw.policy[static_cast<std::size_t>(*table.encode("d2d4"))] = 1.0F;
    raw.policy[static_cast<std::size_t>(*table.encode("e2e5"))] = 50.0F; // not legal

    const auto result = maia::decode(raw, maia::parse_position(maia::kStartFen), table);
    REQUIRE(result.policy.size() == 20);
    CHECK(result.best_move() == std::optional<std::string>("e2e4"));
    CHECK(result.policy[1].uci == "d2d4");

    const double denom = std::exp(2.0) + std::exp(1.0) + 18.0;
    CHECK(result.probability_of("e2e4") == doctest::Approx(std::exp(2.0) / denom));
    CHECK(result.probability_of("g1f3") == doctest::Approx(1.0 / denom));
    CHECK(result.probability_of("e2e5") == 0.0F);
    CHECK(total(result) == doctest::Approx(1.0).epsilon(1e-6));
    CHECK(sorted_with_index_ties(result));
}

TEST_CASE("unusable policy mass falls back to uniform")
{
    const auto position = maia::parse_position(maia::kStartFen);
    const auto& table = *MoveIndex::maia2();

    maia::DecodeOptions probabilities{maia::PolicyFormat::Probabilities, maia::ValueTransform::Maia2};
    const auto zeros = maia::decode(zero_row(), position, table, probabilities);
    REQUIRE(zeros.policy.size() == 20);
    for (const auto& entry : zeros.policy)
    {
        CHECK(entry.probability == doctest::Approx(0.05));
    }

    auto nans = zero_row();
    std::fill(nans.policy.begin(), nans.policy.end(), std::numeric_limits<float>::quiet_NaN());
    const auto fromNan = maia::decode(nans, position, table);
    CHECK(total(fromNan) == doctest::Approx(1.0));
    CHECK(fromNan.policy.front().probability == doctest::Approx(0.05));
}

TEST_CASE("probability rows drop negative and NaN entries")
{
    const auto& table = *MoveIndex::maia2();
    auto raw = zero_row();
    raw.policy[static_cast<std::size_t>(*table.encode("e2e4"))] = 0.6F;
    raw.policy[static_cast<std::size_t>(*table.encode("d2d4"))] = 0.2F;
    raw.policy[static_cast<std::size_t>(*table.encode("c2c4"))] = -0.5F;
    raw.policy[static_cast<std::size_t>(*table.encode("g1f3"))] = std::numeric_limits<float>::quiet_NaN();

    const auto result = maia::decode(raw, maia::parse_position(maia::kStartFen), table,
                                     {maia::PolicyFormat::Probabilities, maia::ValueTransform::Maia2});
    CHECK(result.probability_of("e2e4") == doctest::Approx(0.75));
    CHECK(result.probability_of("d2d4") == doctest::Approx(0.25));
    CHECK(result.probability_of("c2c4") == 0.0F);
    CHECK(result.probability_of("g1f3") == 0.0F);
    CHECK(total(result) == doctest::Approx(1.0));
}

TEST_CASE("a NaN logit gets no mass")
{
    const auto& table = *MoveIndex::maia2();
    auto raw = zero_row();
    raw.policy[static_cast<std::size_t>(*table.encode("a2a3"))] = std::numeric_limits<float>::quiet_NaN();

    const auto result = maia::decode(raw, maia::parse_position(maia::kStartFen), table);
    CHECK(result.probability_of("a2a3") == 0.0F);
    CHECK(result.policy.back().uci == "a2a3");
    CHECK(total(result) == doctest::Approx(1.0));
}

TEST_CASE("moves whose probabilities round to the same float keep index order")
{
    const auto& table = *MoveIndex::maia2();
    auto raw = zero_row();
    raw.policy[static_cast<std::size_t>(*table.encode("e2e4"))] = 1e-10F;

    const auto result = maia::decode(raw, maia::parse_position(maia::kStartFen), table);
    REQUIRE(result.policy.size() == 20);
    CHECK(sorted_with_index_ties(result));
    for (const auto& entry : result.policy)
    {
        CHECK(entry.probability == result.policy.front().probability);
    }
    CHECK(result.policy.front().index < result.policy.back().index);
}

TEST_CASE("a forced move gets all the mass")
{
    const auto result = maia::decode(zero_row(), maia::parse_position("k7/8/8/8/8/8/6q1/7K w - - 0 1"),
                                     *MoveIndex::maia2());
    REQUIRE(result.policy.size() == 1);
    CHECK(result.policy[0].uci == "h1g2");
    CHECK(result.policy[0].probability == doctest::Approx(1.0));
}

TEST_CASE("positions without legal moves decode to an empty policy")
{
    auto raw = zero_row();
    raw.value = 1.0F;
    const auto result = maia::decode(raw, maia::parse_position("k7/8/8/8/8/8/5q2/7K w - - 0 1"), *MoveIndex::maia2());
    CHECK(result.policy.empty());
    CHECK_FALSE(result.best_move().has_value());
    CHECK(result.value == doctest::Approx(1.0));
}

TEST_CASE("black moves are reported in the caller's frame")
{
    const auto& table = *MoveIndex::maia2();
    auto raw = zero_row();
    raw.policy[static_cast<std::size_t>(*table.encode("e2e4"))] = 3.0F;

    const auto position = maia::parse_position("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    const auto result = maia::decode(raw, position, table);

    REQUIRE(result.policy.size() == 20);
    CHECK(result.best_move() == std::optional<std::string>("e7e5"));
    CHECK(result.policy.front().index == *table.encode("e2e4"));

    const auto legal = maia::legal_moves(position);
    for (const auto& entry : result.policy)
    {
        CHECK(std::find(legal.begin(), legal.end(), entry.uci) != legal.end());
    }
}

TEST_CASE("value transforms")
{
    using maia::ValueTransform;
    CHECK(maia::value_to_win_probability(0.0F, ValueTransform::Maia2) == doctest::Approx(0.5));
    CHECK(maia::value_to_win_probability(1.0F, ValueTransform::Maia2) == doctest::Approx(1.0));
    CHECK(maia::value_to_win_probability(-0.4F, ValueTransform::Maia2) == doctest::Approx(0.3));
    CHECK(maia::value_to_win_probability(-3.0F, ValueTransform::Maia2) == doctest::Approx(0.0));
    CHECK(maia::value_to_win_probability(0.0F, ValueTransform::Sigmoid) == doctest::Approx(0.5));
    CHECK(maia::value_to_win_probability(2.0F, ValueTransform::Sigmoid) == doctest::Approx(1.0 / (1.0 + std::exp(-2.0))));
    CHECK(maia::value_to_win_probability(1.5F, ValueTransform::Identity) == doctest::Approx(1.0));
    CHECK(maia::value_to_win_probability(0.25F, ValueTransform::Identity) == doctest::Approx(0.25));

    for (const float raw : {-100.0F, -1.0F, 0.3F, 7.0F})
    {
        for (const auto transform : {ValueTransform::Maia2, ValueTransform::Sigmoid, ValueTransform::Identity})
        {
            const float value = maia::value_to_win_probability(raw, transform);
            CHECK(value >= 0.0F);
            CHECK(value <= 1.0F);
        }
    }
}

TEST_CASE("decode checks the row against the move table")
{
    const auto position = maia::parse_position(maia::kStartFen);

    RawOutputs shortRow;
    shortRow.policy.assign(10, 0.0F);
    CHECK_THROWS_AS(maia::decode(shortRow, position, *MoveIndex::maia2()), maia::ShapeError);

    const auto tiny = MoveIndex::from_tokens({"e2e4"});
    RawOutputs tinyRow;
    tinyRow.policy.assign(1, 0.0F);
    CHECK_THROWS_AS(maia::decode(tinyRow, position, *tiny), maia::InternalConsistencyError);
}

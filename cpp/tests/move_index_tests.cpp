#include <doctest/doctest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <set>

#include "maia/errors.hpp"
#include "maia/move_index.hpp"
#include "maia/position.hpp"

using maia::MoveDescriptor;
using maia::MoveIndex;
using maia::Promotion;

TEST_CASE("built-in table has the Maia2 layout")
{
    const auto& table = *MoveIndex::maia2();
    REQUIRE(table.size() == maia::kMaia2PolicySize);

    // a1: queen moves by descending destination, then knight moves.
    CHECK(table.uci(0) == "a1h8");
    CHECK(table.uci(1) == "a1a8");
    CHECK(table.uci(2) == "a1g7");

    // Promotions: per file, the push then the captures, each with q r b n.
    CHECK(table.uci(1792) == "a7a8q");
    CHECK(table.uci(1793) == "a7a8r");
    CHECK(table.uci(1795) == "a7a8n");
    CHECK(table.uci(1796) == "a7b8q");
    CHECK(table.uci(1800) == "b7b8q");
    CHECK(table.uci(1804) == "b7a8q");
    CHECK(table.uci(1808) == "b7c8q");
    CHECK(table.uci(1876) == "h7g8q");
    CHECK(table.uci(1879) == "h7g8n");
}

TEST_CASE("every token round-trips through encode and decode")
{
    const auto& table = *MoveIndex::maia2();
    std::set<std::string> seen;
    for (int i = 0; i < static_cast<int>(table.size()); ++i)
    {
        const MoveDescriptor move = table.decode(i);
        REQUIRE(table.encode(move) == i);
        CHECK(table.encode(table.uci(i)) == i);
        CHECK(maia::to_uci(move) == table.uci(i));
        seen.insert(table.uci(i));
    }
    CHECK(seen.size() == table.size());
}

TEST_CASE("white-to-move legal moves are all indexed")
{
    const auto& table = *MoveIndex::maia2();
    const char* fens[] = {
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1",
        "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1",
        "1n2k3/P1P5/8/8/8/8/8/4K3 w - - 0 1",
        "rnbqkbnr/ppp1pppp/8/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3",
    };
    for (const char* fen : fens)
    {
        for (const auto& uci : maia::legal_moves(maia::parse_position(fen)))
        {
            CAPTURE(uci);
            CHECK(table.encode(uci).has_value());
        }
    }
    CHECK(table.encode("e1g1").has_value());
    CHECK(table.encode("b7a8n").has_value());
}

TEST_CASE("moves outside the table are reported")
{
    const auto& table = *MoveIndex::maia2();
    CHECK_FALSE(table.encode("a2a1q").has_value());
    CHECK_FALSE(table.encode("e2e4q").has_value());
    CHECK_FALSE(table.encode("e2e2").has_value());
    CHECK_FALSE(table.encode("z9e4").has_value());

    CHECK_THROWS_AS(table.require("a2a1q"), maia::InternalConsistencyError);
    CHECK(table.require("e2e4") == *table.encode("e2e4"));
    CHECK_THROWS_AS(table.decode(-1), maia::InternalConsistencyError);
    CHECK_THROWS_AS(table.decode(static_cast<int>(table.size())), maia::InternalConsistencyError);
}

TEST_CASE("parse_uci reads promotions")
{
    const auto move = maia::parse_uci("b7a8n");
    REQUIRE(move.has_value());
    CHECK(move->from == 49);
    CHECK(move->to == 56);
    CHECK(move->promotion == Promotion::Knight);
    CHECK_FALSE(maia::parse_uci("b7a8k").has_value());
    CHECK_FALSE(maia::parse_uci("e2").has_value());
}

TEST_CASE("vocabularies are validated")
{
    CHECK_THROWS_AS(MoveIndex::from_tokens({}), maia::ModelLoadError);
    CHECK_THROWS_AS(MoveIndex::from_tokens({"e2e4", "e2e4"}), maia::ModelLoadError);
    CHECK_THROWS_AS(MoveIndex::from_tokens({"e2e4", "castle"}), maia::ModelLoadError);
    CHECK_THROWS_AS(MoveIndex::from_tokens({"e2e4", "", "d2d4"}), maia::ModelLoadError);

    const auto custom = MoveIndex::from_tokens({"d2d4", "e2e4"});
    CHECK(custom->size() == 2);
    CHECK(custom->encode("e2e4") == 1);
}

TEST_CASE("exported vocabulary file loads one token per line")
{
    const auto path = std::filesystem::temp_directory_path() / "maia_vocab_test.txt";
    {
        std::ofstream out(path);
        out << "e2e4\r\nd2d4\ng1f3\n\n";
    }
    const auto table = MoveIndex::from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(table->size() == 3);
    CHECK(table->uci(0) == "e2e4");
    CHECK(table->uci(1) == "d2d4");
    CHECK(table->encode("g1f3") == 2);

    CHECK_THROWS_AS(MoveIndex::from_file("/nonexistent/maia_vocab.txt"), maia::ModelLoadError);
}

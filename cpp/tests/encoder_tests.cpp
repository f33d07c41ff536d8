#include <doctest/doctest.h>

#include <numeric>

#include "maia/encoder.hpp"

using maia::plane_index;

namespace
{

float plane_sum(const maia::EncodedSample& sample, int plane)
{
    const auto begin = sample.board.begin() + static_cast<std::ptrdiff_t>(plane_index(plane, 0, 0));
    return std::accumulate(begin, begin + 64, 0.0F);
}

} // namespace

TEST_CASE("start position planes")
{
    const auto sample = maia::encode(maia::parse_position(maia::kStartFen), maia::bucket_for(1200), maia::bucket_for(1500));

    REQUIRE(sample.board.size() == maia::kBoardElements);
    CHECK_FALSE(sample.mirrored);
    CHECK(sample.elo_self == 2);
    CHECK(sample.elo_oppo == 5);

    for (int file = 0; file < 8; ++file)
    {
        CHECK(sample.board[plane_index(0, 1, file)] == 1.0F); // white pawns on rank 2
        CHECK(sample.board[plane_index(6, 6, file)] == 1.0F); // black pawns on rank 7
    }
    CHECK(sample.board[plane_index(1, 0, 1)] == 1.0F);  // white knight b1
    CHECK(sample.board[plane_index(4, 0, 3)] == 1.0F);  // white queen d1
    CHECK(sample.board[plane_index(5, 0, 4)] == 1.0F);  // white king e1
    CHECK(sample.board[plane_index(11, 7, 4)] == 1.0F); // black king e8

    float pieces = 0.0F;
    for (int plane = 0; plane < 12; ++plane)
    {
        pieces += plane_sum(sample, plane);
    }
    CHECK(pieces == 32.0F);

    CHECK(plane_sum(sample, maia::kSideToMovePlane) == 64.0F);
    for (int plane = maia::kCastlingPlane; plane < maia::kCastlingPlane + 4; ++plane)
    {
        CHECK(plane_sum(sample, plane) == 64.0F);
    }
    CHECK(plane_sum(sample, maia::kEnPassantPlane) == 0.0F);
}

TEST_CASE("black to move is encoded from the mirrored position")
{
    const auto position = maia::parse_position("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    const auto sample = maia::encode(position, maia::bucket_for(1500), maia::bucket_for(1500));

    CHECK(sample.mirrored);
    CHECK(plane_sum(sample, maia::kSideToMovePlane) == 64.0F);
    for (int file = 0; file < 8; ++file)
    {
        CHECK(sample.board[plane_index(0, 1, file)] == 1.0F); // black's pawns now white on rank 2
    }
    CHECK(sample.board[plane_index(6, 4, 4)] == 1.0F); // the e4 pawn is a black pawn on e5
    CHECK(sample.board[plane_index(maia::kEnPassantPlane, 5, 4)] == 1.0F);
    CHECK(plane_sum(sample, maia::kEnPassantPlane) == 1.0F);

    const auto flipped = maia::encode(maia::mirror(position), maia::bucket_for(1500), maia::bucket_for(1500));
    CHECK_FALSE(flipped.mirrored);
    CHECK(flipped.board == sample.board);
}

TEST_CASE("castling planes follow the rights")
{
    const auto sample = maia::encode(
        maia::parse_position("4k3/8/8/8/8/8/8/4K2R w K - 0 1"), maia::bucket_for(1000), maia::bucket_for(2000));
    CHECK(plane_sum(sample, maia::kCastlingPlane) == 64.0F);
    CHECK(plane_sum(sample, maia::kCastlingPlane + 1) == 0.0F);
    CHECK(plane_sum(sample, maia::kCastlingPlane + 2) == 0.0F);
    CHECK(plane_sum(sample, maia::kCastlingPlane + 3) == 0.0F);
    CHECK(sample.elo_self == 0);
    CHECK(sample.elo_oppo == 10);
}

TEST_CASE("encoding is deterministic")
{
    const auto position = maia::parse_position("r3k2r/8/8/8/8/8/8/R3K2R b KQkq - 3 20");
    const auto a = maia::encode(position, maia::bucket_for(1400), maia::bucket_for(1800));
    const auto b = maia::encode(position, maia::bucket_for(1400), maia::bucket_for(1800));
    CHECK(a.board == b.board);
    CHECK(a.elo_self == b.elo_self);
    CHECK(a.elo_oppo == b.elo_oppo);
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "maia/elo.hpp"
#include "maia/position.hpp"

namespace maia
{

constexpr int kBoardPlanes = 18;
constexpr int kBoardSize = 8;
constexpr std::size_t kBoardElements = static_cast<std::size_t>(kBoardPlanes) * kBoardSize * kBoardSize;

// Plane layout of the board tensor.
constexpr int kWhitePiecePlane = 0;
constexpr int kBlackPiecePlane = 6;
constexpr int kSideToMovePlane = 12;
constexpr int kCastlingPlane = 13;
constexpr int kEnPassantPlane = 17;

/// The position the network sees: always white to move.
struct OrientedPosition
{
    Position position;
    bool mirrored{false};
};

OrientedPosition orient(const Position& position);

struct EncodedSample
{
    std::vector<float> board;
    std::int64_t elo_self{0};
    std::int64_t elo_oppo{0};
    bool mirrored{false};
};

/// Index of (plane, rank, file) inside one sample's board tensor.
constexpr std::size_t plane_index(int plane, int rank, int file)
{
    return static_cast<std::size_t>(plane) * kBoardSize * kBoardSize + static_cast<std::size_t>(rank) * kBoardSize
        + static_cast<std::size_t>(file);
}

/// Deterministic: identical inputs produce bit-identical samples.
EncodedSample encode(const Position& position, EloBucket self, EloBucket oppo);

} // namespace maia

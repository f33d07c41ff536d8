#include "maia/encoder.hpp"

namespace maia
{

OrientedPosition orient(const Position& position)
{
    if (position.white_to_move)
    {
        return {position, false};
    }
    return {mirror(position), true};
}

EncodedSample encode(const Position& position, EloBucket self, EloBucket oppo)
{
    const OrientedPosition oriented = orient(position);
    const Position& board = oriented.position;

    EncodedSample sample;
    sample.board.assign(kBoardElements, 0.0F);
    sample.elo_self = self.index();
    sample.elo_oppo = oppo.index();
    sample.mirrored = oriented.mirrored;

    const auto fillPlane = [&](int plane, float value) {
        for (int r = 0; r < kBoardSize; ++r)
        {
            for (int f = 0; f < kBoardSize; ++f)
            {
                sample.board[plane_index(plane, r, f)] = value;
            }
        }
    };

    for (int square = 0; square < kBoardSize * kBoardSize; ++square)
    {
        const PieceCode piece = board.squares[static_cast<std::size_t>(square)];
        if (piece == kEmptySquare)
        {
            continue;
        }
        const int plane = piece < kPieceTypes ? kWhitePiecePlane + piece : kBlackPiecePlane + (piece - kPieceTypes);
        sample.board[plane_index(plane, square / kBoardSize, square % kBoardSize)] = 1.0F;
    }

    fillPlane(kSideToMovePlane, board.white_to_move ? 1.0F : 0.0F);

    const bool castling[4] = {board.castling.white_king_side, board.castling.white_queen_side,
                              board.castling.black_king_side, board.castling.black_queen_side};
    for (int i = 0; i < 4; ++i)
    {
        if (castling[i])
        {
            fillPlane(kCastlingPlane + i, 1.0F);
        }
    }

    if (board.en_passant >= 0)
    {
        sample.board[plane_index(kEnPassantPlane, board.en_passant / kBoardSize, board.en_passant % kBoardSize)] = 1.0F;
    }

    return sample;
}

} // namespace maia

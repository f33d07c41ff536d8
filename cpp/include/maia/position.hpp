#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace maia
{

inline constexpr std::string_view kStartFen = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

/// Square contents: -1 for empty, otherwise colour * 6 + type with types
/// ordered pawn, knight, bishop, rook, queen, king (white 0..5, black 6..11).
using PieceCode = std::int8_t;
constexpr PieceCode kEmptySquare = -1;
constexpr int kPieceTypes = 6;

struct CastlingRights
{
    bool white_king_side{false};
    bool white_queen_side{false};
    bool black_king_side{false};
    bool black_queen_side{false};

    bool operator==(const CastlingRights&) const = default;
};

/// A fully specified standard chess position (a1 = 0, ..., h8 = 63).
struct Position
{
    std::array<PieceCode, 64> squares{};
    bool white_to_move{true};
    CastlingRights castling;
    int en_passant{-1};
    int halfmove_clock{0};
    int fullmove_number{1};

    bool operator==(const Position&) const = default;
};

/// Parse a FEN (4 to 6 fields). Throws ParseError when the string is
/// malformed or the position is not a legal standard chess position.
Position parse_position(std::string_view fen);

std::string to_fen(const Position& position);

/// Vertical flip with colours, side to move, castling and en passant swapped.
Position mirror(const Position& position);

/// Legal moves in UCI with standard castling notation (e1g1), in generator order.
std::vector<std::string> legal_moves(const Position& position);

/// Mirror the rank characters of a UCI move ("e7e5" -> "e2e4").
std::string mirror_uci(const std::string& move);

} // namespace maia

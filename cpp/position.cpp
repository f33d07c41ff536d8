#include "maia/position.hpp"

#include <charconv>
#include <sstream>
#include <string>

#include <chess.hpp>

#include "maia/errors.hpp"

namespace maia
{
namespace
{

constexpr std::string_view kPieceChars = "PNBRQKpnbrqk";

constexpr PieceCode kWhitePawn = 0;
constexpr PieceCode kWhiteRook = 3;
constexpr PieceCode kWhiteKing = 5;
constexpr PieceCode kBlackPawn = 6;
constexpr PieceCode kBlackRook = 9;
constexpr PieceCode kBlackKing = 11;

[[noreturn]] void fail(std::string_view fen, const std::string& reason)
{
    throw ParseError("Invalid FEN '" + std::string(fen) + "': " + reason);
}

std::vector<std::string> split_fields(std::string_view fen)
{
    std::vector<std::string> parts;
    std::istringstream ss{std::string(fen)};
    std::string part;
    while (ss >> part)
    {
        parts.push_back(part);
    }
    return parts;
}

PieceCode swap_colour(PieceCode piece)
{
    if (piece == kEmptySquare)
    {
        return piece;
    }
    return piece < kPieceTypes ? static_cast<PieceCode>(piece + kPieceTypes)
                               : static_cast<PieceCode>(piece - kPieceTypes);
}

void parse_placement(std::string_view fen, const std::string& field, Position& position)
{
    position.squares.fill(kEmptySquare);

    int rank = 7;
    int file = 0;
    for (const char c : field)
    {
        if (c == '/')
        {
            if (file != 8)
            {
                fail(fen, "rank " + std::to_string(rank + 1) + " does not describe 8 squares");
            }
            if (--rank < 0)
            {
                fail(fen, "too many ranks");
            }
            file = 0;
        }
        else if (c >= '1' && c <= '8')
        {
            file += c - '0';
            if (file > 8)
            {
                fail(fen, "rank " + std::to_string(rank + 1) + " overflows");
            }
        }
        else
        {
            const auto code = kPieceChars.find(c);
            if (code == std::string_view::npos)
            {
                fail(fen, std::string("unexpected character '") + c + "' in piece placement");
            }
            if (file >= 8)
            {
                fail(fen, "rank " + std::to_string(rank + 1) + " overflows");
            }
            position.squares[static_cast<std::size_t>(rank * 8 + file)] = static_cast<PieceCode>(code);
            ++file;
        }
    }

    if (rank != 0 || file != 8)
    {
        fail(fen, "piece placement must describe 8 ranks of 8 squares");
    }
}

void parse_castling(std::string_view fen, const std::string& field, Position& position)
{
    if (field == "-")
    {
        return;
    }

    auto set_once = [&](bool& flag, char c) {
        if (flag)
        {
            fail(fen, std::string("castling right '") + c + "' repeated");
        }
        flag = true;
    };

    for (const char c : field)
    {
        switch (c)
        {
        case 'K':
            set_once(position.castling.white_king_side, c);
            break;
        case 'Q':
            set_once(position.castling.white_queen_side, c);
            break;
        case 'k':
            set_once(position.castling.black_king_side, c);
            break;
        case 'q':
            set_once(position.castling.black_queen_side, c);
            break;
        default:
            fail(fen, "invalid castling field '" + field + "'");
        }
    }
}

int parse_counter(std::string_view fen, const std::string& field, const char* name, int minimum)
{
    int value = 0;
    const auto* begin = field.data();
    const auto* end = field.data() + field.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value < minimum)
    {
        fail(fen, std::string("invalid ") + name + " '" + field + "'");
    }
    return value;
}

// Rights whose king or rook has left its home square cannot be exercised.
void drop_unusable_castling(Position& position)
{
    const auto& sq = position.squares;
    const bool whiteKingHome = sq[4] == kWhiteKing;
    const bool blackKingHome = sq[60] == kBlackKing;

    position.castling.white_king_side &= whiteKingHome && sq[7] == kWhiteRook;
    position.castling.white_queen_side &= whiteKingHome && sq[0] == kWhiteRook;
    position.castling.black_king_side &= blackKingHome && sq[63] == kBlackRook;
    position.castling.black_queen_side &= blackKingHome && sq[56] == kBlackRook;
}

void parse_en_passant(std::string_view fen, const std::string& field, Position& position)
{
    if (field == "-")
    {
        return;
    }

    const char expectedRank = position.white_to_move ? '6' : '3';
    if (field.size() != 2 || field[0] < 'a' || field[0] > 'h' || field[1] != expectedRank)
    {
        fail(fen, "invalid en passant square '" + field + "'");
    }

    const int square = (field[1] - '1') * 8 + (field[0] - 'a');
    // The double-pushed pawn sits one rank beyond the target, seen from the mover.
    const int pawnSquare = position.white_to_move ? square - 8 : square + 8;
    const int originSquare = position.white_to_move ? square + 8 : square - 8;
    const PieceCode pushedPawn = position.white_to_move ? kBlackPawn : kWhitePawn;

    const auto& sq = position.squares;
    if (sq[static_cast<std::size_t>(square)] != kEmptySquare
        || sq[static_cast<std::size_t>(originSquare)] != kEmptySquare
        || sq[static_cast<std::size_t>(pawnSquare)] != pushedPawn)
    {
        fail(fen, "en passant square '" + field + "' does not follow a double pawn push");
    }
    position.en_passant = square;
}

void check_legality(std::string_view fen, const Position& position)
{
    int whiteKings = 0;
    int blackKings = 0;
    for (int square = 0; square < 64; ++square)
    {
        const PieceCode piece = position.squares[static_cast<std::size_t>(square)];
        whiteKings += piece == kWhiteKing;
        blackKings += piece == kBlackKing;

        const int rank = square / 8;
        if ((piece == kWhitePawn || piece == kBlackPawn) && (rank == 0 || rank == 7))
        {
            fail(fen, "pawn on " + std::string(1, static_cast<char>('a' + square % 8))
                          + (rank == 0 ? "1" : "8"));
        }
    }
    if (whiteKings != 1 || blackKings != 1)
    {
        fail(fen, "each side must have exactly one king");
    }

    const chess::Board board(to_fen(position));
    const chess::Color mover = position.white_to_move ? chess::Color::WHITE : chess::Color::BLACK;
    const chess::Color waiting = position.white_to_move ? chess::Color::BLACK : chess::Color::WHITE;
    if (board.isAttacked(board.kingSq(waiting), mover))
    {
        fail(fen, "the side not to move is in check");
    }
}

} // namespace

Position parse_position(std::string_view fen)
{
    const auto fields = split_fields(fen);
    if (fields.size() < 4 || fields.size() > 6)
    {
        fail(fen, "expected 4 to 6 fields, got " + std::to_string(fields.size()));
    }

    Position position;
    parse_placement(fen, fields[0], position);

    if (fields[1] == "w")
    {
        position.white_to_move = true;
    }
    else if (fields[1] == "b")
    {
        position.white_to_move = false;
    }
    else
    {
        fail(fen, "invalid active colour '" + fields[1] + "'");
    }

    parse_castling(fen, fields[2], position);
    drop_unusable_castling(position);
    parse_en_passant(fen, fields[3], position);

    if (fields.size() > 4)
    {
        position.halfmove_clock = parse_counter(fen, fields[4], "halfmove clock", 0);
    }
    if (fields.size() > 5)
    {
        position.fullmove_number = parse_counter(fen, fields[5], "fullmove number", 1);
    }

    check_legality(fen, position);
    return position;
}

std::string to_fen(const Position& position)
{
    std::ostringstream os;
    for (int rank = 7; rank >= 0; --rank)
    {
        int empty = 0;
        for (int file = 0; file < 8; ++file)
        {
            const PieceCode piece = position.squares[static_cast<std::size_t>(rank * 8 + file)];
            if (piece == kEmptySquare)
            {
                ++empty;
                continue;
            }
            if (empty > 0)
            {
                os << empty;
                empty = 0;
            }
            os << kPieceChars[static_cast<std::size_t>(piece)];
        }
        if (empty > 0)
        {
            os << empty;
        }
        if (rank > 0)
        {
            os << '/';
        }
    }

    os << ' ' << (position.white_to_move ? 'w' : 'b') << ' ';

    std::string castling;
    if (position.castling.white_king_side) castling += 'K';
    if (position.castling.white_queen_side) castling += 'Q';
    if (position.castling.black_king_side) castling += 'k';
    if (position.castling.black_queen_side) castling += 'q';
    os << (castling.empty() ? "-" : castling) << ' ';

    if (position.en_passant >= 0)
    {
        os << static_cast<char>('a' + position.en_passant % 8) << static_cast<char>('1' + position.en_passant / 8);
    }
    else
    {
        os << '-';
    }

    os << ' ' << position.halfmove_clock << ' ' << position.fullmove_number;
    return os.str();
}

Position mirror(const Position& position)
{
    Position mirrored;
    for (std::size_t square = 0; square < position.squares.size(); ++square)
    {
        mirrored.squares[square ^ 56] = swap_colour(position.squares[square]);
    }

    mirrored.white_to_move = !position.white_to_move;
    mirrored.castling.white_king_side = position.castling.black_king_side;
    mirrored.castling.white_queen_side = position.castling.black_queen_side;
    mirrored.castling.black_king_side = position.castling.white_king_side;
    mirrored.castling.black_queen_side = position.castling.white_queen_side;
    mirrored.en_passant = position.en_passant >= 0 ? (position.en_passant ^ 56) : -1;
    mirrored.halfmove_clock = position.halfmove_clock;
    mirrored.fullmove_number = position.fullmove_number;
    return mirrored;
}

std::vector<std::string> legal_moves(const Position& position)
{
    const chess::Board board(to_fen(position));

    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);

    std::vector<std::string> result;
    result.reserve(moves.size());
    for (const auto& move : moves)
    {
        result.push_back(chess::uci::moveToUci(move, false));
    }
    return result;
}

std::string mirror_uci(const std::string& move)
{
    if (move.size() < 4)
    {
        return move;
    }
    auto mirrorRank = [](char c) -> char {
        if (c < '1' || c > '8')
        {
            return c;
        }
        return static_cast<char>('1' + ('8' - c));
    };
    std::string mirrored = move;
    mirrored[1] = mirrorRank(mirrored[1]);
    mirrored[3] = mirrorRank(mirrored[3]);
    return mirrored;
}

} // namespace maia

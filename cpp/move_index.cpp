#include "maia/move_index.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <functional>
#include <string>
#include <utility>

#include "maia/errors.hpp"

namespace maia
{
namespace
{

constexpr int kBoardSize = 8;
constexpr int kSquareCount = 64;
constexpr int kPromotionKinds = 5;

char promotion_char(Promotion promotion)
{
    switch (promotion)
    {
    case Promotion::Knight:
        return 'n';
    case Promotion::Bishop:
        return 'b';
    case Promotion::Rook:
        return 'r';
    case Promotion::Queen:
        return 'q';
    case Promotion::None:
        break;
    }
    return '\0';
}

std::optional<Promotion> promotion_from_char(char c)
{
    switch (c)
    {
    case 'n':
        return Promotion::Knight;
    case 'b':
        return Promotion::Bishop;
    case 'r':
        return Promotion::Rook;
    case 'q':
        return Promotion::Queen;
    default:
        return std::nullopt;
    }
}

std::optional<int> parse_square(char file, char rank)
{
    if (file < 'a' || file > 'h' || rank < '1' || rank > '8')
    {
        return std::nullopt;
    }
    return (rank - '1') * kBoardSize + (file - 'a');
}

bool on_board(int rank, int file)
{
    return rank >= 0 && rank < kBoardSize && file >= 0 && file < kBoardSize;
}

// Destinations reachable from `square` on an empty board, highest square first.
std::vector<int> ray_targets(int square, const std::vector<std::pair<int, int>>& steps, bool sliding)
{
    const int rank = square / kBoardSize;
    const int file = square % kBoardSize;

    std::vector<int> targets;
    for (const auto& [dr, df] : steps)
    {
        int r = rank + dr;
        int f = file + df;
        while (on_board(r, f))
        {
            targets.push_back(r * kBoardSize + f);
            if (!sliding)
            {
                break;
            }
            r += dr;
            f += df;
        }
    }
    std::sort(targets.begin(), targets.end(), std::greater<>());
    return targets;
}

std::vector<std::string> build_maia2_tokens()
{
    static const std::vector<std::pair<int, int>> queenSteps{
        {1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
    static const std::vector<std::pair<int, int>> knightSteps{
        {2, 1}, {2, -1}, {-2, 1}, {-2, -1}, {1, 2}, {1, -2}, {-1, 2}, {-1, -2}};

    std::vector<std::string> tokens;
    tokens.reserve(kMaia2PolicySize);

    for (int from = 0; from < kSquareCount; ++from)
    {
        for (int to : ray_targets(from, queenSteps, true))
        {
            tokens.push_back(to_uci({from, to, Promotion::None}));
        }
        for (int to : ray_targets(from, knightSteps, false))
        {
            tokens.push_back(to_uci({from, to, Promotion::None}));
        }
    }

    constexpr std::array<Promotion, 4> promotionOrder{
        Promotion::Queen, Promotion::Rook, Promotion::Bishop, Promotion::Knight};
    for (int file = 0; file < kBoardSize; ++file)
    {
        const int from = 6 * kBoardSize + file;
        std::vector<int> targets{7 * kBoardSize + file};
        if (file > 0)
        {
            targets.push_back(7 * kBoardSize + file - 1);
        }
        if (file < kBoardSize - 1)
        {
            targets.push_back(7 * kBoardSize + file + 1);
        }
        // Push, then lower-file capture, then higher-file capture; q r b n under each.
        for (const int to : targets)
        {
            for (const Promotion promotion : promotionOrder)
            {
                tokens.push_back(to_uci({from, to, promotion}));
            }
        }
    }

    return tokens;
}

} // namespace

std::optional<MoveDescriptor> parse_uci(std::string_view uci)
{
    if (uci.size() != 4 && uci.size() != 5)
    {
        return std::nullopt;
    }

    const auto from = parse_square(uci[0], uci[1]);
    const auto to = parse_square(uci[2], uci[3]);
    if (!from || !to || *from == *to)
    {
        return std::nullopt;
    }

    MoveDescriptor move{*from, *to, Promotion::None};
    if (uci.size() == 5)
    {
        const auto promotion = promotion_from_char(uci[4]);
        if (!promotion)
        {
            return std::nullopt;
        }
        move.promotion = *promotion;
    }
    return move;
}

std::string square_name(int square)
{
    std::string name(2, ' ');
    name[0] = static_cast<char>('a' + square % kBoardSize);
    name[1] = static_cast<char>('1' + square / kBoardSize);
    return name;
}

std::string to_uci(const MoveDescriptor& move)
{
    std::string uci = square_name(move.from) + square_name(move.to);
    if (move.promotion != Promotion::None)
    {
        uci.push_back(promotion_char(move.promotion));
    }
    return uci;
}

std::vector<std::string> maia2_move_tokens()
{
    return build_maia2_tokens();
}

MoveIndex::MoveIndex(std::vector<std::string> tokens)
    : tokens_(std::move(tokens))
    , lookup_(static_cast<std::size_t>(kSquareCount) * kSquareCount * kPromotionKinds, -1)
{
    if (tokens_.empty())
    {
        throw ModelLoadError("Move vocabulary is empty.");
    }

    moves_.reserve(tokens_.size());
    for (std::size_t i = 0; i < tokens_.size(); ++i)
    {
        const auto move = parse_uci(tokens_[i]);
        if (!move)
        {
            throw ModelLoadError("Malformed move token at index " + std::to_string(i) + ": '" + tokens_[i] + "'");
        }

        int& entry = lookup_[slot(*move)];
        if (entry != -1)
        {
            throw ModelLoadError("Duplicate move token '" + tokens_[i] + "' at indices " + std::to_string(entry)
                                 + " and " + std::to_string(i));
        }
        entry = static_cast<int>(i);
        moves_.push_back(*move);
    }
}

const std::shared_ptr<const MoveIndex>& MoveIndex::maia2()
{
    static const std::shared_ptr<const MoveIndex> table = std::make_shared<MoveIndex>(build_maia2_tokens());
    return table;
}

std::shared_ptr<const MoveIndex> MoveIndex::from_tokens(std::vector<std::string> tokens)
{
    return std::make_shared<MoveIndex>(std::move(tokens));
}

std::shared_ptr<const MoveIndex> MoveIndex::from_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
    {
        throw ModelLoadError("Failed to open move vocabulary file: " + path);
    }

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(file, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        tokens.push_back(line);
    }
    while (!tokens.empty() && tokens.back().empty())
    {
        tokens.pop_back();
    }

    return from_tokens(std::move(tokens));
}

std::size_t MoveIndex::slot(const MoveDescriptor& move)
{
    return (static_cast<std::size_t>(move.from) * kSquareCount + static_cast<std::size_t>(move.to)) * kPromotionKinds
        + static_cast<std::size_t>(move.promotion);
}

void MoveIndex::check_index(int index) const
{
    if (index < 0 || static_cast<std::size_t>(index) >= tokens_.size())
    {
        throw InternalConsistencyError("Move index out of range: " + std::to_string(index) + " (table size "
                                       + std::to_string(tokens_.size()) + ")");
    }
}

std::optional<int> MoveIndex::encode(const MoveDescriptor& move) const
{
    if (move.from < 0 || move.from >= kSquareCount || move.to < 0 || move.to >= kSquareCount)
    {
        return std::nullopt;
    }
    const int entry = lookup_[slot(move)];
    if (entry < 0)
    {
        return std::nullopt;
    }
    return entry;
}

std::optional<int> MoveIndex::encode(std::string_view uci) const
{
    const auto move = parse_uci(uci);
    if (!move)
    {
        return std::nullopt;
    }
    return encode(*move);
}

int MoveIndex::require(std::string_view uci) const
{
    if (auto index = encode(uci))
    {
        return *index;
    }
    throw InternalConsistencyError("Move '" + std::string(uci) + "' has no policy index; the move table does not "
                                   "match this model.");
}

MoveDescriptor MoveIndex::decode(int index) const
{
    check_index(index);
    return moves_[static_cast<std::size_t>(index)];
}

const std::string& MoveIndex::uci(int index) const
{
    check_index(index);
    return tokens_[static_cast<std::size_t>(index)];
}

} // namespace maia

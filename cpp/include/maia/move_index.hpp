#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maia
{

// Size of the Maia2 policy head: 1792 queen/knight moves + 88 white promotions.
constexpr int kMaia2PolicySize = 1880;

enum class Promotion : std::uint8_t
{
    None,
    Knight,
    Bishop,
    Rook,
    Queen,
};

/// Squares use a1 = 0, b1 = 1, ..., h8 = 63.
struct MoveDescriptor
{
    int from{0};
    int to{0};
    Promotion promotion{Promotion::None};

    bool operator==(const MoveDescriptor&) const = default;
};

/// Parse a UCI move ("e2e4", "a7a8q"). Returns nullopt on malformed input.
std::optional<MoveDescriptor> parse_uci(std::string_view uci);

std::string to_uci(const MoveDescriptor& move);

std::string square_name(int square);

/// Tokens of the built-in Maia2 policy layout, in output-vector order.
std::vector<std::string> maia2_move_tokens();

/// Dense, injective mapping between move descriptors and policy indices.
///
/// Immutable after construction. The built-in table is created once per
/// process and shared by every session through maia2().
class MoveIndex
{
public:
    /// Build from tokens where token i names policy index i.
    /// Throws ModelLoadError on malformed or duplicate tokens.
    explicit MoveIndex(std::vector<std::string> tokens);

    static const std::shared_ptr<const MoveIndex>& maia2();

    static std::shared_ptr<const MoveIndex> from_tokens(std::vector<std::string> tokens);

    /// Load an exported vocabulary: one UCI token per line, line number = index.
    static std::shared_ptr<const MoveIndex> from_file(const std::string& path);

    std::optional<int> encode(const MoveDescriptor& move) const;
    std::optional<int> encode(std::string_view uci) const;

    /// Like encode(), but a move missing from the table is an InternalConsistencyError.
    int require(std::string_view uci) const;

    MoveDescriptor decode(int index) const;
    const std::string& uci(int index) const;

    std::size_t size() const noexcept { return tokens_.size(); }
    const std::vector<std::string>& tokens() const noexcept { return tokens_; }

private:
    static std::size_t slot(const MoveDescriptor& move);
    void check_index(int index) const;

    std::vector<std::string> tokens_;
    std::vector<MoveDescriptor> moves_;
    std::vector<int> lookup_;
};

} // namespace maia

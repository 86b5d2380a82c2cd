#pragma once
#include <array>
#include <optional>
#include "kingcap/types.hpp"

namespace kingcap {

// One immutable snapshot of the board plus the side to move.
// Derived positions are produced by apply()/with_piece(); nothing mutates a
// Position after construction.
class Position {
public:
    using Grid = std::array<std::optional<Piece>, 64>;

    Position() = default; // empty board, White to move
    Position(Side toMove, const Grid& grid);

    Side side_to_move() const { return toMove_; }
    const Grid& grid() const { return grid_; }

    // Precondition: on_board(sq).
    std::optional<Piece> piece_at(const Square& sq) const { return grid_[square_index(sq)]; }

    // Relocates the piece on m.from to m.to (discarding any occupant), clears
    // m.from and flips the side to move. Legality is the caller's concern.
    Position apply(const Move& m) const;

    // Copy with a single square replaced; side to move is kept.
    Position with_piece(const Square& sq, const std::optional<Piece>& piece) const;

    bool king_missing(Side side) const;

private:
    Side toMove_ = Side::White;
    Grid grid_{};
};

bool operator==(const Position& a, const Position& b);
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

} // namespace kingcap

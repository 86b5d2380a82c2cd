#include "kingcap/position.hpp"

namespace kingcap {

Position::Position(Side toMove, const Grid& grid) : toMove_(toMove), grid_(grid) {}

Position Position::apply(const Move& m) const {
    Position out = *this; // copy; the source position stays untouched
    out.grid_[square_index(m.to)] = grid_[square_index(m.from)];
    out.grid_[square_index(m.from)].reset();
    out.toMove_ = opponent(toMove_);
    return out;
}

Position Position::with_piece(const Square& sq, const std::optional<Piece>& piece) const {
    Position out = *this;
    out.grid_[square_index(sq)] = piece;
    return out;
}

bool Position::king_missing(Side side) const {
    for (const auto& cell : grid_) {
        if (cell && cell->side == side && cell->kind == PieceKind::King) return false;
    }
    return true;
}

bool operator==(const Position& a, const Position& b) {
    return a.side_to_move() == b.side_to_move() && a.grid() == b.grid();
}

} // namespace kingcap

#include "kingcap/rules.hpp"
#include <cstdlib>

namespace kingcap {

namespace {

int sign(int v) { return (v > 0) - (v < 0); }

bool pawn_shape(const Position& pos, const Move& m, Side side) {
    int forward = (side == Side::White) ? 1 : -1;
    int df = m.to.file - m.from.file;
    int dr = m.to.rank - m.from.rank;
    if (dr != forward) return false;
    if (df == 0) return !pos.piece_at(m.to);            // push onto empty square
    if (std::abs(df) == 1) {                             // diagonal capture only
        auto target = pos.piece_at(m.to);
        return target && target->side != side;
    }
    return false;
}

} // namespace

bool on_board(const Move& m) {
    return on_board(m.from) && on_board(m.to) && m.from != m.to;
}

bool destination_blocked(const Position& pos, const Move& m) {
    auto mover = pos.piece_at(m.from);
    auto target = pos.piece_at(m.to);
    return mover && target && target->side == mover->side;
}

bool shape_allowed(const Position& pos, const Move& m) {
    auto mover = pos.piece_at(m.from);
    if (!mover || mover->side != pos.side_to_move()) return false;
    int adf = std::abs(m.to.file - m.from.file);
    int adr = std::abs(m.to.rank - m.from.rank);
    bool straight = (adf == 0) != (adr == 0);
    bool diagonal = adf == adr && adf != 0;
    switch (mover->kind) {
        case PieceKind::Pawn: return pawn_shape(pos, m, mover->side);
        case PieceKind::Rook: return straight;
        case PieceKind::Bishop: return diagonal;
        case PieceKind::Queen: return straight || diagonal;
        case PieceKind::King: return adf <= 1 && adr <= 1 && (adf | adr) != 0;
    }
    return false;
}

bool path_clear(const Position& pos, const Move& m) {
    auto mover = pos.piece_at(m.from);
    if (!mover) return true;
    if (mover->kind == PieceKind::Pawn || mover->kind == PieceKind::King) return true;
    int df = sign(m.to.file - m.from.file);
    int dr = sign(m.to.rank - m.from.rank);
    Square sq{m.from.file + df, m.from.rank + dr};
    while (sq != m.to) {
        if (!on_board(sq)) return false; // not a line; shape_allowed rejects it anyway
        if (pos.piece_at(sq)) return false;
        sq.file += df; sq.rank += dr;
    }
    return true;
}

bool is_legal(const Position& pos, const Move& m) {
    if (!on_board(m)) return false;
    if (destination_blocked(pos, m)) return false;
    if (!shape_allowed(pos, m)) return false;
    return path_clear(pos, m);
}

} // namespace kingcap

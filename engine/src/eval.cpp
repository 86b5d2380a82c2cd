#include "kingcap/eval.hpp"

namespace kingcap {

int piece_value(PieceKind kind) {
    switch (kind) {
        case PieceKind::Pawn: return 1;
        case PieceKind::Rook: return 10;
        case PieceKind::Bishop: return 10;
        case PieceKind::Queen: return 50;
        case PieceKind::King: return 150;
    }
    return 0;
}

int material(const Position& pos, Side side) {
    int score = 0;
    for (const auto& cell : pos.grid()) {
        if (cell && cell->side == side) score += piece_value(cell->kind);
    }
    return score;
}

int evaluate(const Position& pos, int depthRemaining) {
    return (material(pos, Side::White) - material(pos, Side::Black)) * depthRemaining;
}

} // namespace kingcap

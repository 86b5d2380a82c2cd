#pragma once
#include "kingcap/position.hpp"

namespace kingcap {

// Pawn=1, Rook=10, Bishop=10, Queen=50, King=150.
int piece_value(PieceKind kind);

// Sum of piece_value over every piece of `side`.
int material(const Position& pos, Side side);

// (material(White) - material(Black)) * depthRemaining. Positive favors White.
// The depth weight makes the same material gain worth more the sooner it
// happens in the tree, so the search prefers quick wins and slow losses.
int evaluate(const Position& pos, int depthRemaining);

} // namespace kingcap

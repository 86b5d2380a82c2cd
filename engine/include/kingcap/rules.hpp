#pragma once
#include "kingcap/position.hpp"

// Move legality predicates. All are pure; a move is legal iff is_legal() says so.
// There is no check rule: a side may leave its King en prise and loses when it
// is captured (see Position::king_missing).

namespace kingcap {

// Both squares on the board and from != to.
bool on_board(const Move& m);

// Destination holds a piece of the moving piece's side.
// Precondition: on_board(m) and m.from is occupied.
bool destination_blocked(const Position& pos, const Move& m);

// Geometry check for the moving piece. Also false when m.from is empty or the
// piece there does not belong to the side to move.
bool shape_allowed(const Position& pos, const Move& m);

// Every square strictly between m.from and m.to is empty. Pawns and Kings
// always pass. Precondition: shape_allowed(pos, m).
bool path_clear(const Position& pos, const Move& m);

bool is_legal(const Position& pos, const Move& m);

} // namespace kingcap

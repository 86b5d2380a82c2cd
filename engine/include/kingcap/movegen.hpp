#pragma once
#include <cstdint>
#include <vector>
#include "kingcap/position.hpp"

namespace kingcap {

// All legal moves for the side to move. Origins are scanned file-major, each
// file from the top rank down (a8, a7, ..., a1, b8, ...), and each origin
// tries its destinations in the same order, so the result is deterministic.
std::vector<Move> legal_moves(const Position& pos);

// Appends to `out` instead of returning; `out` is cleared first.
void generate_legal(const Position& pos, std::vector<Move>& out);

// Leaf count of the legal-move tree `depth` plies deep (depth 0 -> 1).
std::uint64_t perft(const Position& pos, int depth);

} // namespace kingcap

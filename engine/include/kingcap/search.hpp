#pragma once
#include <cstdint>
#include <optional>
#include "kingcap/position.hpp"

namespace kingcap {

enum class Algorithm { Minimax, AlphaBeta };

struct SearchOptions {
    int depth = 4;                           // plies below the root; values < 1 act as 1
    Algorithm algorithm = Algorithm::AlphaBeta;
};

struct SearchStats {
    std::uint64_t nodes = 0;   // positions visited below the root
    std::uint64_t leaves = 0;  // positions scored by evaluate()
    std::uint64_t cutoffs = 0; // alpha-beta prunes
};

struct SearchResult {
    int score = 0;
    Move move;
    SearchStats stats;
};

// Score bound used for the initial window; larger than any reachable evaluation.
constexpr int kInfinity = 99999999;

// Best move for the side to move and the score it leads to (White-positive).
// Empty when the side to move has no legal move. Minimax and AlphaBeta return
// the same score and move for the same input; ties keep the earliest move in
// legal_moves() order.
std::optional<SearchResult> best_move(const Position& pos, const SearchOptions& opts);
std::optional<SearchResult> best_move(const Position& pos, int maxDepth, Algorithm algo = Algorithm::AlphaBeta);

} // namespace kingcap

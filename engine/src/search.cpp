#include "kingcap/search.hpp"
#include "kingcap/eval.hpp"
#include "kingcap/movegen.hpp"
#include <algorithm>
#include <vector>

// Depth accounting: the root has `depth` plies left and every ply below it
// has one fewer. A node is a leaf when the side to move has lost its King or
// no plies are left; a leaf with `left` plies remaining is scored with weight
// left+1, so exhausted leaves weigh 1 and earlier king captures weigh more.
// A node whose side has no legal move is scored the same way.

namespace kingcap {

namespace {

struct Searcher {
    bool prune;
    SearchStats stats;

    int leaf(const Position& pos, int left) {
        ++stats.leaves;
        return evaluate(pos, left + 1);
    }

    // White maximizes, Black minimizes. Fail-soft: with pruning on, a result
    // <= alpha or >= beta is a bound on the exact value, otherwise exact.
    int node(const Position& pos, int left, int alpha, int beta) {
        ++stats.nodes;
        if (left <= 0 || pos.king_missing(pos.side_to_move())) return leaf(pos, left);
        std::vector<Move> moves; generate_legal(pos, moves);
        if (moves.empty()) return leaf(pos, left);
        bool maximizing = pos.side_to_move() == Side::White;
        int best = maximizing ? -kInfinity : kInfinity;
        for (const auto& m : moves) {
            int v = node(pos.apply(m), left - 1, alpha, beta);
            if (maximizing) {
                if (v > best) best = v;
                if (prune) {
                    if (best >= beta) { ++stats.cutoffs; return best; }
                    alpha = std::max(alpha, best);
                }
            } else {
                if (v < best) best = v;
                if (prune) {
                    if (best <= alpha) { ++stats.cutoffs; return best; }
                    beta = std::min(beta, best);
                }
            }
        }
        return best;
    }
};

} // namespace

std::optional<SearchResult> best_move(const Position& pos, const SearchOptions& opts) {
    std::vector<Move> moves; generate_legal(pos, moves);
    if (moves.empty()) return std::nullopt;
    int depth = opts.depth < 1 ? 1 : opts.depth;
    Searcher s{opts.algorithm == Algorithm::AlphaBeta, {}};
    bool maximizing = pos.side_to_move() == Side::White;
    SearchResult res;
    res.score = maximizing ? -kInfinity : kInfinity;
    res.move = moves.front();
    // Only the side that has a best-so-far tightens its bound; a child that
    // cannot beat it comes back as a bound that also cannot beat it, so the
    // chosen move and score match the unpruned search.
    int alpha = -kInfinity, beta = kInfinity;
    for (const auto& m : moves) {
        int v = s.node(pos.apply(m), depth - 1, alpha, beta);
        if (maximizing ? v > res.score : v < res.score) {
            res.score = v;
            res.move = m;
            if (s.prune) {
                if (maximizing) alpha = v; else beta = v;
            }
        }
    }
    res.stats = s.stats;
    return res;
}

std::optional<SearchResult> best_move(const Position& pos, int maxDepth, Algorithm algo) {
    SearchOptions opts;
    opts.depth = maxDepth;
    opts.algorithm = algo;
    return best_move(pos, opts);
}

} // namespace kingcap

#include "kingcap/movegen.hpp"
#include "kingcap/rules.hpp"

namespace kingcap {

void generate_legal(const Position& pos, std::vector<Move>& out) {
    out.clear();
    for (int f = 0; f < 8; ++f) {
        for (int r = 7; r >= 0; --r) {
            Square from{f, r};
            auto piece = pos.piece_at(from);
            if (!piece || piece->side != pos.side_to_move()) continue;
            // Brute force: every square is a candidate, the rules do the filtering.
            for (int tf = 0; tf < 8; ++tf) {
                for (int tr = 7; tr >= 0; --tr) {
                    Move m{from, Square{tf, tr}};
                    if (is_legal(pos, m)) out.push_back(m);
                }
            }
        }
    }
}

std::vector<Move> legal_moves(const Position& pos) {
    std::vector<Move> out;
    generate_legal(pos, out);
    return out;
}

std::uint64_t perft(const Position& pos, int depth) {
    if (depth <= 0) return 1ULL;
    std::vector<Move> legal; generate_legal(pos, legal);
    if (depth == 1) return (std::uint64_t)legal.size();
    std::uint64_t nodes = 0ULL;
    for (const auto& m : legal) nodes += perft(pos.apply(m), depth - 1);
    return nodes;
}

} // namespace kingcap

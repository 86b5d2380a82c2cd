#include "kingcap/game.hpp"
#include "kingcap/eval.hpp"
#include "kingcap/movegen.hpp"
#include "kingcap/rules.hpp"

namespace kingcap {

const char* outcome_name(Outcome o) {
    switch (o) {
        case Outcome::Ongoing: return "ongoing";
        case Outcome::WhiteWins: return "White wins!";
        case Outcome::BlackWins: return "Black wins!";
    }
    return "?";
}

Game::Game(const Position& start, const SearchOptions& opts) : current_(start), opts_(opts) {}

std::optional<SearchResult> Game::suggest() const {
    return best_move(current_, opts_);
}

std::vector<Move> Game::moves() const {
    return legal_moves(current_);
}

bool Game::play(const Move& m) {
    if (!is_legal(current_, m)) return false;
    current_ = current_.apply(m);
    return true;
}

std::optional<SearchResult> Game::play_engine_move() {
    auto res = suggest();
    if (!res) return std::nullopt;
    current_ = current_.apply(res->move);
    return res;
}

Outcome Game::outcome() const {
    if (current_.king_missing(Side::Black)) return Outcome::WhiteWins;
    if (current_.king_missing(Side::White)) return Outcome::BlackWins;
    return Outcome::Ongoing;
}

int Game::score() const {
    return evaluate(current_, opts_.depth);
}

} // namespace kingcap

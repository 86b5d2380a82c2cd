#pragma once
#include <optional>
#include <vector>
#include "kingcap/position.hpp"
#include "kingcap/search.hpp"

namespace kingcap {

enum class Outcome { Ongoing, WhiteWins, BlackWins };

const char* outcome_name(Outcome o);

// Holds the one live position of a game. Each accepted move replaces it with
// the derived position; rejected moves leave it alone.
class Game {
public:
    explicit Game(const Position& start, const SearchOptions& opts = SearchOptions{});

    const Position& position() const { return current_; }
    void set_position(const Position& pos) { current_ = pos; }

    const SearchOptions& options() const { return opts_; }
    void set_options(const SearchOptions& opts) { opts_ = opts; }

    // Engine recommendation for the side to move; empty when it has no move.
    std::optional<SearchResult> suggest() const;

    std::vector<Move> moves() const;

    // Applies `m` if legal. False (and no change) otherwise.
    bool play(const Move& m);

    // Searches and plays the recommendation. Empty when there was no move.
    std::optional<SearchResult> play_engine_move();

    Outcome outcome() const;

    // Static score of the current position at the configured depth.
    int score() const;

private:
    Position current_;
    SearchOptions opts_;
};

} // namespace kingcap

// Console game: the engine recommends a move for the side to move, the user
// enters the move actually played.
// Usage: kingcap_cli [board_file] [--depth N] [--minimax] [--verbose]
#include "kingcap/board_text.hpp"
#include "kingcap/config.hpp"
#include "kingcap/game.hpp"
#include "kingcap/notation.hpp"
#include <iostream>
#include <string>

using namespace kingcap;

static void printMoves(const std::vector<Move>& moves) {
    std::cout << "Legal moves (" << moves.size() << "):";
    for (const auto& m : moves) std::cout << ' ' << move_name(m);
    std::cout << std::endl;
}

int main(int argc, char** argv) {
    GameConfig cfg;
    std::string err;
    if (!parse_game_args(argc, argv, cfg, &err)) {
        std::cerr << err << "\n" << game_usage(argv[0]) << std::endl;
        return 2;
    }
    std::cout << "Reading from " << cfg.boardFile << "..." << std::endl;
    Position start;
    if (!load_board_file(cfg.boardFile, start, &err)) {
        std::cerr << "Failed to load board: " << err << std::endl;
        return 1;
    }
    Game game(start, cfg.search);

    while (true) {
        std::cout << render_board(game.position());
        std::cout << "Current score: " << game.score() << std::endl;

        std::cout << "Calculating best move..." << std::endl;
        auto best = game.suggest();
        if (!best) {
            std::cout << "No legal moves for the side to move." << std::endl;
            return 0;
        }
        std::cout << "Best move: " << move_name(best->move) << std::endl;
        std::cout << "Score to achieve: " << best->score << std::endl << std::endl;
        if (cfg.verbose) {
            std::cerr << "search depth=" << game.options().depth
                      << " algo=" << (game.options().algorithm == Algorithm::AlphaBeta ? "alphabeta" : "minimax")
                      << " nodes=" << best->stats.nodes << " leaves=" << best->stats.leaves
                      << " cutoffs=" << best->stats.cutoffs << std::endl;
        }

        printMoves(game.moves());
        while (true) {
            std::cout << "Indicate your move (or q to stop): " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) {
                std::cout << std::endl << "Exiting program..." << std::endl;
                return 0;
            }
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line == "q") {
                std::cout << "Exiting program..." << std::endl;
                return 0;
            }
            Move m;
            if (parse_move(line, m) && game.play(m)) break;
            std::cout << "Incorrect move!" << std::endl;
        }

        Outcome o = game.outcome();
        if (o != Outcome::Ongoing) {
            std::cout << render_board(game.position());
            std::cout << outcome_name(o) << std::endl;
            return 0;
        }
    }
}

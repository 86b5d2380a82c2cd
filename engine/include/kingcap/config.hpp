#pragma once
#include <string>
#include "kingcap/search.hpp"

namespace kingcap {

struct GameConfig {
    std::string boardFile = "test_board.chb";
    SearchOptions search;
    bool verbose = false;
};

// kingcap_cli [board_file] [--depth N] [--minimax] [--verbose]
// argv[0] is skipped. Returns false with a message in `error` on bad input.
bool parse_game_args(int argc, const char* const* argv, GameConfig& out, std::string* error = nullptr);

std::string game_usage(const char* prog);

} // namespace kingcap

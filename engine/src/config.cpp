#include "kingcap/config.hpp"
#include <climits>
#include <cstdlib>
#include <cstring>

namespace kingcap {

std::string game_usage(const char* prog) {
    return std::string("Usage: ") + (prog ? prog : "kingcap_cli") + " [board_file] [--depth N] [--minimax] [--verbose]";
}

bool parse_game_args(int argc, const char* const* argv, GameConfig& out, std::string* error) {
    GameConfig cfg;
    bool haveFile = false;
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--depth") == 0 || std::strcmp(a, "-d") == 0) {
            if (i + 1 >= argc) { if (error) *error = "--depth needs a value"; return false; }
            char* end = nullptr;
            long d = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0' || d < 1 || d > INT_MAX) { if (error) *error = std::string("invalid depth '") + argv[i] + "'"; return false; }
            cfg.search.depth = (int)d;
        } else if (std::strcmp(a, "--minimax") == 0) {
            cfg.search.algorithm = Algorithm::Minimax;
        } else if (std::strcmp(a, "--alphabeta") == 0) {
            cfg.search.algorithm = Algorithm::AlphaBeta;
        } else if (std::strcmp(a, "--verbose") == 0 || std::strcmp(a, "-v") == 0) {
            cfg.verbose = true;
        } else if (a[0] == '-' && a[1] != '\0') {
            if (error) *error = std::string("unknown option ") + a;
            return false;
        } else if (!haveFile) {
            cfg.boardFile = a; haveFile = true;
        } else {
            if (error) *error = std::string("unexpected argument ") + a;
            return false;
        }
    }
    out = cfg;
    return true;
}

} // namespace kingcap

#include "kingcap/board_text.hpp"
#include "kingcap/movegen.hpp"
#include "kingcap/notation.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Simple CLI tool: pass a FEN string (quoted) and it outputs all legal moves separated by spaces.
// Usage:
//   ./legal_moves_runner "4k3/8/8/8/8/8/8/R3K3 w"
// If no argument given, reads a single line from stdin.
int main(int argc, char** argv) {
    std::string fen;
    if (argc >= 2) {
        // Reconstruct FEN from all arguments (allow spaces if not quoted properly)
        std::ostringstream oss; for (int i = 1; i < argc; i++) { if (i > 1) oss << ' '; oss << argv[i]; }
        fen = oss.str();
    } else {
        if (!std::getline(std::cin, fen)) {
            std::cerr << "No FEN provided." << std::endl; return 1;
        }
    }
    kingcap::Position pos;
    std::string err;
    if (!kingcap::parse_fen(fen, pos, &err)) {
        std::cerr << "Failed to parse FEN: " << err << std::endl; return 2;
    }
    std::vector<kingcap::Move> moves = kingcap::legal_moves(pos);
    std::cout << "Legal moves (" << moves.size() << "):";
    if (!moves.empty()) std::cout << ' ';
    for (size_t i = 0; i < moves.size(); ++i) {
        if (i) std::cout << ' ';
        std::cout << kingcap::move_name(moves[i]);
    }
    std::cout << std::endl;
    return 0;
}

#include "kingcap/board_text.hpp"
#include "kingcap/movegen.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    std::string fen = "rbqkbr2/pppppp2/8/8/8/8/PPPPPP2/RBQKBR2 w";
    int depth = 3;
    if (argc > 1) fen = argv[1];
    if (argc > 2) depth = std::atoi(argv[2]);
    kingcap::Position pos;
    std::string err;
    if (!kingcap::parse_fen(fen, pos, &err)) {
        std::cerr << "Invalid FEN: " << err << std::endl; return 1;
    }
    auto nodes = kingcap::perft(pos, depth);
    std::cout << "Perft(" << depth << ") = " << nodes << std::endl;
    return 0;
}

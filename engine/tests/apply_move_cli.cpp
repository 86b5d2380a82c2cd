// CLI: apply_move_cli
// Usage: apply_move_cli "<FEN>" <move>
#include "kingcap/board_text.hpp"
#include "kingcap/notation.hpp"
#include "kingcap/rules.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv){
    if (argc < 3){ std::cerr << "{\"error\":\"usage apply_move_cli FEN MOVE\"}" << std::endl; return 2; }
    kingcap::Position pos; std::string err;
    if (!kingcap::parse_fen(argv[1], pos, &err)){ std::cerr << "{\"error\":\"" << err << "\"}" << std::endl; return 2; }
    kingcap::Move m;
    if (!kingcap::parse_move(argv[2], m) || !kingcap::is_legal(pos, m)){
        std::cout << "{\"error\":\"illegal\"}" << std::endl;
        return 1;
    }
    std::cout << kingcap::to_fen(pos.apply(m)) << std::endl;
    return 0;
}

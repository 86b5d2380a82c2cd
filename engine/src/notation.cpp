#include "kingcap/notation.hpp"

namespace kingcap {

bool parse_square(const std::string& text, Square& out) {
    if (text.size() != 2) return false;
    char f = text[0], r = text[1];
    if (f < 'a' || f > 'h' || r < '1' || r > '8') return false;
    out = Square{f - 'a', r - '1'};
    return true;
}

std::string square_name(const Square& sq) {
    char f = char('a' + sq.file); char r = char('1' + sq.rank);
    return std::string({f, r});
}

bool parse_move(const std::string& text, Move& out) {
    if (text.size() != 4) return false;
    Move m;
    if (!parse_square(text.substr(0, 2), m.from)) return false;
    if (!parse_square(text.substr(2, 2), m.to)) return false;
    out = m;
    return true;
}

std::string move_name(const Move& m) {
    return square_name(m.from) + square_name(m.to);
}

} // namespace kingcap

#pragma once
#include <string>
#include "kingcap/types.hpp"

namespace kingcap {

// "e2" <-> Square{4,1}. parse_square fails on anything but [a-h][1-8].
bool parse_square(const std::string& text, Square& out);
std::string square_name(const Square& sq);

// Four-character coordinate moves only: "e2e4". No promotion suffix.
bool parse_move(const std::string& text, Move& out);
std::string move_name(const Move& m);

} // namespace kingcap

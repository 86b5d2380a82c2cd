#pragma once
#include <string>
#include "kingcap/position.hpp"

// Text formats for positions.
//
// Board files (.chb) hold 8 rows, rank 8 first, one cell per character:
//   '.' empty, p r b q k black pieces, P R B Q K white pieces
// followed by a line starting with 'W' or 'B' for the side to move.
// Short rows are padded with empty squares. '\r' is ignored.

namespace kingcap {

bool parse_board(const std::string& text, Position& out, std::string* error = nullptr);
bool load_board_file(const std::string& path, Position& out, std::string* error = nullptr);

// Same layout as the board file, with rank labels and a file header:
//    abcdefgh
//
// 8  rbqk....
// ...
// It is White's turn
std::string render_board(const Position& pos);

// FEN subset: placement and optional side field; castling/ep/clocks are ignored
// on input and not written on output.
bool parse_fen(const std::string& fen, Position& out, std::string* error = nullptr);
std::string to_fen(const Position& pos);

char piece_char(const Piece& p);
bool piece_from_char(char c, Piece& out);

} // namespace kingcap

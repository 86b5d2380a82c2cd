#pragma once
#include <cstdint>

// Basic value types shared by every kingcap module.
// Squares use file 0..7 (a..h) and rank 0..7 (1..8); index = rank*8 + file.

namespace kingcap {

enum class Side : std::uint8_t { White, Black };

enum class PieceKind : std::uint8_t { Pawn, Rook, Bishop, Queen, King };

struct Piece {
    Side side = Side::White;
    PieceKind kind = PieceKind::Pawn;
};

inline bool operator==(const Piece& a, const Piece& b) { return a.side == b.side && a.kind == b.kind; }
inline bool operator!=(const Piece& a, const Piece& b) { return !(a == b); }

struct Square {
    int file = 0;
    int rank = 0;
};

inline bool operator==(const Square& a, const Square& b) { return a.file == b.file && a.rank == b.rank; }
inline bool operator!=(const Square& a, const Square& b) { return !(a == b); }

struct Move {
    Square from;
    Square to;
};

inline bool operator==(const Move& a, const Move& b) { return a.from == b.from && a.to == b.to; }
inline bool operator!=(const Move& a, const Move& b) { return !(a == b); }

inline Side opponent(Side s) { return s == Side::White ? Side::Black : Side::White; }

inline bool on_board(const Square& sq) { return sq.file >= 0 && sq.file < 8 && sq.rank >= 0 && sq.rank < 8; }
inline int square_index(const Square& sq) { return sq.rank * 8 + sq.file; }
inline Square square_at(int index) { return Square{index & 7, index >> 3}; }

} // namespace kingcap

#include "kingcap/board_text.hpp"
#include <cctype>
#include <fstream>
#include <sstream>

namespace kingcap {

namespace {

bool fail(std::string* error, const std::string& msg) {
    if (error) *error = msg;
    return false;
}

} // namespace

char piece_char(const Piece& p) {
    char c = '?';
    switch (p.kind) {
        case PieceKind::Pawn: c = 'p'; break;
        case PieceKind::Rook: c = 'r'; break;
        case PieceKind::Bishop: c = 'b'; break;
        case PieceKind::Queen: c = 'q'; break;
        case PieceKind::King: c = 'k'; break;
    }
    return p.side == Side::White ? (char)std::toupper((unsigned char)c) : c;
}

bool piece_from_char(char c, Piece& out) {
    Piece p;
    p.side = std::isupper((unsigned char)c) ? Side::White : Side::Black;
    switch (std::tolower((unsigned char)c)) {
        case 'p': p.kind = PieceKind::Pawn; break;
        case 'r': p.kind = PieceKind::Rook; break;
        case 'b': p.kind = PieceKind::Bishop; break;
        case 'q': p.kind = PieceKind::Queen; break;
        case 'k': p.kind = PieceKind::King; break;
        default: return false;
    }
    out = p;
    return true;
}

bool parse_board(const std::string& text, Position& out, std::string* error) {
    Position::Grid grid{};
    Side side = Side::White;
    int row = 0, col = 0; // row 0 is rank 8
    for (char c : text) {
        if (row == 8) {
            // first character of the line after the board names the side to move
            if (c == '\r' || c == '\n' || c == ' ') continue;
            if (c == 'W') side = Side::White;
            else if (c == 'B') side = Side::Black;
            else return fail(error, std::string("bad side-to-move marker '") + c + "'");
            break;
        }
        if (c == '\r') continue;
        if (c == '\n') { row++; col = 0; continue; }
        if (col >= 8) return fail(error, "row " + std::to_string(row + 1) + " has more than 8 cells");
        if (c != '.') {
            Piece p;
            if (!piece_from_char(c, p)) return fail(error, std::string("unknown piece '") + c + "' in row " + std::to_string(row + 1));
            grid[square_index(Square{col, 7 - row})] = p;
        }
        col++;
    }
    if (row < 7 || (row == 7 && col == 0)) return fail(error, "board has fewer than 8 rows");
    out = Position(side, grid);
    return true;
}

bool load_board_file(const std::string& path, Position& out, std::string* error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return fail(error, "cannot open " + path);
    std::ostringstream ss; ss << in.rdbuf();
    return parse_board(ss.str(), out, error);
}

std::string render_board(const Position& pos) {
    std::string s = "   abcdefgh\n\n";
    for (int r = 7; r >= 0; --r) {
        s += std::to_string(r + 1) + "  ";
        for (int f = 0; f < 8; ++f) {
            auto p = pos.piece_at(Square{f, r});
            s += p ? piece_char(*p) : '.';
        }
        s += '\n';
    }
    s += std::string("It is ") + (pos.side_to_move() == Side::White ? "White" : "Black") + "'s turn\n";
    return s;
}

bool parse_fen(const std::string& fen, Position& out, std::string* error) {
    std::istringstream ss(fen);
    std::string placement, stm;
    if (!(ss >> placement)) return fail(error, "empty FEN");
    ss >> stm; // optional; castling, ep and clocks are ignored
    Position::Grid grid{};
    int r = 7, f = 0;
    for (char c : placement) {
        if (c == '/') {
            if (f != 8) return fail(error, "rank " + std::to_string(r + 1) + " does not have 8 files");
            r--; f = 0;
            if (r < 0) return fail(error, "too many ranks");
            continue;
        }
        if (c >= '1' && c <= '8') { f += c - '0'; if (f > 8) return fail(error, "rank overflow"); continue; }
        Piece p;
        if (!piece_from_char(c, p)) return fail(error, std::string("unsupported piece '") + c + "'");
        if (f >= 8) return fail(error, "rank overflow");
        grid[square_index(Square{f, r})] = p;
        f++;
    }
    if (r != 0 || f != 8) return fail(error, "placement does not cover 8 ranks");
    Side side = Side::White;
    if (stm == "b") side = Side::Black;
    else if (!stm.empty() && stm != "w") return fail(error, "bad side to move '" + stm + "'");
    out = Position(side, grid);
    return true;
}

std::string to_fen(const Position& pos) {
    std::string s;
    for (int r = 7; r >= 0; --r) {
        int empty = 0;
        for (int f = 0; f < 8; ++f) {
            auto p = pos.piece_at(Square{f, r});
            if (!p) { empty++; continue; }
            if (empty) { s += char('0' + empty); empty = 0; }
            s += piece_char(*p);
        }
        if (empty) s += char('0' + empty);
        if (r) s += '/';
    }
    s += pos.side_to_move() == Side::White ? " w" : " b";
    return s;
}

} // namespace kingcap

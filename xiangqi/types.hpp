#pragma once

#include <cstdint>
#include <string>

namespace xiangqi {

static constexpr int ROWS = 10;
static constexpr int COLS = 9;
static constexpr int SQUARES = ROWS * COLS;

enum class Side : uint8_t { Red = 0, Black = 1 };

enum class PieceKind : uint8_t {
    General = 0,
    Advisor,
    Elephant,
    Horse,
    Chariot,
    Cannon,
    Soldier,
};

static constexpr int KIND_COUNT = 7;

// Row 0 is Black's back rank; Red starts on rows 6-9.
struct Coord {
    int row = -1;
    int col = -1;
};

inline bool operator==(const Coord& a, const Coord& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const Coord& a, const Coord& b) { return !(a == b); }

inline bool on_board(int row, int col) { return row >= 0 && row < ROWS && col >= 0 && col < COLS; }
inline bool on_board(const Coord& c) { return on_board(c.row, c.col); }
inline int sq_index(const Coord& c) { return c.row * COLS + c.col; }
inline Coord sq_coord(int sq) { return Coord{sq / COLS, sq % COLS}; }

inline Side opp(Side s) { return s == Side::Red ? Side::Black : Side::Red; }
inline int side_index(Side s) { return s == Side::Red ? 0 : 1; }
inline int kind_index(PieceKind k) { return (int)k; }

// Red advances toward row 0.
inline int forward_dir(Side s) { return s == Side::Red ? -1 : 1; }

inline bool in_palace(Side s, int row, int col) {
    if (col < 3 || col > 5) return false;
    return s == Side::Red ? (row >= 7 && row <= 9) : (row >= 0 && row <= 2);
}

// Own half of the river: Red rows 5-9, Black rows 0-4.
inline bool on_own_side(Side s, int row) {
    return s == Side::Red ? row >= 5 : row <= 4;
}

struct Piece {
    PieceKind kind = PieceKind::Soldier;
    Side side = Side::Red;
    Coord pos{};
    std::string name;
};

struct Move {
    Coord from{};
    Coord to{};
};

inline bool operator==(const Move& a, const Move& b) { return a.from == b.from && a.to == b.to; }
inline bool operator!=(const Move& a, const Move& b) { return !(a == b); }
inline bool valid_move(const Move& m) { return on_board(m.from) && on_board(m.to); }

std::string display_name(PieceKind kind, Side side);
std::string side_name(Side s);
std::string kind_name(PieceKind kind);
std::string coord_text(const Coord& c);

} // namespace xiangqi

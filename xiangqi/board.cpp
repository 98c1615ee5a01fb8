#include "board.hpp"

#include <algorithm>

namespace xiangqi {
namespace {

static const std::optional<Piece> k_empty;

static const char* const RED_NAMES[KIND_COUNT]   = {"帅", "仕", "相", "马", "车", "炮", "兵"};
static const char* const BLACK_NAMES[KIND_COUNT] = {"将", "士", "象", "马", "车", "炮", "卒"};

// Back rank, left to right from column 0.
static const PieceKind BACK_RANK[COLS] = {
    PieceKind::Chariot, PieceKind::Horse, PieceKind::Elephant, PieceKind::Advisor,
    PieceKind::General,
    PieceKind::Advisor, PieceKind::Elephant, PieceKind::Horse, PieceKind::Chariot,
};

} // namespace

std::string display_name(PieceKind kind, Side side) {
    int k = kind_index(kind);
    return side == Side::Red ? RED_NAMES[k] : BLACK_NAMES[k];
}

std::string side_name(Side s) { return s == Side::Red ? "red" : "black"; }

std::string kind_name(PieceKind kind) {
    switch (kind) {
        case PieceKind::General:  return "general";
        case PieceKind::Advisor:  return "advisor";
        case PieceKind::Elephant: return "elephant";
        case PieceKind::Horse:    return "horse";
        case PieceKind::Chariot:  return "chariot";
        case PieceKind::Cannon:   return "cannon";
        case PieceKind::Soldier:  return "soldier";
    }
    return "unknown";
}

std::string coord_text(const Coord& c) {
    return "(" + std::to_string(c.row) + "," + std::to_string(c.col) + ")";
}

const std::optional<Piece>& Board::at(const Coord& c) const {
    if (!on_board(c)) return k_empty;
    return cells_[sq_index(c)];
}

bool Board::place(PieceKind kind, Side side, const Coord& c) {
    if (!on_board(c)) return false;
    auto& cell = cells_[sq_index(c)];
    if (cell) return false;
    if (kind == PieceKind::General && find_general(side)) return false;
    cell = Piece{kind, side, c, display_name(kind, side)};
    count_++;
    return true;
}

std::optional<Piece> Board::remove(const Coord& c) {
    if (!on_board(c)) return std::nullopt;
    auto& cell = cells_[sq_index(c)];
    std::optional<Piece> out;
    out.swap(cell);
    if (out) count_--;
    return out;
}

std::optional<Piece> Board::move(const Coord& from, const Coord& to) {
    if (!on_board(from) || !on_board(to) || from == to) return std::nullopt;
    auto& src = cells_[sq_index(from)];
    if (!src) return std::nullopt;
    auto& dst = cells_[sq_index(to)];
    std::optional<Piece> captured;
    captured.swap(dst);
    if (captured) count_--;
    dst.swap(src);
    dst->pos = to;
    return captured;
}

bool Board::make_move(const Move& m, UndoMove& u) {
    if (!valid_move(m) || m.from == m.to) return false;
    if (!at(m.from)) return false;
    u.move = m;
    u.captured = move(m.from, m.to);
    return true;
}

void Board::unmake_move(const UndoMove& u) {
    auto& dst = cells_[sq_index(u.move.to)];
    auto& src = cells_[sq_index(u.move.from)];
    src.swap(dst);
    if (src) src->pos = u.move.from;
    if (u.captured) {
        dst = u.captured;
        count_++;
    }
}

void Board::clear() {
    for (auto& c : cells_) c.reset();
    count_ = 0;
}

void Board::setup_standard() {
    clear();
    for (int c = 0; c < COLS; c++) {
        place(BACK_RANK[c], Side::Black, Coord{0, c});
        place(BACK_RANK[c], Side::Red, Coord{9, c});
    }
    for (int c : {1, 7}) {
        place(PieceKind::Cannon, Side::Black, Coord{2, c});
        place(PieceKind::Cannon, Side::Red, Coord{7, c});
    }
    for (int c = 0; c < COLS; c += 2) {
        place(PieceKind::Soldier, Side::Black, Coord{3, c});
        place(PieceKind::Soldier, Side::Red, Coord{6, c});
    }
}

std::vector<Piece> Board::pieces() const {
    std::vector<Piece> out;
    out.reserve(count_);
    for (const auto& c : cells_)
        if (c) out.push_back(*c);
    return out;
}

std::vector<Piece> Board::pieces_of(Side side) const {
    std::vector<Piece> out;
    for (const auto& c : cells_)
        if (c && c->side == side) out.push_back(*c);
    return out;
}

std::vector<Piece> Board::pieces_of(PieceKind kind, Side side) const {
    std::vector<Piece> out;
    for (const auto& c : cells_)
        if (c && c->side == side && c->kind == kind) out.push_back(*c);
    return out;
}

std::optional<Coord> Board::find_general(Side side) const {
    for (const auto& c : cells_)
        if (c && c->kind == PieceKind::General && c->side == side) return c->pos;
    return std::nullopt;
}

bool Board::generals_facing() const {
    auto red = find_general(Side::Red);
    auto black = find_general(Side::Black);
    if (!red || !black || red->col != black->col) return false;
    int lo = std::min(red->row, black->row);
    int hi = std::max(red->row, black->row);
    for (int r = lo + 1; r < hi; r++)
        if (occupied(r, red->col)) return false;
    return true;
}

Board standard_board() {
    Board b;
    b.setup_standard();
    return b;
}

} // namespace xiangqi

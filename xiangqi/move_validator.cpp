#include "move_validator.hpp"

#include <cstdlib>

namespace xiangqi {
namespace {

static const int ORTHO[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
static const int DIAG[4][2]  = {{-1, -1}, {-1, 1}, {1, -1}, {1, 1}};
static const int KNIGHT[8][2] = {
    {-2, -1}, {-2, 1}, {2, -1}, {2, 1}, {-1, -2}, {1, -2}, {-1, 2}, {1, 2},
};

static bool general_ok(const Piece& p, int dr, int dc, const Coord& to) {
    if (std::abs(dr) + std::abs(dc) != 1) return false;
    return in_palace(p.side, to.row, to.col);
}

static bool advisor_ok(const Piece& p, int dr, int dc, const Coord& to) {
    if (std::abs(dr) != 1 || std::abs(dc) != 1) return false;
    return in_palace(p.side, to.row, to.col);
}

static bool elephant_ok(const Board& b, const Piece& p, int dr, int dc, const Coord& to) {
    if (std::abs(dr) != 2 || std::abs(dc) != 2) return false;
    if (!on_own_side(p.side, to.row)) return false;
    return !b.occupied(p.pos.row + dr / 2, p.pos.col + dc / 2);
}

static bool horse_ok(const Board& b, const Piece& p, int dr, int dc) {
    int ar = std::abs(dr), ac = std::abs(dc);
    if (!((ar == 1 && ac == 2) || (ar == 2 && ac == 1))) return false;
    // Leg square sits next to the origin along the long leg.
    int leg_r = p.pos.row + (ar == 2 ? dr / 2 : 0);
    int leg_c = p.pos.col + (ac == 2 ? dc / 2 : 0);
    return !b.occupied(leg_r, leg_c);
}

static bool chariot_ok(const Board& b, const Coord& from, const Coord& to) {
    return count_between(b, from, to) == 0;
}

static bool cannon_ok(const Board& b, const Coord& from, const Coord& to) {
    int between = count_between(b, from, to);
    if (between < 0) return false;
    return b.occupied(to.row, to.col) ? between == 1 : between == 0;
}

static bool soldier_ok(const Piece& p, int dr, int dc) {
    if (std::abs(dr) + std::abs(dc) != 1) return false;
    int fwd = forward_dir(p.side);
    if (dr == fwd) return true;
    if (dr == -fwd) return false;
    // Sideways once across the river.
    return !on_own_side(p.side, p.pos.row);
}

static void push_if(std::vector<Coord>& out, int row, int col) {
    if (on_board(row, col)) out.push_back(Coord{row, col});
}

} // namespace

int count_between(const Board& board, const Coord& a, const Coord& b) {
    if (a.row != b.row && a.col != b.col) return -1;
    if (a == b) return -1;
    int dr = (b.row > a.row) - (b.row < a.row);
    int dc = (b.col > a.col) - (b.col < a.col);
    int n = 0;
    for (int r = a.row + dr, c = a.col + dc; r != b.row || c != b.col; r += dr, c += dc)
        if (board.occupied(r, c)) n++;
    return n;
}

static bool shape_ok(const Board& board, const Piece& p, const Coord& from, const Coord& to) {
    int dr = to.row - from.row;
    int dc = to.col - from.col;
    switch (p.kind) {
        case PieceKind::General:  return general_ok(p, dr, dc, to);
        case PieceKind::Advisor:  return advisor_ok(p, dr, dc, to);
        case PieceKind::Elephant: return elephant_ok(board, p, dr, dc, to);
        case PieceKind::Horse:    return horse_ok(board, p, dr, dc);
        case PieceKind::Chariot:  return chariot_ok(board, from, to);
        case PieceKind::Cannon:   return cannon_ok(board, from, to);
        case PieceKind::Soldier:  return soldier_ok(p, dr, dc);
    }
    return false;
}

bool is_valid_move(const Board& board, const Coord& from, const Coord& to) {
    if (!on_board(from) || !on_board(to) || from == to) return false;
    const auto& mover = board.at(from);
    if (!mover) return false;
    const auto& target = board.at(to);
    if (target && target->side == mover->side) return false;
    return shape_ok(board, *mover, from, to);
}

bool defends(const Board& board, const Coord& from, const Coord& to) {
    if (!on_board(from) || !on_board(to) || from == to) return false;
    const auto& mover = board.at(from);
    const auto& target = board.at(to);
    if (!mover || !target || target->side != mover->side) return false;
    return shape_ok(board, *mover, from, to);
}

std::vector<Coord> candidate_destinations(const Board& board, const Coord& from) {
    std::vector<Coord> out;
    const auto& mover = board.at(from);
    if (!mover) return out;
    int r = from.row, c = from.col;
    switch (mover->kind) {
        case PieceKind::General:
        case PieceKind::Soldier:
            for (auto& d : ORTHO) push_if(out, r + d[0], c + d[1]);
            break;
        case PieceKind::Advisor:
            for (auto& d : DIAG) push_if(out, r + d[0], c + d[1]);
            break;
        case PieceKind::Elephant:
            for (auto& d : DIAG) push_if(out, r + 2 * d[0], c + 2 * d[1]);
            break;
        case PieceKind::Horse:
            for (auto& d : KNIGHT) push_if(out, r + d[0], c + d[1]);
            break;
        case PieceKind::Chariot:
        case PieceKind::Cannon:
            for (int i = 0; i < ROWS; i++) if (i != r) out.push_back(Coord{i, c});
            for (int j = 0; j < COLS; j++) if (j != c) out.push_back(Coord{r, j});
            break;
    }
    return out;
}

std::vector<Coord> valid_destinations(const Board& board, const Coord& from) {
    std::vector<Coord> out;
    for (const auto& to : candidate_destinations(board, from))
        if (is_valid_move(board, from, to)) out.push_back(to);
    return out;
}

bool attacks(const Board& board, const Coord& from, const Coord& target) {
    return is_valid_move(board, from, target);
}

bool in_check(const Board& board, Side side) {
    auto g = board.find_general(side);
    if (!g) return false;
    if (board.generals_facing()) return true;
    for (const auto& p : board.pieces_of(opp(side)))
        if (attacks(board, p.pos, *g)) return true;
    return false;
}

void generate_moves(Board& board, Side side, std::vector<Move>& out) {
    out.clear();
    for (const auto& p : board.pieces_of(side)) {
        for (const auto& to : valid_destinations(board, p.pos)) {
            Move m{p.pos, to};
            UndoMove u;
            if (!board.make_move(m, u)) continue;
            bool facing = board.generals_facing();
            board.unmake_move(u);
            if (!facing) out.push_back(m);
        }
    }
}

std::vector<Move> legal_moves(const Board& board, Side side) {
    std::vector<Move> out;
    Board scratch = board;
    generate_moves(scratch, side, out);
    return out;
}

bool is_legal_move(const Board& board, Side side, const Move& m) {
    const auto& p = board.at(m.from);
    if (!p || p->side != side) return false;
    if (!is_valid_move(board, m.from, m.to)) return false;
    Board scratch = board;
    UndoMove u;
    if (!scratch.make_move(m, u)) return false;
    return !scratch.generals_facing();
}

} // namespace xiangqi

#include "evaluate.hpp"

#include "move_validator.hpp"

#include <algorithm>
#include <cstdlib>

namespace xiangqi {
namespace {

static const int PIECE_VALUES[KIND_COUNT] = {
    100000, // General
    200,    // Advisor
    200,    // Elephant
    450,    // Horse
    1000,   // Chariot
    500,    // Cannon
    150,    // Soldier
};

static const int SOLDIER_CROSSED_BONUS = 70;
static const int MOBILITY_WEIGHT = 8;
static const int PROTECTION_WEIGHT = 20;
static const int CENTER_WEIGHT = 25;
static const int CHECK_PATH_WEIGHT = 30;
static const int CHECK_PATH_CAP = 5;
static const int AGGRESSION_WEIGHT = 25;

static bool crossed_river(Side s, int row) { return !on_own_side(s, row); }

static int manhattan(const Coord& a, const Coord& b) {
    return std::abs(a.row - b.row) + std::abs(a.col - b.col);
}

// Own pieces met along each ray before an enemy stops it.
static int count_screens(const Board& b, const Piece& p) {
    static const int DIRS[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
    int n = 0;
    for (auto& d : DIRS) {
        for (int r = p.pos.row + d[0], c = p.pos.col + d[1]; on_board(r, c); r += d[0], c += d[1]) {
            const auto& q = b.at(r, c);
            if (!q) continue;
            if (q->side != p.side) break;
            n++;
        }
    }
    return n;
}

static int horse_active_squares(const Board& b, const Piece& p) {
    static const int JUMPS[8][2] = {
        {-2, -1}, {-2, 1}, {-1, -2}, {-1, 2}, {1, -2}, {1, 2}, {2, -1}, {2, 1},
    };
    int n = 0;
    for (auto& j : JUMPS) {
        int tr = p.pos.row + j[0], tc = p.pos.col + j[1];
        int lr = p.pos.row + (std::abs(j[0]) == 2 ? j[0] / 2 : 0);
        int lc = p.pos.col + (std::abs(j[1]) == 2 ? j[1] / 2 : 0);
        if (on_board(tr, tc) && !b.occupied(lr, lc)) n++;
    }
    return n;
}

static bool elephant_connected(const Board& b, const Piece& p) {
    static const int EYES[4][2] = {{-1, -1}, {-1, 1}, {1, -1}, {1, 1}};
    for (auto& e : EYES) {
        int r = p.pos.row + e[0], c = p.pos.col + e[1];
        if (on_board(r, c) && !b.occupied(r, c)) return true;
    }
    return false;
}

static int positional_bonus(const Board& b, const Piece& p) {
    int row = p.pos.row, col = p.pos.col;
    bool red = p.side == Side::Red;
    int bonus = 0;
    switch (p.kind) {
        case PieceKind::General:
            if (row == (red ? 9 : 0)) {
                if (col == 4) bonus += 50;
                else if (col >= 3 && col <= 5) bonus += 30;
            }
            break;
        case PieceKind::Soldier:
            if (crossed_river(p.side, row)) {
                bonus += SOLDIER_CROSSED_BONUS;
                if (red ? row < 3 : row > 6) bonus += 50;
            }
            if (col == 3 || col == 5) bonus += 20;
            break;
        case PieceKind::Cannon:
            if (col == 4) bonus += 30;
            bonus += count_screens(b, p) * 15;
            break;
        case PieceKind::Horse:
            bonus += horse_active_squares(b, p) * 20;
            if (row >= 3 && row <= 6 && col >= 2 && col <= 6) bonus += 30;
            break;
        case PieceKind::Chariot:
            if (row == (red ? 7 : 2)) bonus += 50;
            if (row == (red ? 8 : 1)) bonus += 80;
            if (row == (red ? 4 : 5)) bonus += 40;
            break;
        case PieceKind::Advisor: {
            auto g = b.find_general(p.side);
            if (g && std::abs(row - g->row) <= 1 && std::abs(col - g->col) <= 1) bonus += 50;
            break;
        }
        case PieceKind::Elephant:
            if (elephant_connected(b, p)) bonus += 30;
            break;
    }
    return bonus;
}

static int coordination(const Piece& p, const std::vector<Piece>& allies) {
    if (allies.size() <= 1) return 0;
    int total = 0;
    for (const auto& a : allies)
        if (a.pos != p.pos) total += manhattan(a.pos, p.pos);
    double avg = (double)total / (double)(allies.size() - 1);
    double s = 5.0 - std::abs(avg - 5.0);
    return s > 0 ? (int)(s * 2) : 0;
}

// 500 for a direct attack on the General, else 100 per guarded palace
// square next to it, scanning until the first attacker is found.
static int general_threat(const Board& b, Side attacker) {
    auto g = b.find_general(opp(attacker));
    if (!g) return 0;
    static const int NEAR[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
    int bonus = 0;
    for (const auto& p : b.pieces_of(attacker)) {
        if (is_valid_move(b, p.pos, *g)) {
            bonus += 500;
            break;
        }
        for (auto& n : NEAR) {
            Coord sq{g->row + n[0], g->col + n[1]};
            if (!on_board(sq) || !in_palace(opp(attacker), sq.row, sq.col)) continue;
            if (is_valid_move(b, p.pos, sq)) bonus += 100;
        }
    }
    return bonus;
}

static int protected_count(const Board& b, const std::vector<Piece>& pieces) {
    int n = 0;
    for (const auto& p : pieces)
        for (const auto& ally : pieces)
            if (ally.pos != p.pos && defends(b, ally.pos, p.pos)) {
                n++;
                break;
            }
    return n;
}

static int center_control(const Board& b, const std::vector<Piece>& pieces) {
    int n = 0;
    for (int r = 3; r <= 6; r++)
        for (int c = 3; c <= 5; c++)
            for (const auto& p : pieces)
                if (is_valid_move(b, p.pos, Coord{r, c})) {
                    n++;
                    break;
                }
    return n;
}

// Distinct moves after which some attacker hits the enemy General.
static int checking_paths(const Board& b, Side attacker) {
    if (!b.find_general(opp(attacker))) return 0;
    Board scratch = b;
    int paths = 0;
    for (const auto& p : b.pieces_of(attacker)) {
        for (const auto& to : valid_destinations(b, p.pos)) {
            UndoMove u;
            if (!scratch.make_move(Move{p.pos, to}, u)) continue;
            auto g = scratch.find_general(opp(attacker));
            bool hit = false;
            if (g)
                for (const auto& q : scratch.pieces_of(attacker))
                    if (is_valid_move(scratch, q.pos, *g)) { hit = true; break; }
            scratch.unmake_move(u);
            if (hit && ++paths >= CHECK_PATH_CAP) return paths;
        }
    }
    return paths;
}

// Counted in half points.
static int aggression_halves(const std::vector<Piece>& pieces, Side attacker) {
    int halves = 0;
    for (const auto& p : pieces) {
        int row = p.pos.row;
        if (crossed_river(attacker, row)) {
            switch (p.kind) {
                case PieceKind::Chariot:
                case PieceKind::Cannon:  halves += 6; break;
                case PieceKind::Horse:   halves += 4; break;
                case PieceKind::Soldier: halves += 2; break;
                default: break;
            }
        } else if (attacker == Side::Red ? row <= 6 : row >= 3) {
            halves += 1;
        }
    }
    return halves;
}

static int side_score(const Board& b, Side side, bool extended) {
    std::vector<Piece> pieces = b.pieces_of(side);
    auto enemy_general = b.find_general(opp(side));
    int total = 0;
    int positional = 0;
    for (const auto& p : pieces) {
        total += PIECE_VALUES[kind_index(p.kind)];
        if (p.kind == PieceKind::Soldier && crossed_river(side, p.pos.row)) {
            total += SOLDIER_CROSSED_BONUS;
            if (enemy_general) total += std::max(0, (10 - manhattan(*enemy_general, p.pos)) * 15);
        }
        positional += positional_bonus(b, p);
        total += (int)valid_destinations(b, p.pos).size() * MOBILITY_WEIGHT;
        total += coordination(p, pieces);
    }
    total += positional * 3 / 2;
    total += general_threat(b, side) * 3 / 2;
    total += protected_count(b, pieces) * PROTECTION_WEIGHT;
    total += center_control(b, pieces) * CENTER_WEIGHT;
    if (extended) {
        total += checking_paths(b, side) * CHECK_PATH_WEIGHT;
        total += aggression_halves(pieces, side) * AGGRESSION_WEIGHT / 2;
    }
    return total;
}

} // namespace

int piece_value(PieceKind kind) { return PIECE_VALUES[kind_index(kind)]; }

int evaluate(const Board& board, Side perspective, bool extended) {
    if (!board.find_general(opp(perspective))) return MATE_SCORE;
    if (!board.find_general(perspective)) return -MATE_SCORE;
    return side_score(board, perspective, extended) - side_score(board, opp(perspective), extended);
}

// ── Phase heuristics ──────────────────────────────────────────────────────

bool is_opening_phase(const Board& board) {
    int moved = 0;
    for (const auto& p : board.pieces()) {
        bool red = p.side == Side::Red;
        int row = p.pos.row, col = p.pos.col;
        switch (p.kind) {
            case PieceKind::Soldier:
                if (row != (red ? 6 : 3)) moved++;
                break;
            case PieceKind::Cannon:
                if (row != (red ? 7 : 2) || (col != 1 && col != 7)) moved++;
                break;
            case PieceKind::Horse:
            case PieceKind::Chariot:
                if (row != (red ? 9 : 0)) moved++;
                break;
            default:
                break;
        }
    }
    return moved < 6;
}

bool is_endgame_phase(const Board& board) { return board.piece_count() < 12; }

std::optional<Move> opening_pick(const Board& board, Side side, const std::vector<Move>& moves) {
    int best_score = 2;
    std::optional<Move> best;
    int home_row = side == Side::Red ? 9 : 0;
    int cannon_row = side == Side::Red ? 7 : 2;
    for (const auto& m : moves) {
        const auto& p = board.at(m.from);
        if (!p) continue;
        int score = 0;
        if (p->kind == PieceKind::Horse || p->kind == PieceKind::Cannon) {
            if (m.to.col >= 2 && m.to.col <= 6) score += 5 - std::abs(m.to.col - 4);
            if (p->kind == PieceKind::Horse && m.from.row == home_row) score += 2;
            if (p->kind == PieceKind::Cannon && m.from.row == cannon_row) score += 2;
        }
        if (p->kind == PieceKind::Soldier && m.from.col % 2 == 0) {
            score += 2;
            if ((m.to.row - m.from.row) * forward_dir(side) > 0) score += 1;
        }
        // Strictly greater keeps the first of equal scores.
        if (score > best_score) {
            best_score = score;
            best = m;
        }
    }
    return best;
}

std::optional<Move> endgame_pick(const Board& board, Side side, const std::vector<Move>& moves) {
    auto g = board.find_general(opp(side));
    if (!g) return std::nullopt;

    Board scratch = board;
    for (const auto& m : moves) {
        if (m.to == *g) return m;
        UndoMove u;
        if (!scratch.make_move(m, u)) continue;
        bool checks = false;
        auto eg = scratch.find_general(opp(side));
        if (eg)
            for (const auto& q : scratch.pieces_of(side))
                if (is_valid_move(scratch, q.pos, *eg)) { checks = true; break; }
        scratch.unmake_move(u);
        if (checks) return m;
    }

    std::optional<Move> best;
    int min_dist = 1 << 30;
    for (const auto& m : moves) {
        int d = manhattan(m.to, *g);
        if (d < min_dist) {
            min_dist = d;
            best = m;
        }
    }
    if (best && min_dist <= 3) return best;
    return std::nullopt;
}

} // namespace xiangqi

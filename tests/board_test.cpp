#include "xiangqi/board.hpp"
#include "xiangqi/move_validator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>

using namespace xiangqi;

namespace {

bool has_move(const std::vector<Move>& moves, Coord from, Coord to) {
    return std::find(moves.begin(), moves.end(), Move{from, to}) != moves.end();
}

} // namespace

TEST(Board, StandardLayout) {
    Board b = standard_board();
    EXPECT_EQ(b.piece_count(), 32);
    EXPECT_EQ(b.pieces_of(Side::Red).size(), 16u);
    EXPECT_EQ(b.pieces_of(Side::Black).size(), 16u);

    ASSERT_TRUE(b.at(9, 4));
    EXPECT_EQ(b.at(9, 4)->kind, PieceKind::General);
    EXPECT_EQ(b.at(9, 4)->name, "帅");
    ASSERT_TRUE(b.at(0, 4));
    EXPECT_EQ(b.at(0, 4)->name, "将");
    ASSERT_TRUE(b.at(7, 1));
    EXPECT_EQ(b.at(7, 1)->kind, PieceKind::Cannon);
    ASSERT_TRUE(b.at(3, 8));
    EXPECT_EQ(b.at(3, 8)->name, "卒");
    EXPECT_FALSE(b.generals_facing());
}

TEST(Board, PlaceRejectsBadSquares) {
    Board b;
    EXPECT_TRUE(b.place(PieceKind::General, Side::Red, Coord{9, 4}));
    EXPECT_FALSE(b.place(PieceKind::Chariot, Side::Red, Coord{9, 4}));
    EXPECT_FALSE(b.place(PieceKind::General, Side::Red, Coord{8, 4}));
    EXPECT_FALSE(b.place(PieceKind::Chariot, Side::Black, Coord{10, 0}));
    EXPECT_FALSE(b.at(-1, 3));
    EXPECT_EQ(b.piece_count(), 1);
}

TEST(Board, MakeUnmakeRestoresCapture) {
    Board b = standard_board();
    // Red cannon takes the black horse over the screen on row 0.
    UndoMove u;
    ASSERT_TRUE(b.make_move(Move{Coord{7, 1}, Coord{0, 1}}, u));
    ASSERT_TRUE(u.captured);
    EXPECT_EQ(u.captured->kind, PieceKind::Horse);
    EXPECT_EQ(b.piece_count(), 31);
    b.unmake_move(u);
    EXPECT_EQ(b.piece_count(), 32);
    ASSERT_TRUE(b.at(0, 1));
    EXPECT_EQ(b.at(0, 1)->side, Side::Black);
    ASSERT_TRUE(b.at(7, 1));
    EXPECT_EQ(b.at(7, 1)->kind, PieceKind::Cannon);
}

TEST(Validator, OpeningMoveCount) {
    Board b = standard_board();
    EXPECT_EQ(legal_moves(b, Side::Red).size(), 44u);
    EXPECT_EQ(legal_moves(b, Side::Black).size(), 44u);
}

TEST(Validator, SoldierSidewaysOnlyAfterRiver) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{9, 4});
    b.place(PieceKind::General, Side::Black, Coord{0, 3});
    b.place(PieceKind::Soldier, Side::Red, Coord{6, 2});
    b.place(PieceKind::Soldier, Side::Red, Coord{4, 6});

    EXPECT_TRUE(is_valid_move(b, Coord{6, 2}, Coord{5, 2}));
    EXPECT_FALSE(is_valid_move(b, Coord{6, 2}, Coord{6, 1}));
    EXPECT_FALSE(is_valid_move(b, Coord{6, 2}, Coord{7, 2}));

    EXPECT_TRUE(is_valid_move(b, Coord{4, 6}, Coord{4, 5}));
    EXPECT_TRUE(is_valid_move(b, Coord{4, 6}, Coord{4, 7}));
    EXPECT_TRUE(is_valid_move(b, Coord{4, 6}, Coord{3, 6}));
    EXPECT_FALSE(is_valid_move(b, Coord{4, 6}, Coord{5, 6}));
}

TEST(Validator, CannonNeedsExactlyOneScreenToCapture) {
    Board b = standard_board();
    EXPECT_TRUE(is_valid_move(b, Coord{7, 1}, Coord{0, 1}));  // over the black cannon
    EXPECT_TRUE(is_valid_move(b, Coord{7, 1}, Coord{3, 1}));  // plain slide
    EXPECT_FALSE(is_valid_move(b, Coord{7, 1}, Coord{2, 1})); // no screen before the cannon
    EXPECT_TRUE(is_valid_move(b, Coord{7, 1}, Coord{7, 4}));
    EXPECT_FALSE(is_valid_move(b, Coord{7, 1}, Coord{9, 1})); // own horse
}

TEST(Validator, ElephantStaysHomeAndRespectsEye) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{9, 4});
    b.place(PieceKind::General, Side::Black, Coord{0, 3});
    b.place(PieceKind::Elephant, Side::Red, Coord{5, 2});
    EXPECT_FALSE(is_valid_move(b, Coord{5, 2}, Coord{3, 4}));
    EXPECT_TRUE(is_valid_move(b, Coord{5, 2}, Coord{7, 4}));
    b.place(PieceKind::Soldier, Side::Black, Coord{6, 3});
    EXPECT_FALSE(is_valid_move(b, Coord{5, 2}, Coord{7, 4}));
}

TEST(Validator, HorseLegBlocks) {
    Board b = standard_board();
    EXPECT_TRUE(is_valid_move(b, Coord{9, 1}, Coord{7, 2}));
    EXPECT_TRUE(is_valid_move(b, Coord{9, 1}, Coord{7, 0}));
    b.place(PieceKind::Soldier, Side::Red, Coord{8, 1});
    EXPECT_FALSE(is_valid_move(b, Coord{9, 1}, Coord{7, 2}));
    EXPECT_FALSE(is_valid_move(b, Coord{9, 1}, Coord{7, 0}));
}

TEST(Validator, GeneralAndAdvisorStayInPalace) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{7, 3});
    b.place(PieceKind::General, Side::Black, Coord{0, 5});
    b.place(PieceKind::Advisor, Side::Red, Coord{8, 4});
    EXPECT_FALSE(is_valid_move(b, Coord{7, 3}, Coord{6, 3}));
    EXPECT_FALSE(is_valid_move(b, Coord{7, 3}, Coord{7, 2}));
    EXPECT_TRUE(is_valid_move(b, Coord{7, 3}, Coord{7, 4}));
    EXPECT_FALSE(is_valid_move(b, Coord{7, 3}, Coord{8, 4})); // diagonal
    EXPECT_TRUE(is_valid_move(b, Coord{8, 4}, Coord{9, 5}));
    EXPECT_FALSE(is_valid_move(b, Coord{8, 4}, Coord{8, 5}));
}

TEST(Validator, FlyingGeneralMovesAreFiltered) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{9, 4});
    b.place(PieceKind::General, Side::Black, Coord{0, 4});
    b.place(PieceKind::Chariot, Side::Red, Coord{5, 4});

    auto moves = legal_moves(b, Side::Red);
    EXPECT_FALSE(has_move(moves, Coord{5, 4}, Coord{5, 0}));
    EXPECT_TRUE(has_move(moves, Coord{5, 4}, Coord{1, 4}));
    EXPECT_FALSE(is_legal_move(b, Side::Red, Move{Coord{5, 4}, Coord{5, 0}}));
    // The validator alone still accepts the geometry.
    EXPECT_TRUE(is_valid_move(b, Coord{5, 4}, Coord{5, 0}));

    std::vector<Move> inplace;
    generate_moves(b, Side::Red, inplace);
    EXPECT_EQ(inplace.size(), moves.size());
    EXPECT_EQ(b.piece_count(), 3);
}

TEST(Validator, CheckDetection) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{9, 4});
    b.place(PieceKind::General, Side::Black, Coord{0, 3});
    b.place(PieceKind::Chariot, Side::Red, Coord{5, 3});
    EXPECT_TRUE(in_check(b, Side::Black));
    EXPECT_FALSE(in_check(b, Side::Red));
    EXPECT_TRUE(attacks(b, Coord{5, 3}, Coord{0, 3}));
    EXPECT_EQ(count_between(b, Coord{5, 3}, Coord{0, 3}), 0);
    EXPECT_EQ(count_between(b, Coord{5, 3}, Coord{0, 4}), -1);
}

TEST(Validator, ValidDestinationsSubsetOfCandidates) {
    Board b = standard_board();
    for (const auto& p : b.pieces()) {
        auto cands = candidate_destinations(b, p.pos);
        for (const auto& to : valid_destinations(b, p.pos))
            EXPECT_NE(std::find(cands.begin(), cands.end(), to), cands.end()) << p.name;
    }
}

TEST(Validator, DefendsFriendlyPiece) {
    Board b = standard_board();
    // The red chariot on (9,0) guards the horse beside it.
    EXPECT_TRUE(defends(b, Coord{9, 0}, Coord{9, 1}));
    EXPECT_FALSE(defends(b, Coord{9, 0}, Coord{0, 0}));
}

TEST(Validator, RandomGamesKeepInvariants) {
    std::mt19937_64 rng(11);
    for (int game = 0; game < 4; game++) {
        Board b = standard_board();
        Side side = Side::Red;
        for (int ply = 0; ply < 120; ply++) {
            auto moves = legal_moves(b, side);
            if (moves.empty()) break;
            size_t own = b.pieces_of(side).size();
            size_t enemy = b.pieces_of(opp(side)).size();
            for (const auto& m : moves) {
                const auto& p = b.at(m.from);
                ASSERT_TRUE(p);
                if (p->kind == PieceKind::Soldier) {
                    int dr = m.to.row - m.from.row;
                    EXPECT_NE(dr * forward_dir(side), -1);
                    if (on_own_side(side, m.from.row)) EXPECT_EQ(m.to.col, m.from.col);
                }
                bool capture = b.at(m.to).has_value();
                UndoMove u;
                ASSERT_TRUE(b.make_move(m, u));
                EXPECT_FALSE(b.generals_facing());
                EXPECT_EQ(b.pieces_of(side).size(), own);
                EXPECT_EQ(b.pieces_of(opp(side)).size(), capture ? enemy - 1 : enemy);
                b.unmake_move(u);
            }
            UndoMove u;
            b.make_move(moves[std::uniform_int_distribution<size_t>(0, moves.size() - 1)(rng)], u);
            if (!b.find_general(Side::Red) || !b.find_general(Side::Black)) break;
            side = opp(side);
        }
    }
}

#include "xiangqi/game.hpp"

#include <gtest/gtest.h>

using namespace xiangqi;

namespace {

constexpr int64_t ALICE = 101;
constexpr int64_t BOB = 202;

} // namespace

TEST(GameSession, NewGameState) {
    GameSession g("g1", ALICE, BOB, "chat", GameConfig{Difficulty::Easy});
    EXPECT_TRUE(g.playing());
    EXPECT_EQ(g.current(), Side::Red);
    EXPECT_TRUE(g.history().empty());
    EXPECT_EQ(g.board().piece_count(), 32);
    EXPECT_EQ(g.player_side(ALICE), Side::Red);
    EXPECT_EQ(g.player_side(BOB), Side::Black);
    EXPECT_FALSE(g.player_side(303));
    EXPECT_FALSE(g.has_ai());

    GameSnapshot s = g.snapshot();
    EXPECT_EQ(s.id, "g1");
    EXPECT_EQ(s.difficulty, Difficulty::Easy);
    ASSERT_TRUE(s.cells[sq_index(Coord{9, 4})]);
    EXPECT_EQ(s.cells[sq_index(Coord{9, 4})]->name, "帅");
    EXPECT_FALSE(s.cells[sq_index(Coord{5, 4})]);
    EXPECT_FALSE(s.last_move);
}

TEST(GameSession, NotationMoveAdvancesTurn) {
    GameSession g("g1", ALICE, BOB, "chat", GameConfig{});
    MoveResult r = g.move_by_notation("炮二平五");
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.notation, "炮二平五");
    EXPECT_EQ(r.move.from, (Coord{7, 7}));
    EXPECT_EQ(r.move.to, (Coord{7, 4}));
    EXPECT_FALSE(r.captured);
    EXPECT_EQ(g.current(), Side::Black);
    ASSERT_EQ(g.history().size(), 1u);
    EXPECT_EQ(g.history()[0], "炮二平五");

    GameSnapshot s = g.snapshot();
    ASSERT_TRUE(s.last_notation);
    EXPECT_EQ(*s.last_notation, "炮二平五");
    EXPECT_NE(g.status_text().find("black to move"), std::string::npos);

    r = g.move_by_notation("马8进7");
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(g.current(), Side::Red);
}

TEST(GameSession, RejectionsCarryCodes) {
    GameSession g("g1", ALICE, BOB, "chat", GameConfig{});
    EXPECT_EQ(g.move(Coord{5, 4}, Coord{4, 4}).code, ErrorCode::PieceNotFound);
    EXPECT_EQ(g.move(Coord{3, 0}, Coord{4, 0}).code, ErrorCode::NotYourTurn);
    EXPECT_EQ(g.move(Coord{9, 0}, Coord{9, 1}).code, ErrorCode::IllegalMove);
    EXPECT_EQ(g.move(Coord{9, 0}, Coord{10, 0}).code, ErrorCode::IllegalMove);

    MoveResult bad = g.move_by_notation("炮二跳五");
    EXPECT_EQ(bad.code, ErrorCode::InvalidNotation);
    EXPECT_EQ(bad.failed_token, NotationToken::Format);
    EXPECT_TRUE(g.history().empty());
    EXPECT_EQ(g.current(), Side::Red);
}

TEST(GameSession, FlyingGeneralIsRejected) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{9, 4});
    b.place(PieceKind::General, Side::Black, Coord{0, 4});
    b.place(PieceKind::Chariot, Side::Red, Coord{5, 4});
    b.place(PieceKind::Chariot, Side::Black, Coord{0, 0});
    GameSession g("g2", ALICE, BOB, "chat", GameConfig{}, b, Side::Red);

    MoveResult r = g.move(Coord{5, 4}, Coord{5, 0});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::IllegalMove);
    ASSERT_TRUE(g.board().at(5, 4));
    EXPECT_EQ(g.board().at(5, 4)->kind, PieceKind::Chariot);
    EXPECT_EQ(g.current(), Side::Red);
    EXPECT_TRUE(g.history().empty());
}

TEST(GameSession, CapturingGeneralEndsGame) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{9, 4});
    b.place(PieceKind::General, Side::Black, Coord{0, 3});
    b.place(PieceKind::Chariot, Side::Red, Coord{5, 3});
    GameSession g("g3", ALICE, BOB, "chat", GameConfig{}, b, Side::Red);

    MoveResult r = g.move(Coord{5, 3}, Coord{0, 3});
    ASSERT_TRUE(r.ok) << r.message;
    ASSERT_TRUE(r.captured);
    EXPECT_EQ(r.captured->kind, PieceKind::General);
    EXPECT_TRUE(r.game_over);
    EXPECT_EQ(r.winner, Side::Red);
    EXPECT_EQ(g.status(), GameStatus::Finished);
    EXPECT_EQ(g.move(Coord{9, 4}, Coord{8, 4}).code, ErrorCode::GameAlreadyFinished);
}

TEST(GameSession, ResignOnlyWhilePlaying) {
    GameSession g("g1", ALICE, BOB, "chat", GameConfig{});
    EXPECT_FALSE(g.resign(303));
    EXPECT_TRUE(g.resign(BOB));
    EXPECT_EQ(g.winner(), Side::Red);
    EXPECT_FALSE(g.playing());
    EXPECT_FALSE(g.resign(ALICE));
    EXPECT_EQ(g.winner(), Side::Red);
}

TEST(GameSession, ForfeitAndAbort) {
    GameSession g("g1", ALICE, AI_PLAYER, "chat", GameConfig{});
    EXPECT_TRUE(g.has_ai());
    EXPECT_FALSE(g.is_ai_turn());
    ASSERT_TRUE(g.move_by_notation("兵三进一").ok);
    EXPECT_TRUE(g.is_ai_turn());
    g.forfeit(Side::Black, "engine found no move");
    EXPECT_EQ(g.winner(), Side::Red);
    EXPECT_FALSE(g.is_ai_turn());

    GameSession h("g2", ALICE, BOB, "chat", GameConfig{});
    h.abort("ended");
    EXPECT_FALSE(h.playing());
    EXPECT_FALSE(h.winner());
}

TEST(GameSession, MissingGeneralClosesSession) {
    Board b;
    b.place(PieceKind::General, Side::Red, Coord{9, 4});
    b.place(PieceKind::Chariot, Side::Red, Coord{5, 3});
    GameSession g("g4", ALICE, BOB, "chat", GameConfig{}, b, Side::Red);
    MoveResult r = g.move(Coord{5, 3}, Coord{4, 3});
    EXPECT_EQ(r.code, ErrorCode::CorruptState);
    EXPECT_FALSE(g.playing());
    EXPECT_EQ(g.winner(), Side::Red);
}

TEST(GameSession, ActivityTimeFollowsMoves) {
    auto t0 = Clock::time_point(std::chrono::hours(1000));
    GameSession g("g1", ALICE, BOB, "chat", GameConfig{}, t0);
    EXPECT_EQ(g.last_activity(), t0);
    auto t1 = t0 + std::chrono::minutes(3);
    ASSERT_TRUE(g.move_by_notation("炮二平五", t1).ok);
    EXPECT_EQ(g.last_activity(), t1);
    EXPECT_EQ(g.created_at(), t0);
}

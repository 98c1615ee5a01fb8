#include "xiangqi/directory.hpp"

#include <gtest/gtest.h>

using namespace xiangqi;

namespace {

constexpr int64_t ALICE = 101;
constexpr int64_t BOB = 202;
constexpr int64_t CAROL = 303;

const Clock::time_point T0 = Clock::time_point(std::chrono::hours(500000));

} // namespace

TEST(SessionDirectory, IdsAreUniqueAndPrefixed) {
    std::string a = make_game_id(T0);
    std::string b = make_game_id(T0);
    EXPECT_EQ(a.rfind("game_", 0), 0u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), b.size());
}

TEST(SessionDirectory, RefusesSecondActiveGame) {
    SessionDirectory dir;
    SessionPtr g = dir.create_game(ALICE, BOB, "chat", GameConfig{}, T0);
    ASSERT_NE(g, nullptr);
    EXPECT_EQ(dir.create_game(ALICE, CAROL, "chat", GameConfig{}, T0), nullptr);
    EXPECT_EQ(dir.create_game(CAROL, BOB, "chat", GameConfig{}, T0), nullptr);

    // The engine may play any number of games.
    SessionPtr ai1 = dir.create_game(CAROL, AI_PLAYER, "chat", GameConfig{}, T0);
    ASSERT_NE(ai1, nullptr);
    EXPECT_EQ(dir.size(), 2u);

    {
        std::lock_guard<std::mutex> lk(g->mutex());
        ASSERT_TRUE(g->resign(BOB));
    }
    EXPECT_NE(dir.create_game(ALICE, BOB, "chat", GameConfig{}, T0), nullptr);
}

TEST(SessionDirectory, Lookups) {
    SessionDirectory dir;
    SessionPtr g = dir.create_game(ALICE, BOB, "room", GameConfig{}, T0);
    ASSERT_NE(g, nullptr);

    EXPECT_EQ(dir.get(g->id()), g);
    EXPECT_EQ(dir.get("missing"), nullptr);
    EXPECT_EQ(dir.active_game_of(BOB), g);
    EXPECT_EQ(dir.active_game_of(CAROL), nullptr);
    EXPECT_EQ(dir.turn_game_of(ALICE), g);
    EXPECT_EQ(dir.turn_game_of(BOB), nullptr);
    EXPECT_TRUE(dir.are_players_in_game(ALICE, BOB));
    EXPECT_FALSE(dir.are_players_in_game(ALICE, CAROL));
    EXPECT_EQ(dir.chat_games("room").size(), 1u);
    EXPECT_TRUE(dir.chat_games("other").empty());
    EXPECT_EQ(dir.active_games().size(), 1u);

    bool ran = dir.with_session(g->id(), [](GameSession& s) {
        EXPECT_TRUE(s.move_by_notation("炮二平五").ok);
    });
    EXPECT_TRUE(ran);
    EXPECT_EQ(dir.turn_game_of(BOB), g);
    EXPECT_FALSE(dir.with_session("missing", [](GameSession&) {}));

    EXPECT_TRUE(dir.end_game(g->id()));
    EXPECT_FALSE(dir.end_game(g->id()));
    EXPECT_EQ(dir.get(g->id()), nullptr);
    EXPECT_FALSE(g->playing());
    EXPECT_EQ(dir.active_game_of(ALICE), nullptr);
}

TEST(SessionDirectory, AddGameAppliesSameRule) {
    SessionDirectory dir;
    ASSERT_NE(dir.create_game(ALICE, BOB, "chat", GameConfig{}, T0), nullptr);
    auto clash = std::make_shared<GameSession>("custom1", ALICE, CAROL, "chat", GameConfig{}, T0);
    EXPECT_FALSE(dir.add_game(clash));
    auto free_game = std::make_shared<GameSession>("custom2", CAROL, AI_PLAYER, "chat", GameConfig{}, T0);
    EXPECT_TRUE(dir.add_game(free_game));
    EXPECT_FALSE(dir.add_game(free_game));
}

TEST(SessionDirectory, InvitesExpire) {
    SessionDirectory dir(std::chrono::seconds(300));
    dir.add_invite(BOB, ALICE, "chat", T0);
    EXPECT_TRUE(dir.has_invite(BOB, ALICE, T0 + std::chrono::seconds(10)));
    EXPECT_FALSE(dir.has_invite(BOB, CAROL, T0));
    ASSERT_TRUE(dir.get_invite(BOB, T0));
    EXPECT_EQ(dir.get_invite(BOB, T0)->chat, "chat");

    // Invisible once expired, before any sweep.
    EXPECT_FALSE(dir.get_invite(BOB, T0 + std::chrono::seconds(301)));
    EXPECT_EQ(dir.sweep_expired_invites(T0 + std::chrono::seconds(100)), 0);
    EXPECT_EQ(dir.sweep_expired_invites(T0 + std::chrono::seconds(301)), 1);
    EXPECT_FALSE(dir.remove_invite(BOB));

    dir.add_invite(BOB, ALICE, "chat", T0);
    dir.add_invite(BOB, CAROL, "chat", T0);
    EXPECT_TRUE(dir.has_invite(BOB, CAROL, T0));
    EXPECT_FALSE(dir.has_invite(BOB, ALICE, T0));
    EXPECT_TRUE(dir.remove_invite(BOB));
}

TEST(SessionDirectory, SweepDropsFinishedGames) {
    SessionDirectory dir;
    SessionPtr a = dir.create_game(ALICE, BOB, "chat", GameConfig{}, T0);
    SessionPtr c = dir.create_game(CAROL, AI_PLAYER, "chat", GameConfig{}, T0);
    ASSERT_TRUE(a && c);
    {
        std::lock_guard<std::mutex> lk(a->mutex());
        a->resign(ALICE);
    }
    dir.add_invite(ALICE, BOB, "chat", T0);
    dir.sweep(T0 + std::chrono::hours(1));
    EXPECT_EQ(dir.size(), 1u);
    EXPECT_EQ(dir.get(c->id()), c);
    EXPECT_FALSE(dir.get_invite(ALICE, T0));
}

TEST(SessionDirectory, IdleGamesTimeOut) {
    SessionDirectory dir;
    SessionPtr a = dir.create_game(ALICE, BOB, "chat", GameConfig{}, T0);
    SessionPtr c = dir.create_game(CAROL, AI_PLAYER, "chat", GameConfig{}, T0);
    ASSERT_TRUE(a && c);
    dir.with_session(c->id(), [](GameSession& s) {
        ASSERT_TRUE(s.move_by_notation("炮二平五", T0 + std::chrono::hours(11)).ok);
    });

    auto expired = dir.expire_idle_games(std::chrono::hours(12), T0 + std::chrono::hours(13));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0], a->id());
    EXPECT_FALSE(a->playing());
    // Red was to move and loses.
    EXPECT_EQ(a->winner(), Side::Black);
    EXPECT_TRUE(c->playing());
}

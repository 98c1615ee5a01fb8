#include "xiangqi/board.hpp"
#include "xiangqi/cloud_book.hpp"
#include "xiangqi/config.hpp"
#include "xiangqi/log.hpp"

#include <gtest/gtest.h>

using namespace xiangqi;

TEST(CloudBook, EncodesStandardPosition) {
    Board b = standard_board();
    EXPECT_EQ(encode_position(b, Side::Red),
              "rnbakabnr/9/1c5c1/p1p1p1p1p/9/9/P1P1P1P1P/1C5C1/9/RNBAKABNR w");
    EXPECT_EQ(encode_position(b, Side::Black).substr(encode_position(b, Side::Black).size() - 2), " b");
}

TEST(CloudBook, DecodesMoveCodes) {
    // h2e2: the red cannon from file h, rank 2 to the centre file.
    auto m = decode_book_move("h2e2");
    ASSERT_TRUE(m);
    EXPECT_EQ(m->from, (Coord{7, 7}));
    EXPECT_EQ(m->to, (Coord{7, 4}));
    EXPECT_FALSE(decode_book_move("z2e2"));
    EXPECT_FALSE(decode_book_move("h2e"));
}

TEST(CloudBook, ParsesReplies) {
    BookResult r = parse_book_reply("move:h2e2\n");
    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(r.move);
    EXPECT_EQ(r.move->to, (Coord{7, 4}));

    r = parse_book_reply("egtb:b0c2|score:12");
    ASSERT_TRUE(r.ok);
    ASSERT_TRUE(r.move);
    EXPECT_EQ(r.move->from, (Coord{9, 1}));
    EXPECT_EQ(r.move->to, (Coord{7, 2}));

    r = parse_book_reply("nobestmove");
    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(r.move);

    r = parse_book_reply("unknown");
    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(r.move);

    r = parse_book_reply("invalid board");
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.error.empty());

    r = parse_book_reply("move:xx");
    EXPECT_FALSE(r.ok);
}

TEST(CloudBook, UnreachableServerFailsCleanly) {
    CloudOpeningBook book("http://127.0.0.1:1/chessdb.php", 200);
    BookResult r = book.lookup(standard_board(), Side::Red);
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.error.empty());
}

TEST(Config, DefaultsWhenEmpty) {
    std::string err;
    Config cfg = parse_config("{}", &err);
    EXPECT_TRUE(err.empty());
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.invite_ttl_seconds, 300);
    EXPECT_EQ(cfg.idle_timeout_hours, 12);
    EXPECT_FALSE(cfg.cloud_book.enabled);
    EXPECT_EQ(cfg.tier(Difficulty::Easy).depth, 5);
    EXPECT_EQ(cfg.tier(Difficulty::Normal).depth, 9);
    EXPECT_EQ(cfg.tier(Difficulty::Hard).depth, 12);
}

TEST(Config, ReadsOverrides) {
    Config cfg = parse_config(R"({
        "port": 9000,
        "log_level": "debug",
        "tt_size_mb": 64,
        "tiers": {"easy": {"depth": 3, "time_ms": 1000}, "hard": {"time_ms": 20000}},
        "cloud_book": {"enabled": true, "timeout_ms": 1500},
        "unknown_field": [1, 2, 3]
    })");
    EXPECT_EQ(cfg.port, 9000);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.tt_size_mb, 64u);
    EXPECT_EQ(cfg.easy.depth, 3);
    EXPECT_EQ(cfg.easy.time_ms, 1000);
    EXPECT_EQ(cfg.hard.depth, 12);
    EXPECT_EQ(cfg.hard.time_ms, 20000);
    EXPECT_TRUE(cfg.cloud_book.enabled);
    EXPECT_EQ(cfg.cloud_book.timeout_ms, 1500);
    EXPECT_EQ(cfg.cloud_book.url, "http://www.chessdb.cn/chessdb.php");
}

TEST(Config, BadInputKeepsDefaults) {
    std::string err;
    Config cfg = parse_config("{ not json", &err);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(cfg.port, 8080);

    cfg = parse_config(R"({"port": "eighty", "sweep_interval_seconds": 0})");
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.sweep_interval_seconds, 1);

    err.clear();
    load_config("/nonexistent/xiangqi.json", &err);
    EXPECT_FALSE(err.empty());
}

TEST(Log, ParsesLevels) {
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("chatty"), LogLevel::Info);

    LogLevel before = log_level();
    set_log_level(LogLevel::Error);
    EXPECT_EQ(log_level(), LogLevel::Error);
    set_log_level(before);
}

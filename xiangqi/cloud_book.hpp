#pragma once

#include "board.hpp"

#include <optional>
#include <string>

namespace xiangqi {

struct BookResult {
    bool ok = false;             // false: the lookup itself failed
    std::optional<Move> move;    // empty when the book has no answer
    std::string error;
};

class OpeningBook {
public:
    virtual ~OpeningBook() = default;
    virtual BookResult lookup(const Board& board, Side to_move) = 0;
    // Longest a lookup may block, on top of the search budget.
    virtual int timeout_ms() const { return 0; }
};

// Rank-by-rank text, row 0 first, Red uppercase, then " w" or " b".
std::string encode_position(const Board& board, Side to_move);

// "move:b0c2" / "egtb:b0c2" yield a move; "nobestmove" and "unknown" yield
// none; anything else fails.
BookResult parse_book_reply(const std::string& body);

// "<file a-i><rank 0-9>" twice, rank 0 being Red's back row.
std::optional<Move> decode_book_move(const std::string& code);

// Queries a chessdb-style HTTP endpoint with bounded timeouts, no retry.
class CloudOpeningBook : public OpeningBook {
public:
    CloudOpeningBook(std::string url, int timeout_ms);
    BookResult lookup(const Board& board, Side to_move) override;
    // Connect and read each get the full timeout.
    int timeout_ms() const override { return timeout_ms_ * 2; }

private:
    std::string host_;
    std::string path_;
    int timeout_ms_ = 3000;
};

} // namespace xiangqi

#pragma once

#include "board.hpp"
#include "notation.hpp"
#include "search.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xiangqi {

enum class ErrorCode {
    None,
    InvalidNotation,
    IllegalMove,
    NotYourTurn,
    NoActiveGame,
    GameAlreadyFinished,
    PieceNotFound,
    AIUnavailable,
    RemoteLookupFailure,
    CorruptState,
    PlayerBusy,
    InviteNotFound,
};

std::string error_code_name(ErrorCode code);

enum class GameStatus { Playing, Finished };

// Stands in for a player id when the engine plays that side.
static constexpr int64_t AI_PLAYER = -1;

using Clock = std::chrono::system_clock;

// Fixed when the session is created.
struct GameConfig {
    Difficulty difficulty = Difficulty::Normal;
};

struct MoveResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string message;
    NotationToken failed_token = NotationToken::None;

    Move move{};
    std::string notation;
    std::optional<Piece> captured;
    bool game_over = false;
    std::optional<Side> winner;
};

struct SnapshotCell {
    PieceKind kind = PieceKind::Soldier;
    Side side = Side::Red;
    std::string name;
};

struct GameSnapshot {
    std::string id;
    std::array<std::optional<SnapshotCell>, SQUARES> cells{};
    std::vector<std::string> history;
    std::optional<Move> last_move;
    std::optional<std::string> last_notation;
    GameStatus status = GameStatus::Playing;
    Side current = Side::Red;
    std::optional<Side> winner;
    std::string result;
    Difficulty difficulty = Difficulty::Normal;
};

class GameSession {
public:
    GameSession(std::string id, int64_t red_player, int64_t black_player, std::string chat,
                GameConfig config, Clock::time_point now = Clock::now());
    // Starts from a given position instead of the standard layout.
    GameSession(std::string id, int64_t red_player, int64_t black_player, std::string chat,
                GameConfig config, const Board& board, Side to_move,
                Clock::time_point now = Clock::now());

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    MoveResult move(const Coord& from, const Coord& to, Clock::time_point now = Clock::now());
    MoveResult move_by_notation(const std::string& text, Clock::time_point now = Clock::now());

    // False unless Playing and `player` takes part.
    bool resign(int64_t player);
    // Ends the game with the other side as winner.
    void forfeit(Side loser, const std::string& reason);
    // Ends the game without a winner.
    void abort(const std::string& reason);

    // A missing General while Playing finishes the session. Returns false
    // when that happened.
    bool check_integrity();

    std::optional<Side> player_side(int64_t player) const;
    bool is_participant(int64_t player) const;
    int64_t player_of(Side side) const { return side == Side::Red ? red_player_ : black_player_; }
    bool is_ai_turn() const;
    bool has_ai() const { return red_player_ == AI_PLAYER || black_player_ == AI_PLAYER; }

    const std::string& id() const { return id_; }
    const std::string& chat() const { return chat_; }
    const GameConfig& config() const { return config_; }
    GameStatus status() const { return status_; }
    bool playing() const { return status_ == GameStatus::Playing; }
    Side current() const { return current_; }
    const Board& board() const { return board_; }
    const std::vector<std::string>& history() const { return history_; }
    std::optional<Side> winner() const { return winner_; }
    const std::string& result() const { return result_; }
    Clock::time_point created_at() const { return created_at_; }
    Clock::time_point last_activity() const { return last_activity_; }

    std::string status_text() const;
    GameSnapshot snapshot() const;

    // Callers hold this for every read or mutation.
    std::mutex& mutex() { return mu_; }

private:
    void finish(std::optional<Side> winner, const std::string& result);

    std::string id_;
    int64_t red_player_ = 0;
    int64_t black_player_ = 0;
    std::string chat_;
    GameConfig config_{};

    GameStatus status_ = GameStatus::Playing;
    Side current_ = Side::Red;
    Board board_{};
    std::vector<std::string> history_;
    std::optional<Move> last_move_;
    std::optional<std::string> last_notation_;
    std::optional<Side> winner_;
    std::string result_;
    Clock::time_point created_at_{};
    Clock::time_point last_activity_{};

    std::mutex mu_;
};

} // namespace xiangqi

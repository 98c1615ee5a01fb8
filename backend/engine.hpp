#pragma once

#include "xiangqi/config.hpp"
#include "xiangqi/directory.hpp"
#include "xiangqi/game.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xiangqi {

struct ActionStatus {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    NotationToken failed_token = NotationToken::None;

    bool game_over = false;
    std::string result;

    std::string game_id;
    std::string notation;    // the caller's move
    std::string ai_notation; // the engine's reply, empty when it did not move
};

struct SerializedState {
    bool found = false;
    GameSnapshot snapshot;
    std::string status_text;
    int64_t red_player = 0;
    int64_t black_player = 0;
    std::vector<Move> legal_moves; // for the side to move
};

// Command surface over the directory. Every call is safe from any thread;
// engine turns are serialized on one search slot sharing one table.
class GameService {
public:
    GameService(const Config& cfg, SessionDirectory& directory);
    ~GameService();

    GameService(const GameService&) = delete;
    GameService& operator=(const GameService&) = delete;

    // Pass AI_PLAYER for an engine-controlled side. When the engine holds
    // Red it moves before this returns.
    ActionStatus create_game(int64_t red, int64_t black, const std::string& chat,
                             Difficulty difficulty);

    // Plays `text` in the game where it is `player`'s turn, then lets the
    // engine answer. An engine with no move loses: ok stays true and code is
    // AIUnavailable.
    ActionStatus submit_move_text(int64_t player, const std::string& text);
    ActionStatus submit_move(int64_t player, const Coord& from, const Coord& to);

    bool resign(const std::string& game_id, int64_t player);

    ActionStatus invite(int64_t inviter, int64_t target, const std::string& chat);
    // The inviter plays Red.
    ActionStatus accept_invite(int64_t target, int64_t inviter, Difficulty difficulty);

    SerializedState serialize_state(const std::string& game_id);

    // Moves for the engine if it is its turn in `game_id`.
    ActionStatus play_ai_turn(const std::string& game_id);

    // Drops expired invites and finished games, then times out idle games.
    void sweep();

    SessionDirectory& directory() { return directory_; }

private:
    template <typename Apply>
    ActionStatus play_human(int64_t player, Apply&& apply);
    ActionStatus run_ai_turn(const SessionPtr& session);
    void settle_no_moves(GameSession& session);

    Config cfg_;
    SessionDirectory& directory_;
    std::unique_ptr<OpeningBook> book_;
    TranspositionTable tt_;
    std::mutex search_mu_;
};

} // namespace xiangqi

#pragma once

#include "game.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace xiangqi {

struct Invite {
    int64_t inviter = 0;
    int64_t target = 0;
    std::string chat;
    Clock::time_point expires_at{};
};

using SessionPtr = std::shared_ptr<GameSession>;

// Registry of live sessions and pending invites. Lock order is directory
// first, then a session; nothing here is called with a session lock held.
class SessionDirectory {
public:
    explicit SessionDirectory(std::chrono::seconds invite_ttl = std::chrono::minutes(5));

    // Null when a human participant already has a game in progress.
    SessionPtr create_game(int64_t red, int64_t black, const std::string& chat, GameConfig config,
                           Clock::time_point now = Clock::now());
    // Registers a session built elsewhere (custom positions), same refusal rule.
    bool add_game(const SessionPtr& session);

    SessionPtr get(const std::string& id) const;
    SessionPtr active_game_of(int64_t player) const;
    // Active game in which it is `player`'s move.
    SessionPtr turn_game_of(int64_t player) const;
    std::vector<SessionPtr> chat_games(const std::string& chat) const;
    std::vector<SessionPtr> active_games() const;
    bool are_players_in_game(int64_t a, int64_t b) const;
    bool end_game(const std::string& id);
    size_t size() const;

    // One pending invite per target; a newer one replaces it.
    void add_invite(int64_t target, int64_t inviter, const std::string& chat,
                    Clock::time_point now = Clock::now());
    // Expired invites are invisible even before a sweep.
    std::optional<Invite> get_invite(int64_t target, Clock::time_point now = Clock::now()) const;
    bool has_invite(int64_t target, int64_t inviter, Clock::time_point now = Clock::now()) const;
    bool remove_invite(int64_t target);

    int sweep_expired_invites(Clock::time_point now = Clock::now());
    int sweep_finished_games();
    void sweep(Clock::time_point now = Clock::now());

    // Playing sessions idle longer than `timeout` end with the side to move
    // losing. Returns their ids.
    std::vector<std::string> expire_idle_games(std::chrono::seconds timeout,
                                               Clock::time_point now = Clock::now());

    // Runs fn(GameSession&) under the session's lock. False when the id is
    // unknown.
    template <typename Fn>
    bool with_session(const std::string& id, Fn&& fn) {
        SessionPtr s = get(id);
        if (!s) return false;
        std::lock_guard<std::mutex> lk(s->mutex());
        fn(*s);
        return true;
    }

private:
    bool busy_locked(int64_t player) const;

    std::chrono::seconds invite_ttl_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, SessionPtr> games_;
    std::unordered_map<int64_t, Invite> invites_;
};

std::string make_game_id(Clock::time_point now = Clock::now());

} // namespace xiangqi

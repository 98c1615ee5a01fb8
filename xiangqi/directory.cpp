#include "directory.hpp"

#include "log.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace xiangqi {
namespace {

static bool is_playing(const SessionPtr& s) {
    std::lock_guard<std::mutex> lk(s->mutex());
    return s->playing();
}

} // namespace

std::string make_game_id(Clock::time_point now) {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::ostringstream oss;
    oss << "game_" << ms << "_" << std::hex << std::setfill('0') << std::setw(16) << dist(rng);
    return oss.str();
}

SessionDirectory::SessionDirectory(std::chrono::seconds invite_ttl) : invite_ttl_(invite_ttl) {}

bool SessionDirectory::busy_locked(int64_t player) const {
    if (player == AI_PLAYER) return false;
    for (const auto& kv : games_) {
        std::lock_guard<std::mutex> lk(kv.second->mutex());
        if (kv.second->playing() && kv.second->is_participant(player)) return true;
    }
    return false;
}

SessionPtr SessionDirectory::create_game(int64_t red, int64_t black, const std::string& chat,
                                         GameConfig config, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    if (busy_locked(red) || busy_locked(black)) return nullptr;
    std::string id = make_game_id(now);
    while (games_.count(id)) id = make_game_id(now);
    auto s = std::make_shared<GameSession>(id, red, black, chat, config, now);
    games_[id] = s;
    log_info("directory", "created " + id + " (" + difficulty_name(config.difficulty) + ")");
    return s;
}

bool SessionDirectory::add_game(const SessionPtr& session) {
    if (!session) return false;
    std::lock_guard<std::mutex> lk(mu_);
    if (games_.count(session->id())) return false;
    int64_t red = session->player_of(Side::Red);
    int64_t black = session->player_of(Side::Black);
    if (busy_locked(red) || busy_locked(black)) return false;
    games_[session->id()] = session;
    return true;
}

SessionPtr SessionDirectory::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = games_.find(id);
    return it == games_.end() ? nullptr : it->second;
}

SessionPtr SessionDirectory::active_game_of(int64_t player) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : games_) {
        std::lock_guard<std::mutex> slk(kv.second->mutex());
        if (kv.second->playing() && kv.second->is_participant(player)) return kv.second;
    }
    return nullptr;
}

SessionPtr SessionDirectory::turn_game_of(int64_t player) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : games_) {
        const auto& s = kv.second;
        std::lock_guard<std::mutex> slk(s->mutex());
        if (s->playing() && s->player_of(s->current()) == player) return s;
    }
    return nullptr;
}

std::vector<SessionPtr> SessionDirectory::chat_games(const std::string& chat) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SessionPtr> out;
    for (const auto& kv : games_)
        if (kv.second->chat() == chat && is_playing(kv.second)) out.push_back(kv.second);
    return out;
}

std::vector<SessionPtr> SessionDirectory::active_games() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SessionPtr> out;
    for (const auto& kv : games_)
        if (is_playing(kv.second)) out.push_back(kv.second);
    return out;
}

bool SessionDirectory::are_players_in_game(int64_t a, int64_t b) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : games_) {
        std::lock_guard<std::mutex> slk(kv.second->mutex());
        if (kv.second->playing() && kv.second->is_participant(a) && kv.second->is_participant(b))
            return true;
    }
    return false;
}

bool SessionDirectory::end_game(const std::string& id) {
    SessionPtr s;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = games_.find(id);
        if (it == games_.end()) return false;
        s = it->second;
        games_.erase(it);
    }
    std::lock_guard<std::mutex> slk(s->mutex());
    s->abort("ended");
    return true;
}

size_t SessionDirectory::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return games_.size();
}

// ── Invites ───────────────────────────────────────────────────────────────

void SessionDirectory::add_invite(int64_t target, int64_t inviter, const std::string& chat,
                                  Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    invites_[target] = Invite{inviter, target, chat, now + invite_ttl_};
}

std::optional<Invite> SessionDirectory::get_invite(int64_t target, Clock::time_point now) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = invites_.find(target);
    if (it == invites_.end() || it->second.expires_at <= now) return std::nullopt;
    return it->second;
}

bool SessionDirectory::has_invite(int64_t target, int64_t inviter, Clock::time_point now) const {
    auto inv = get_invite(target, now);
    return inv && inv->inviter == inviter;
}

bool SessionDirectory::remove_invite(int64_t target) {
    std::lock_guard<std::mutex> lk(mu_);
    return invites_.erase(target) > 0;
}

// ── Sweeps ────────────────────────────────────────────────────────────────

int SessionDirectory::sweep_expired_invites(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    int n = 0;
    for (auto it = invites_.begin(); it != invites_.end();) {
        if (it->second.expires_at <= now) {
            it = invites_.erase(it);
            n++;
        } else {
            ++it;
        }
    }
    return n;
}

int SessionDirectory::sweep_finished_games() {
    std::lock_guard<std::mutex> lk(mu_);
    int n = 0;
    for (auto it = games_.begin(); it != games_.end();) {
        if (!is_playing(it->second)) {
            it = games_.erase(it);
            n++;
        } else {
            ++it;
        }
    }
    return n;
}

void SessionDirectory::sweep(Clock::time_point now) {
    int invites = sweep_expired_invites(now);
    int games = sweep_finished_games();
    if (invites || games)
        log_debug("directory", "swept " + std::to_string(invites) + " invites, " +
                                   std::to_string(games) + " games");
}

std::vector<std::string> SessionDirectory::expire_idle_games(std::chrono::seconds timeout,
                                                             Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& kv : games_) {
        auto& s = kv.second;
        std::lock_guard<std::mutex> slk(s->mutex());
        if (!s->playing() || now - s->last_activity() <= timeout) continue;
        s->forfeit(s->current(), "no move for too long");
        out.push_back(kv.first);
    }
    if (!out.empty()) log_info("directory", "timed out " + std::to_string(out.size()) + " games");
    return out;
}

} // namespace xiangqi

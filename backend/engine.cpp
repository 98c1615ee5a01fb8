#include "engine.hpp"

#include "xiangqi/log.hpp"
#include "xiangqi/move_validator.hpp"

#include <memory>
#include <new>

namespace xiangqi {
namespace {

static ActionStatus failure(ErrorCode code, const std::string& msg) {
    ActionStatus st;
    st.ok = false;
    st.code = code;
    st.error = msg;
    return st;
}

static void fill_outcome(ActionStatus& st, const GameSession& s) {
    st.game_id = s.id();
    st.game_over = !s.playing();
    if (st.game_over) st.result = s.result();
}

} // namespace

GameService::GameService(const Config& cfg, SessionDirectory& directory)
    : cfg_(cfg), directory_(directory), tt_(1) {
    // Memory-limited hosts: step down until the table fits.
    for (size_t mb = cfg_.tt_size_mb; mb >= 1; mb /= 2) {
        try {
            tt_.resize(mb);
            log_info("service", "transposition table " + std::to_string(mb) + " MB");
            break;
        } catch (const std::bad_alloc&) {
            log_warn("service", "could not allocate " + std::to_string(mb) + " MB table");
        }
    }
    if (cfg_.cloud_book.enabled) {
        book_ = std::make_unique<CloudOpeningBook>(cfg_.cloud_book.url, cfg_.cloud_book.timeout_ms);
        log_info("service", "cloud opening book at " + cfg_.cloud_book.url);
    }
}

GameService::~GameService() = default;

ActionStatus GameService::create_game(int64_t red, int64_t black, const std::string& chat,
                                      Difficulty difficulty) {
    if (red == black) return failure(ErrorCode::PlayerBusy, "a player cannot take both sides");
    SessionPtr s = directory_.create_game(red, black, chat, GameConfig{difficulty});
    if (!s) return failure(ErrorCode::PlayerBusy, "a player already has a game in progress");

    ActionStatus st;
    st.ok = true;
    st.game_id = s->id();
    if (red == AI_PLAYER) {
        ActionStatus ai = run_ai_turn(s);
        st.ai_notation = ai.ai_notation;
        st.code = ai.code;
    }
    std::lock_guard<std::mutex> lk(s->mutex());
    fill_outcome(st, *s);
    return st;
}

// ── Human moves ───────────────────────────────────────────────────────────

template <typename Apply>
ActionStatus GameService::play_human(int64_t player, Apply&& apply) {
    SessionPtr s = directory_.turn_game_of(player);
    if (!s) {
        if (directory_.active_game_of(player)) return failure(ErrorCode::NotYourTurn, "not your turn");
        return failure(ErrorCode::NoActiveGame, "no game in progress");
    }

    ActionStatus st;
    bool engine_next = false;
    {
        std::lock_guard<std::mutex> lk(s->mutex());
        // The turn may have passed between lookup and lock.
        if (!s->playing()) return failure(ErrorCode::GameAlreadyFinished, "game is already over");
        if (s->player_of(s->current()) != player) return failure(ErrorCode::NotYourTurn, "not your turn");

        MoveResult r = apply(*s);
        if (!r.ok) {
            st = failure(r.code, r.message);
            st.failed_token = r.failed_token;
            st.game_id = s->id();
            return st;
        }
        st.ok = true;
        st.notation = r.notation;
        if (!r.game_over) settle_no_moves(*s);
        engine_next = s->is_ai_turn();
    }

    if (engine_next) {
        ActionStatus ai = run_ai_turn(s);
        st.ai_notation = ai.ai_notation;
        st.code = ai.code;
    }
    std::lock_guard<std::mutex> lk(s->mutex());
    fill_outcome(st, *s);
    return st;
}

ActionStatus GameService::submit_move_text(int64_t player, const std::string& text) {
    return play_human(player, [&](GameSession& s) { return s.move_by_notation(text); });
}

ActionStatus GameService::submit_move(int64_t player, const Coord& from, const Coord& to) {
    return play_human(player, [&](GameSession& s) { return s.move(from, to); });
}

void GameService::settle_no_moves(GameSession& s) {
    if (!s.playing() || s.is_ai_turn()) return;
    if (legal_moves(s.board(), s.current()).empty()) s.forfeit(s.current(), "no legal moves");
}

bool GameService::resign(const std::string& game_id, int64_t player) {
    bool done = false;
    directory_.with_session(game_id, [&](GameSession& s) { done = s.resign(player); });
    return done;
}

// ── Invites ───────────────────────────────────────────────────────────────

ActionStatus GameService::invite(int64_t inviter, int64_t target, const std::string& chat) {
    if (inviter == target || inviter == AI_PLAYER || target == AI_PLAYER)
        return failure(ErrorCode::InviteNotFound, "invalid invite target");
    if (directory_.active_game_of(inviter))
        return failure(ErrorCode::PlayerBusy, "you already have a game in progress");
    if (directory_.active_game_of(target))
        return failure(ErrorCode::PlayerBusy, "that player already has a game in progress");
    directory_.add_invite(target, inviter, chat);
    ActionStatus st;
    st.ok = true;
    return st;
}

ActionStatus GameService::accept_invite(int64_t target, int64_t inviter, Difficulty difficulty) {
    auto inv = directory_.get_invite(target);
    if (!inv || inv->inviter != inviter)
        return failure(ErrorCode::InviteNotFound, "no pending invite from that player");
    directory_.remove_invite(target);
    return create_game(inviter, target, inv->chat, difficulty);
}

// ── State ─────────────────────────────────────────────────────────────────

SerializedState GameService::serialize_state(const std::string& game_id) {
    SerializedState out;
    directory_.with_session(game_id, [&](GameSession& s) {
        out.found = true;
        out.snapshot = s.snapshot();
        out.status_text = s.status_text();
        out.red_player = s.player_of(Side::Red);
        out.black_player = s.player_of(Side::Black);
        if (s.playing()) out.legal_moves = legal_moves(s.board(), s.current());
    });
    return out;
}

// ── Engine turns ──────────────────────────────────────────────────────────

ActionStatus GameService::play_ai_turn(const std::string& game_id) {
    SessionPtr s = directory_.get(game_id);
    if (!s) return failure(ErrorCode::NoActiveGame, "game_id not found");
    ActionStatus st = run_ai_turn(s);
    std::lock_guard<std::mutex> lk(s->mutex());
    fill_outcome(st, *s);
    return st;
}

ActionStatus GameService::run_ai_turn(const SessionPtr& s) {
    Board snapshot;
    Side side = Side::Red;
    size_t plies = 0;
    Difficulty difficulty = Difficulty::Normal;
    {
        std::lock_guard<std::mutex> lk(s->mutex());
        if (!s->playing()) return failure(ErrorCode::GameAlreadyFinished, "game is already over");
        if (!s->is_ai_turn()) return failure(ErrorCode::NotYourTurn, "not the engine's turn");
        if (!s->check_integrity()) return failure(ErrorCode::CorruptState, s->result());
        snapshot = s->board();
        side = s->current();
        plies = s->history().size();
        difficulty = s->config().difficulty;
    }

    SearchOptions opts = options_for(difficulty, cfg_.tier(difficulty));
    if (difficulty == Difficulty::Hard) opts.book = book_.get();

    SearchResult r;
    {
        std::lock_guard<std::mutex> lk(search_mu_);
        r = run_search_task(snapshot, side, opts, &tt_, std::chrono::milliseconds(cfg_.ai_grace_ms));
    }

    std::lock_guard<std::mutex> lk(s->mutex());
    if (!s->playing() || s->history().size() != plies)
        return failure(ErrorCode::GameAlreadyFinished, "game moved on during the search");

    ActionStatus st;
    st.ok = true;
    if (!r.found) {
        s->forfeit(side, "engine found no move");
        st.code = ErrorCode::AIUnavailable;
        return st;
    }

    MoveResult m = s->move(r.move.from, r.move.to);
    if (!m.ok) {
        log_error("service", s->id() + ": engine move rejected: " + m.message);
        s->forfeit(side, "engine produced an illegal move");
        st.code = ErrorCode::AIUnavailable;
        return st;
    }
    log_debug("service", s->id() + ": engine played " + m.notation + " (" + r.source + ", depth " +
                             std::to_string(r.depth) + ")");
    st.ai_notation = m.notation;
    if (!m.game_over) settle_no_moves(*s);
    return st;
}

void GameService::sweep() {
    directory_.expire_idle_games(std::chrono::hours(cfg_.idle_timeout_hours));
    directory_.sweep();
}

} // namespace xiangqi

#include "game.hpp"

#include "log.hpp"
#include "move_validator.hpp"

#include <utility>

namespace xiangqi {
namespace {

static MoveResult rejected(ErrorCode code, const std::string& msg) {
    MoveResult r;
    r.ok = false;
    r.code = code;
    r.message = msg;
    return r;
}

} // namespace

std::string error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "none";
        case ErrorCode::InvalidNotation:     return "invalid_notation";
        case ErrorCode::IllegalMove:         return "illegal_move";
        case ErrorCode::NotYourTurn:         return "not_your_turn";
        case ErrorCode::NoActiveGame:        return "no_active_game";
        case ErrorCode::GameAlreadyFinished: return "game_already_finished";
        case ErrorCode::PieceNotFound:       return "piece_not_found";
        case ErrorCode::AIUnavailable:       return "ai_unavailable";
        case ErrorCode::RemoteLookupFailure: return "remote_lookup_failure";
        case ErrorCode::CorruptState:        return "corrupt_state";
        case ErrorCode::PlayerBusy:          return "player_busy";
        case ErrorCode::InviteNotFound:      return "invite_not_found";
    }
    return "unknown";
}

GameSession::GameSession(std::string id, int64_t red_player, int64_t black_player, std::string chat,
                         GameConfig config, Clock::time_point now)
    : GameSession(std::move(id), red_player, black_player, std::move(chat), config,
                  standard_board(), Side::Red, now) {}

GameSession::GameSession(std::string id, int64_t red_player, int64_t black_player, std::string chat,
                         GameConfig config, const Board& board, Side to_move, Clock::time_point now)
    : id_(std::move(id)),
      red_player_(red_player),
      black_player_(black_player),
      chat_(std::move(chat)),
      config_(config),
      current_(to_move),
      board_(board),
      created_at_(now),
      last_activity_(now) {}

MoveResult GameSession::move(const Coord& from, const Coord& to, Clock::time_point now) {
    if (status_ == GameStatus::Finished)
        return rejected(ErrorCode::GameAlreadyFinished, "game is already over");
    if (!on_board(from) || !on_board(to))
        return rejected(ErrorCode::IllegalMove, "coordinate off the board");
    if (!check_integrity())
        return rejected(ErrorCode::CorruptState, result_);

    const auto& cell = board_.at(from);
    if (!cell) return rejected(ErrorCode::PieceNotFound, "no piece at " + coord_text(from));
    if (cell->side != current_)
        return rejected(ErrorCode::NotYourTurn, "it is " + side_name(current_) + "'s turn");
    if (!is_valid_move(board_, from, to))
        return rejected(ErrorCode::IllegalMove,
                        cell->name + " cannot move " + coord_text(from) + " -> " + coord_text(to));

    Move m{from, to};
    std::string text = generate_notation(board_, m);
    UndoMove u;
    if (!board_.make_move(m, u))
        return rejected(ErrorCode::IllegalMove, "move could not be applied");
    if (board_.generals_facing()) {
        board_.unmake_move(u);
        return rejected(ErrorCode::IllegalMove, "move leaves the generals facing each other");
    }

    Side mover = current_;
    history_.push_back(text);
    last_move_ = m;
    last_notation_ = text;
    current_ = opp(current_);
    last_activity_ = now;

    MoveResult r;
    r.ok = true;
    r.move = m;
    r.notation = text;
    r.captured = u.captured;
    if (u.captured && u.captured->kind == PieceKind::General) {
        finish(mover, side_name(mover) + " wins: general captured");
    }
    r.game_over = status_ == GameStatus::Finished;
    r.winner = winner_;
    return r;
}

MoveResult GameSession::move_by_notation(const std::string& text, Clock::time_point now) {
    if (status_ == GameStatus::Finished)
        return rejected(ErrorCode::GameAlreadyFinished, "game is already over");
    ParseResult p = parse_notation(text, board_, current_);
    if (!p.ok) {
        MoveResult r = rejected(ErrorCode::InvalidNotation, p.error);
        r.failed_token = p.failed_token;
        return r;
    }
    return move(p.move.from, p.move.to, now);
}

bool GameSession::resign(int64_t player) {
    if (status_ != GameStatus::Playing) return false;
    auto side = player_side(player);
    if (!side) return false;
    finish(opp(*side), side_name(*side) + " resigned");
    return true;
}

void GameSession::forfeit(Side loser, const std::string& reason) {
    if (status_ != GameStatus::Playing) return;
    finish(opp(loser), side_name(loser) + " forfeits: " + reason);
}

void GameSession::abort(const std::string& reason) {
    if (status_ != GameStatus::Playing) return;
    finish(std::nullopt, reason);
}

bool GameSession::check_integrity() {
    if (status_ != GameStatus::Playing) return true;
    bool red = board_.find_general(Side::Red).has_value();
    bool black = board_.find_general(Side::Black).has_value();
    if (red && black) return true;
    std::optional<Side> w;
    if (red != black) w = red ? Side::Red : Side::Black;
    log_error("game", "session " + id_ + " lost a general outside a capture, closing it");
    finish(w, "aborted: corrupt board state");
    return false;
}

void GameSession::finish(std::optional<Side> winner, const std::string& result) {
    status_ = GameStatus::Finished;
    winner_ = winner;
    result_ = result;
    log_info("game", id_ + " finished: " + result);
}

std::optional<Side> GameSession::player_side(int64_t player) const {
    if (player == red_player_) return Side::Red;
    if (player == black_player_) return Side::Black;
    return std::nullopt;
}

bool GameSession::is_participant(int64_t player) const { return player_side(player).has_value(); }

bool GameSession::is_ai_turn() const {
    return status_ == GameStatus::Playing && player_of(current_) == AI_PLAYER;
}

std::string GameSession::status_text() const {
    std::string s = "game " + id_ + ": ";
    if (status_ == GameStatus::Finished) return s + "finished, " + result_;
    s += side_name(current_) + " to move, " + std::to_string(history_.size()) + " moves played";
    if (last_notation_) s += ", last " + *last_notation_;
    return s;
}

GameSnapshot GameSession::snapshot() const {
    GameSnapshot out;
    out.id = id_;
    for (int sq = 0; sq < SQUARES; sq++) {
        const auto& p = board_.at(sq_coord(sq));
        if (p) out.cells[sq] = SnapshotCell{p->kind, p->side, p->name};
    }
    out.history = history_;
    out.last_move = last_move_;
    out.last_notation = last_notation_;
    out.status = status_;
    out.current = current_;
    out.winner = winner_;
    out.result = result_;
    out.difficulty = config_.difficulty;
    return out;
}

} // namespace xiangqi

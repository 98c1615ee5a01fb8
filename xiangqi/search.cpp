#include "search.hpp"

#include "log.hpp"
#include "move_validator.hpp"
#include "zobrist.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <random>

namespace xiangqi {
namespace {

static const uint64_t EXTENDED_EVAL_KEY = 0x9E3779B97F4A7C15ULL;
static const int HASH_MOVE_SCORE = 1 << 30;
static const int CAPTURE_BASE = 10000;
static const int KILLER_1 = 9000;
static const int KILLER_2 = 8000;
static const int HISTORY_CAP = 32000;
static const int NULL_R = 2;

static bool same_move(const Move& a, const Move& b) { return a == b; }

static int history_index(const Move& m) {
    return sq_index(m.from) * SQUARES + sq_index(m.to);
}

} // namespace

std::string difficulty_name(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Normal: return "normal";
        case Difficulty::Hard:   return "hard";
    }
    return "normal";
}

Difficulty parse_difficulty(const std::string& name) {
    std::string d = name;
    for (char& ch : d) ch = (char)std::tolower((unsigned char)ch);
    if (d == "easy" || d == "beginner") return Difficulty::Easy;
    if (d == "hard" || d == "expert") return Difficulty::Hard;
    return Difficulty::Normal;
}

SearchOptions options_for(Difficulty d, const TierSettings& tier) {
    SearchOptions o;
    o.max_depth = std::max(1, tier.depth);
    o.time_ms = std::max(1, tier.time_ms);
    o.extended_eval = d != Difficulty::Easy;
    o.root_move_cap = (d == Difficulty::Easy) ? 10 : 0;
    return o;
}

Searcher::Searcher(TranspositionTable* tt) : tt_(tt), history_(SQUARES * SQUARES, 0) {}

// ── Time control ──────────────────────────────────────────────────────────

bool Searcher::time_up() {
    if (aborted_) return true;
    if ((nodes_ & 1023) != 0) return false;
    if (std::chrono::steady_clock::now() > deadline_ ||
        (stop_ && stop_->load(std::memory_order_relaxed))) {
        aborted_ = true;
    }
    return aborted_;
}

// ── Make / unmake with incremental hash ───────────────────────────────────

void Searcher::play(const Move& m, UndoMove& u) {
    Piece mover = *board_.at(m.from);
    board_.make_move(m, u);
    hash_ = zobrist_update(hash_, mover, u);
    side_ = opp(side_);
}

void Searcher::undo(const UndoMove& u, uint64_t saved_hash) {
    board_.unmake_move(u);
    hash_ = saved_hash;
    side_ = opp(side_);
}

// Entries from the plain and extended evaluations never answer each other.
uint64_t Searcher::tt_key() const {
    return opts_.extended_eval ? hash_ ^ EXTENDED_EVAL_KEY : hash_;
}

int Searcher::static_eval() const {
    return evaluate(board_, side_, opts_.extended_eval);
}

// ── Killer moves & History ────────────────────────────────────────────────

void Searcher::store_killer(const Move& m, int ply) {
    if (ply >= MAX_PLY) return;
    if (!killers_set_[ply][0] || !same_move(killers_[ply][0], m)) {
        killers_[ply][1] = killers_[ply][0];
        killers_set_[ply][1] = killers_set_[ply][0];
        killers_[ply][0] = m;
        killers_set_[ply][0] = true;
    }
}

void Searcher::update_history(const Move& m, int depth) {
    int& v = history_[history_index(m)];
    v += depth * depth;
    if (v > HISTORY_CAP) v = HISTORY_CAP;
}

void Searcher::order_moves(std::vector<Move>& moves, int ply, const Move* hash_move) const {
    std::vector<std::pair<int, Move>> scored;
    scored.reserve(moves.size());
    for (const auto& m : moves) {
        int score = 0;
        const auto& victim = board_.at(m.to);
        if (hash_move && same_move(*hash_move, m)) {
            score = HASH_MOVE_SCORE;
        } else if (victim) {
            score = CAPTURE_BASE + piece_value(victim->kind);
        } else if (ply < MAX_PLY && killers_set_[ply][0] && same_move(killers_[ply][0], m)) {
            score = KILLER_1;
        } else if (ply < MAX_PLY && killers_set_[ply][1] && same_move(killers_[ply][1], m)) {
            score = KILLER_2;
        }
        score += history_[history_index(m)];
        scored.emplace_back(score, m);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const std::pair<int, Move>& a, const std::pair<int, Move>& b) {
                         return a.first > b.first;
                     });
    for (size_t i = 0; i < moves.size(); i++) moves[i] = scored[i].second;
}

// ── Quiescence ────────────────────────────────────────────────────────────

int Searcher::quiesce(int alpha, int beta, int q_depth) {
    nodes_++;
    if (time_up()) return 0;
    if (!board_.find_general(side_)) return -MATE_SCORE;

    int stand = static_eval();
    if (stand >= beta) return beta;
    if (alpha < stand) alpha = stand;
    if (q_depth >= Q_LIMIT) return alpha;

    struct Capture { Move move; int victim; };
    std::vector<Capture> caps;
    std::vector<Move> moves;
    generate_moves(board_, side_, moves);
    for (const auto& m : moves) {
        const auto& t = board_.at(m.to);
        if (t) caps.push_back(Capture{m, piece_value(t->kind)});
    }
    std::stable_sort(caps.begin(), caps.end(),
                     [](const Capture& a, const Capture& b) { return a.victim > b.victim; });

    for (const auto& c : caps) {
        uint64_t saved = hash_;
        UndoMove u;
        play(c.move, u);
        int s = -quiesce(-beta, -alpha, q_depth + 1);
        undo(u, saved);
        if (aborted_) return 0;
        if (s >= beta) return beta;
        if (s > alpha) alpha = s;
    }
    return alpha;
}

// ── Alpha-beta (negamax) ──────────────────────────────────────────────────

int Searcher::negamax(int depth, int alpha, int beta, int ply, bool null_ok) {
    nodes_++;
    if (time_up()) return 0;
    if (!board_.find_general(side_)) return -MATE_SCORE;
    if (depth <= 0) return opts_.use_quiescence ? quiesce(alpha, beta, 0) : static_eval();

    const int alpha_orig = alpha;
    Move hash_move{};
    bool have_hash_move = false;
    if (opts_.use_tt && tt_) {
        if (const TTEntry* e = tt_->lookup(tt_key())) {
            if (e->has_move()) {
                hash_move = e->best_move();
                have_hash_move = true;
            }
            if (e->depth >= depth) {
                if (e->bound == Bound::Exact) return e->score;
                if (e->bound == Bound::Lower) alpha = std::max(alpha, (int)e->score);
                else beta = std::min(beta, (int)e->score);
                if (alpha >= beta) return e->score;
            }
        }
    }

    if (opts_.use_null_move && null_ok && depth >= 3 && !in_check(board_, side_)) {
        uint64_t saved = hash_;
        hash_ = zobrist_null_move(hash_);
        side_ = opp(side_);
        int s = -negamax(depth - 1 - NULL_R, -beta, -beta + 1, ply + 1, false);
        side_ = opp(side_);
        hash_ = saved;
        if (aborted_) return 0;
        if (s >= beta) return beta;
    }

    std::vector<Move> moves;
    generate_moves(board_, side_, moves);
    // No legal move counts as a loss, stalemate included.
    if (moves.empty()) return -MATE_SCORE;
    order_moves(moves, ply, have_hash_move ? &hash_move : nullptr);

    int best = -INF;
    Move best_move = moves.front();
    for (const auto& m : moves) {
        bool capture = board_.at(m.to).has_value();
        uint64_t saved = hash_;
        UndoMove u;
        play(m, u);
        int s = -negamax(depth - 1, -beta, -alpha, ply + 1, true);
        undo(u, saved);
        if (aborted_) return 0;

        if (s > best) {
            best = s;
            best_move = m;
        }
        if (s > alpha) alpha = s;
        if (alpha >= beta) {
            if (!capture) {
                store_killer(m, ply);
                update_history(m, depth);
            }
            break;
        }
    }

    if (opts_.use_tt && tt_) {
        Bound b = best <= alpha_orig ? Bound::Upper : (best >= beta ? Bound::Lower : Bound::Exact);
        tt_->store(tt_key(), depth, b, best, &best_move);
    }
    return best;
}

// ── Root: iterative deepening ─────────────────────────────────────────────

SearchResult Searcher::search(const Board& board, Side side, const SearchOptions& opts,
                              const std::atomic<bool>* stop) {
    opts_ = opts;
    stop_ = stop;
    board_ = board;
    side_ = side;
    hash_ = zobrist_hash(board_, side_);
    nodes_ = 0;
    aborted_ = false;
    for (int i = 0; i < MAX_PLY; i++) killers_set_[i][0] = killers_set_[i][1] = false;
    std::fill(history_.begin(), history_.end(), 0);

    SearchResult result;
    std::vector<Move> root_moves;
    generate_moves(board_, side_, root_moves);
    if (root_moves.empty()) {
        log_info("search", side_name(side) + " has no legal move");
        return result;
    }

    std::mt19937_64 rng(opts.seed ? opts.seed : std::random_device{}());
    result.found = true;
    result.move = root_moves[std::uniform_int_distribution<size_t>(0, root_moves.size() - 1)(rng)];
    result.source = "random";
    if (root_moves.size() == 1) {
        result.move = root_moves.front();
        result.source = "forced";
        return result;
    }

    if (opts.book) {
        BookResult br = opts.book->lookup(board_, side_);
        if (!br.ok) {
            log_warn("search", "opening book unavailable, searching locally: " + br.error);
        } else if (br.move && is_legal_move(board_, side_, *br.move)) {
            result.move = *br.move;
            result.source = "book";
            return result;
        } else if (br.move) {
            log_warn("search", "opening book suggested an illegal move, ignoring it");
        }
    }

    if (opts.use_phase_heuristics) {
        if (is_opening_phase(board_)) {
            if (auto m = opening_pick(board_, side_, root_moves)) {
                result.move = *m;
                result.source = "opening";
                return result;
            }
        } else if (is_endgame_phase(board_)) {
            if (auto m = endgame_pick(board_, side_, root_moves)) {
                result.move = *m;
                result.source = "endgame";
                return result;
            }
        }
    }

    // The book timeout and phase checks do not count against the search budget.
    deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.time_ms);
    if (opts.use_tt && tt_) tt_->new_search();

    for (int depth = 1; depth <= opts.max_depth; depth++) {
        Move hash_move{};
        bool have_hash_move = false;
        if (result.source == "search") {
            hash_move = result.move;
            have_hash_move = true;
        }
        std::vector<Move> moves = root_moves;
        order_moves(moves, 0, have_hash_move ? &hash_move : nullptr);
        if (opts.root_move_cap > 0 && (int)moves.size() > opts.root_move_cap)
            moves.resize(opts.root_move_cap);

        int alpha = -INF;
        const int beta = INF;
        int best = -INF;
        Move best_move = moves.front();
        for (const auto& m : moves) {
            uint64_t saved = hash_;
            UndoMove u;
            play(m, u);
            int s = -negamax(depth - 1, -beta, -alpha, 1, true);
            undo(u, saved);
            if (aborted_) break;
            if (s > best) {
                best = s;
                best_move = m;
            }
            if (s > alpha) alpha = s;
        }
        if (aborted_) {
            log_debug("search", "depth " + std::to_string(depth) + " interrupted, keeping depth " +
                                    std::to_string(result.depth));
            break;
        }

        result.move = best_move;
        result.score = best;
        result.depth = depth;
        result.source = "search";
        if (opts.use_tt && tt_) tt_->store(tt_key(), depth, Bound::Exact, best, &best_move);
        log_debug("search", "depth " + std::to_string(depth) + " done, score " + std::to_string(best) +
                                " nodes " + std::to_string(nodes_));
        if (best >= MATE_SCORE) break;
    }

    result.nodes = nodes_;
    return result;
}

SearchResult run_search_task(const Board& board, Side side, const SearchOptions& opts,
                             TranspositionTable* tt, std::chrono::milliseconds grace) {
    std::atomic<bool> stop{false};
    Board snapshot = board;
    auto fut = std::async(std::launch::async, [&snapshot, side, &opts, tt, &stop]() {
        Searcher s(tt);
        return s.search(snapshot, side, opts, &stop);
    });
    auto budget = std::chrono::milliseconds(opts.time_ms) + grace;
    if (opts.book) budget += std::chrono::milliseconds(opts.book->timeout_ms());
    if (fut.wait_for(budget) != std::future_status::ready) {
        log_warn("search", "deadline passed, stopping search");
        stop.store(true, std::memory_order_relaxed);
    }
    return fut.get();
}

} // namespace xiangqi

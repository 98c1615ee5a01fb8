#pragma once

#include "board.hpp"
#include "cloud_book.hpp"
#include "evaluate.hpp"
#include "transposition.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace xiangqi {

enum class Difficulty { Easy, Normal, Hard };

std::string difficulty_name(Difficulty d);
// easy/beginner, hard/expert; anything else is normal.
Difficulty parse_difficulty(const std::string& name);

struct TierSettings {
    int depth = 4;
    int time_ms = 3000;
};

struct SearchOptions {
    int max_depth = 4;
    int time_ms = 3000;
    bool extended_eval = false;
    int root_move_cap = 0; // 0 searches every root move

    bool use_tt = true;
    bool use_null_move = true;
    bool use_quiescence = true;
    bool use_phase_heuristics = true;
    OpeningBook* book = nullptr;

    uint64_t seed = 0; // 0 draws from random_device
};

SearchOptions options_for(Difficulty d, const TierSettings& tier);

struct SearchResult {
    bool found = false;
    Move move{};
    int score = 0;
    int depth = 0;       // last fully completed depth
    uint64_t nodes = 0;
    std::string source;  // book | opening | endgame | search | forced | random
};

class Searcher {
public:
    explicit Searcher(TranspositionTable* tt = nullptr);

    // No move when `side` has none. A search cut short keeps the answer of
    // the last completed depth.
    SearchResult search(const Board& board, Side side, const SearchOptions& opts,
                        const std::atomic<bool>* stop = nullptr);

private:
    static constexpr int MAX_PLY = 64;
    static constexpr int Q_LIMIT = 10;
    static constexpr int INF = MATE_SCORE * 2;

    int negamax(int depth, int alpha, int beta, int ply, bool null_ok);
    int quiesce(int alpha, int beta, int q_depth);
    int static_eval() const;
    uint64_t tt_key() const;
    bool time_up();

    void order_moves(std::vector<Move>& moves, int ply, const Move* hash_move) const;
    void store_killer(const Move& m, int ply);
    void update_history(const Move& m, int depth);
    void play(const Move& m, UndoMove& u);
    void undo(const UndoMove& u, uint64_t saved_hash);

    TranspositionTable* tt_ = nullptr;
    SearchOptions opts_{};
    const std::atomic<bool>* stop_ = nullptr;
    std::chrono::steady_clock::time_point deadline_{};

    Board board_{};
    Side side_ = Side::Red;
    uint64_t hash_ = 0;
    uint64_t nodes_ = 0;
    bool aborted_ = false;

    Move killers_[MAX_PLY][2]{};
    bool killers_set_[MAX_PLY][2]{};
    std::vector<int> history_; // from_square * 90 + to_square
};

// Runs one search on its own thread over a copy of `board`. Waits up to
// the time budget plus `grace`, then raises the stop flag and still takes
// the best completed answer.
SearchResult run_search_task(const Board& board, Side side, const SearchOptions& opts,
                             TranspositionTable* tt, std::chrono::milliseconds grace);

} // namespace xiangqi

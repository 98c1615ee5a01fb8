#pragma once

#include "board.hpp"

#include <optional>
#include <vector>

namespace xiangqi {

static constexpr int MATE_SCORE = 10000000;

int piece_value(PieceKind kind);

// Static score from `perspective`'s side, own minus opponent. `extended`
// adds the check-path and aggression terms used by the stronger tiers.
int evaluate(const Board& board, Side perspective, bool extended);

// ── Phase heuristics ──────────────────────────────────────────────────────
// Fewer than six soldiers, cannons, horses or chariots off their start rows.
bool is_opening_phase(const Board& board);
// Fewer than twelve pieces left.
bool is_endgame_phase(const Board& board);

// Development move for the opening, if one scores above the threshold.
std::optional<Move> opening_pick(const Board& board, Side side, const std::vector<Move>& moves);
// Capture or check the enemy General, else close in when already near.
std::optional<Move> endgame_pick(const Board& board, Side side, const std::vector<Move>& moves);

} // namespace xiangqi

#pragma once

#include "board.hpp"

#include <cstdint>

namespace xiangqi {

// Flat key table addressed by ((kind * 2 + side) * 90 + square).
static constexpr int ZK_ENTRIES = KIND_COUNT * 2 * SQUARES;

inline int zobrist_index(PieceKind kind, Side side, int sq) {
    return (kind_index(kind) * 2 + side_index(side)) * SQUARES + sq;
}

uint64_t zobrist_piece_key(PieceKind kind, Side side, int sq);
uint64_t zobrist_black_to_move();

uint64_t zobrist_hash(const Board& board, Side to_move);

// Hash after `mover` played `u` (captured piece included), side flipped.
uint64_t zobrist_update(uint64_t h, const Piece& mover, const UndoMove& u);

// Passing the move only flips the side key.
inline uint64_t zobrist_null_move(uint64_t h) { return h ^ zobrist_black_to_move(); }

} // namespace xiangqi

#include "zobrist.hpp"

#include <array>

namespace xiangqi {
namespace {

static uint64_t splitmix64_next(uint64_t& x) {
    x += 0x9E3779B97F4A7C15ULL;
    uint64_t z = x;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

struct ZobristKeys {
    std::array<uint64_t, ZK_ENTRIES> piece_sq{};
    uint64_t black_to_move = 0;
};

// Fixed seed so hashes are stable across runs.
static const ZobristKeys& keys() {
    static const ZobristKeys k = [] {
        ZobristKeys out;
        uint64_t seed = 0x5A17A9C3D2E1F0B7ULL;
        for (auto& v : out.piece_sq) v = splitmix64_next(seed);
        out.black_to_move = splitmix64_next(seed);
        return out;
    }();
    return k;
}

} // namespace

uint64_t zobrist_piece_key(PieceKind kind, Side side, int sq) {
    if (sq < 0 || sq >= SQUARES) return 0;
    return keys().piece_sq[zobrist_index(kind, side, sq)];
}

uint64_t zobrist_black_to_move() { return keys().black_to_move; }

uint64_t zobrist_hash(const Board& board, Side to_move) {
    uint64_t h = (to_move == Side::Black) ? keys().black_to_move : 0;
    for (int sq = 0; sq < SQUARES; sq++) {
        const auto& cell = board.at(sq_coord(sq));
        if (cell) h ^= zobrist_piece_key(cell->kind, cell->side, sq);
    }
    return h;
}

uint64_t zobrist_update(uint64_t h, const Piece& mover, const UndoMove& u) {
    int from = sq_index(u.move.from);
    int to = sq_index(u.move.to);
    h ^= zobrist_piece_key(mover.kind, mover.side, from);
    h ^= zobrist_piece_key(mover.kind, mover.side, to);
    if (u.captured) h ^= zobrist_piece_key(u.captured->kind, u.captured->side, to);
    return h ^ keys().black_to_move;
}

} // namespace xiangqi

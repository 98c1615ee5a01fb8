#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace xiangqi {

enum class Bound : uint8_t { Exact = 0, Lower = 1, Upper = 2 };

struct TTEntry {
    uint64_t key = 0;
    int32_t score = 0;
    int16_t depth = -1;
    Bound bound = Bound::Exact;
    uint8_t age = 0;
    int8_t best_from = -1; // packed squares, -1 when no move
    int8_t best_to = -1;

    bool has_move() const { return best_from >= 0 && best_to >= 0; }
    Move best_move() const { return Move{sq_coord(best_from), sq_coord(best_to)}; }
};

// Two slots per cluster:
//   slot 0: replaced when empty, from an older search, or not deeper
//   slot 1: always replaced
class TranspositionTable {
public:
    explicit TranspositionTable(size_t size_mb = 16);

    void resize(size_t size_mb);
    void clear();

    // Ages existing entries so the next search can displace them.
    void new_search() { age_++; }
    uint8_t age() const { return age_; }

    const TTEntry* lookup(uint64_t key) const;
    void store(uint64_t key, int depth, Bound bound, int score, const Move* best);

    size_t cluster_count() const { return clusters_.size(); }

private:
    struct Cluster { TTEntry e[2]; };

    std::vector<Cluster> clusters_;
    size_t mask_ = 0;
    uint8_t age_ = 0;
};

} // namespace xiangqi

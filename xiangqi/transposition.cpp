#include "transposition.hpp"

#include <algorithm>

namespace xiangqi {

TranspositionTable::TranspositionTable(size_t size_mb) { resize(size_mb); }

void TranspositionTable::resize(size_t size_mb) {
    size_t bytes = std::max<size_t>(size_mb, 1) * 1024 * 1024;
    size_t want = bytes / sizeof(Cluster);
    // Round down to a power of two for mask indexing.
    size_t count = 1;
    while (count * 2 <= want) count *= 2;
    clusters_.assign(count, Cluster{});
    mask_ = count - 1;
    age_ = 0;
}

void TranspositionTable::clear() {
    std::fill(clusters_.begin(), clusters_.end(), Cluster{});
    age_ = 0;
}

const TTEntry* TranspositionTable::lookup(uint64_t key) const {
    if (clusters_.empty()) return nullptr;
    const Cluster& c = clusters_[key & mask_];
    const TTEntry* dp = &c.e[0];
    const TTEntry* ar = &c.e[1];
    bool dp_hit = dp->depth >= 0 && dp->key == key;
    bool ar_hit = ar->depth >= 0 && ar->key == key;
    if (dp_hit && ar_hit) {
        bool dp_current = dp->age == age_;
        bool ar_current = ar->age == age_;
        if (dp_current != ar_current) return dp_current ? dp : ar;
        return dp->depth >= ar->depth ? dp : ar;
    }
    if (dp_hit) return dp;
    if (ar_hit) return ar;
    return nullptr;
}

void TranspositionTable::store(uint64_t key, int depth, Bound bound, int score, const Move* best) {
    if (clusters_.empty()) return;
    Cluster& c = clusters_[key & mask_];
    auto write_entry = [&](TTEntry& e) {
        e.key = key;
        e.score = score;
        e.depth = (int16_t)std::min(depth, 32000);
        e.bound = bound;
        e.age = age_;
        if (best && valid_move(*best)) {
            e.best_from = (int8_t)sq_index(best->from);
            e.best_to = (int8_t)sq_index(best->to);
        } else {
            e.best_from = e.best_to = -1;
        }
    };

    TTEntry& depth_slot = c.e[0];
    bool empty = depth_slot.depth < 0;
    bool stale = depth_slot.age != age_;
    if (empty || stale || depth_slot.depth <= depth) write_entry(depth_slot);

    write_entry(c.e[1]);
}

} // namespace xiangqi

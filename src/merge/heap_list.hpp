#pragma once

#include "merge_strategy.hpp"

#include <cstdint>

namespace chipper {

/**
 * HeapListMerge - Min-heap of candidate pairs over an index-linked arena
 *
 * Tokens live in a flat node array linked by prev/next indices. Every
 * adjacent ranked pair sits in a min-heap keyed by (rank, left index).
 * Merging rewrites the left node, unlinks the right one and bumps both
 * generations; heap entries recorded against an older generation are
 * discarded when popped. O(n log n) per span.
 */
class HeapListMerge : public MergeStrategy {
public:
    chipper_merge_strategy_t type() const override { return CHIPPER_MERGE_HEAP_AND_LIST; }
    std::string name() const override { return "heap_and_list"; }

    void merge(const Vocabulary& vocab, std::vector<chipper_token_t>& tokens, size_t start) const override;

    static constexpr uint32_t kNone = UINT32_MAX;

    struct Node {
        chipper_token_t token;
        uint32_t prev;
        uint32_t next;
        uint32_t generation;
    };

    struct Candidate {
        uint32_t rank;
        uint32_t left;
        uint32_t right;
        uint32_t left_generation;
        uint32_t right_generation;
        chipper_token_t merged;
    };
};

} // namespace chipper

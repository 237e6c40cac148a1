#pragma once

#include "merge_strategy.hpp"

#include <cstdint>

namespace chipper {

/**
 * ParallelRankMerge - Rescan merge with pair ranks computed on a worker pool
 *
 * Each round fills the rank of every adjacent pair in parallel, then picks
 * the minimum sequentially. Only pays off for very long spans; short spans
 * fall below the grain and run inline.
 */
class ParallelRankMerge : public MergeStrategy {
public:
    // pool must outlive the strategy
    explicit ParallelRankMerge(WorkerPool& pool, int64_t min_grain = 256)
        : pool_(pool), min_grain_(min_grain) {}

    chipper_merge_strategy_t type() const override { return CHIPPER_MERGE_PARALLEL_RANK; }
    std::string name() const override { return "parallel_rank"; }

    void merge(const Vocabulary& vocab, std::vector<chipper_token_t>& tokens, size_t start) const override;

private:
    WorkerPool& pool_;
    int64_t min_grain_;
};

} // namespace chipper

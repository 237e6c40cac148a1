#pragma once

#include "merge_strategy.hpp"

namespace chipper {

/**
 * LinearRescanMerge - Reference merge engine
 *
 * Rescans every adjacent pair after each merge. O(n^2) per span, no extra
 * memory; the baseline the other strategies are checked against.
 */
class LinearRescanMerge : public MergeStrategy {
public:
    chipper_merge_strategy_t type() const override { return CHIPPER_MERGE_LINEAR_RESCAN; }
    std::string name() const override { return "linear_rescan"; }

    void merge(const Vocabulary& vocab, std::vector<chipper_token_t>& tokens, size_t start) const override;
};

} // namespace chipper

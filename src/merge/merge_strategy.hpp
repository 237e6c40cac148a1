#pragma once

#include <chipper/chipper_types.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chipper {

class Vocabulary;
class WorkerPool;

/**
 * MergeStrategy - Abstract BPE merge engine
 *
 * All strategies produce identical output: repeatedly merge the adjacent
 * pair with the lowest rank, leftmost on ties, until no adjacent pair has a
 * rank. They differ only in cost. Strategies are stateless between calls
 * and may be shared between threads.
 */
class MergeStrategy {
public:
    virtual ~MergeStrategy() = default;

    virtual chipper_merge_strategy_t type() const = 0;
    virtual std::string name() const = 0;

    /**
     * Encode one span and append its tokens to out
     *
     * Throws UnknownTokenError if a byte of the span has no single-byte token.
     */
    void encode_span(const Vocabulary& vocab, std::string_view span, std::vector<chipper_token_t>& out) const;

    /**
     * Merge tokens[start..] in place
     *
     * Tokens before start belong to earlier spans and are left untouched.
     */
    virtual void merge(const Vocabulary& vocab, std::vector<chipper_token_t>& tokens, size_t start) const = 0;
};

/**
 * Create a merge strategy by type
 *
 * @param pool  Worker pool for CHIPPER_MERGE_PARALLEL_RANK (ignored by the
 *              others). Must outlive the strategy.
 */
std::unique_ptr<MergeStrategy> create_merge_strategy(chipper_merge_strategy_t type, WorkerPool* pool = nullptr);

} // namespace chipper

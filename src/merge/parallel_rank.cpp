#include "parallel_rank.hpp"
#include "../compute/worker_pool.hpp"
#include "../core/vocabulary.hpp"

#include <limits>

namespace chipper {

namespace {

constexpr uint64_t kNoRank = std::numeric_limits<uint64_t>::max();

} // namespace

void ParallelRankMerge::merge(const Vocabulary& vocab, std::vector<chipper_token_t>& tokens, size_t start) const {
    std::vector<uint64_t> ranks;
    std::vector<chipper_token_t> merged;

    while (tokens.size() - start > 1) {
        size_t pairs = tokens.size() - start - 1;
        ranks.resize(pairs);
        merged.resize(pairs);

        pool_.parallel_for(0, static_cast<int64_t>(pairs), [&](int64_t p_start, int64_t p_end) {
            for (int64_t p = p_start; p < p_end; ++p) {
                size_t i = start + static_cast<size_t>(p);
                auto rule = vocab.rank_of(tokens[i], tokens[i + 1]);
                ranks[p] = rule ? rule->rank : kNoRank;
                merged[p] = rule ? rule->merged : 0;
            }
        }, min_grain_);

        size_t best = 0;
        for (size_t p = 1; p < pairs; ++p) {
            if (ranks[p] < ranks[best]) best = p;
        }
        if (ranks[best] == kNoRank) break;

        tokens[start + best] = merged[best];
        tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(start + best) + 1);
    }
}

} // namespace chipper

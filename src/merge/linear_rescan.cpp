#include "linear_rescan.hpp"
#include "../core/vocabulary.hpp"

namespace chipper {

void LinearRescanMerge::merge(const Vocabulary& vocab, std::vector<chipper_token_t>& tokens, size_t start) const {
    while (tokens.size() - start > 1) {
        bool found = false;
        size_t best = 0;
        MergeRule best_rule{0, 0};

        // Strict comparison keeps the leftmost pair on ties
        for (size_t i = start; i + 1 < tokens.size(); ++i) {
            auto rule = vocab.rank_of(tokens[i], tokens[i + 1]);
            if (rule && (!found || rule->rank < best_rule.rank)) {
                found = true;
                best = i;
                best_rule = *rule;
            }
        }

        if (!found) break;

        tokens[best] = best_rule.merged;
        tokens.erase(tokens.begin() + static_cast<std::ptrdiff_t>(best) + 1);
    }
}

} // namespace chipper

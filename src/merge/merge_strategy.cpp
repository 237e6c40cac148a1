#include "merge_strategy.hpp"
#include "linear_rescan.hpp"
#include "parallel_rank.hpp"
#include "heap_list.hpp"
#include "../core/errors.hpp"
#include "../core/vocabulary.hpp"

namespace chipper {

void MergeStrategy::encode_span(const Vocabulary& vocab, std::string_view span,
                                std::vector<chipper_token_t>& out) const {
    size_t start = out.size();
    out.reserve(start + span.size());

    for (char c : span) {
        auto byte = static_cast<uint8_t>(c);
        auto token = vocab.byte_token(byte);
        if (!token) {
            throw UnknownTokenError("No single-byte token for byte value " + std::to_string(byte), byte);
        }
        out.push_back(*token);
    }

    if (out.size() - start <= 1) return;
    merge(vocab, out, start);
}

std::unique_ptr<MergeStrategy> create_merge_strategy(chipper_merge_strategy_t type, WorkerPool* pool) {
    switch (type) {
        case CHIPPER_MERGE_LINEAR_RESCAN:
            return std::make_unique<LinearRescanMerge>();
        case CHIPPER_MERGE_PARALLEL_RANK:
            if (pool == nullptr) {
                throw ConfigError("Parallel rank merging requires a worker pool");
            }
            return std::make_unique<ParallelRankMerge>(*pool);
        case CHIPPER_MERGE_HEAP_AND_LIST:
            return std::make_unique<HeapListMerge>();
        default:
            throw ConfigError("Unknown merge strategy " + std::to_string(static_cast<int>(type)));
    }
}

} // namespace chipper

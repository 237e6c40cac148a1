#include "heap_list.hpp"
#include "../core/vocabulary.hpp"

#include <queue>

namespace chipper {

namespace {

using Node = HeapListMerge::Node;
using Candidate = HeapListMerge::Candidate;

// Min-heap on (rank, left index): lowest rank first, leftmost on ties
struct CandidateAfter {
    bool operator()(const Candidate& a, const Candidate& b) const {
        if (a.rank != b.rank) return a.rank > b.rank;
        return a.left > b.left;
    }
};

using CandidateHeap = std::priority_queue<Candidate, std::vector<Candidate>, CandidateAfter>;

void push_candidate(const Vocabulary& vocab, const std::vector<Node>& nodes, uint32_t left, CandidateHeap& heap) {
    uint32_t right = nodes[left].next;
    if (right == HeapListMerge::kNone) return;

    auto rule = vocab.rank_of(nodes[left].token, nodes[right].token);
    if (!rule) return;

    heap.push(Candidate{rule->rank, left, right, nodes[left].generation, nodes[right].generation, rule->merged});
}

} // namespace

void HeapListMerge::merge(const Vocabulary& vocab, std::vector<chipper_token_t>& tokens, size_t start) const {
    const auto count = static_cast<uint32_t>(tokens.size() - start);

    std::vector<Node> nodes(count);
    for (uint32_t i = 0; i < count; ++i) {
        nodes[i].token = tokens[start + i];
        nodes[i].prev = i == 0 ? kNone : i - 1;
        nodes[i].next = i + 1 == count ? kNone : i + 1;
        nodes[i].generation = 0;
    }

    CandidateHeap heap;
    for (uint32_t i = 0; i + 1 < count; ++i) {
        push_candidate(vocab, nodes, i, heap);
    }

    while (!heap.empty()) {
        Candidate top = heap.top();
        heap.pop();

        Node& left = nodes[top.left];
        Node& right = nodes[top.right];
        if (left.generation != top.left_generation || right.generation != top.right_generation ||
            left.next != top.right) {
            continue;   // stale
        }

        left.token = top.merged;
        ++left.generation;
        ++right.generation;

        left.next = right.next;
        if (right.next != kNone) {
            nodes[right.next].prev = top.left;
        }

        if (left.prev != kNone) {
            push_candidate(vocab, nodes, left.prev, heap);
        }
        push_candidate(vocab, nodes, top.left, heap);
    }

    // Node 0 is never unlinked: merges always keep the left node
    size_t out = start;
    for (uint32_t i = 0; i != kNone; i = nodes[i].next) {
        tokens[out++] = nodes[i].token;
    }
    tokens.resize(out);
}

} // namespace chipper

#include "vocabulary.hpp"
#include "errors.hpp"
#include "../util/logger.hpp"

#include <algorithm>
#include <sstream>

namespace chipper {

namespace {

std::string printable(const std::string& bytes) {
    std::ostringstream ss;
    for (unsigned char c : bytes) {
        if (c >= 0x20 && c < 0x7f && c != '\\') {
            ss << static_cast<char>(c);
        } else {
            static const char* hex = "0123456789abcdef";
            ss << "\\x" << hex[c >> 4] << hex[c & 0xf];
        }
    }
    return ss.str();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Vocabulary::Vocabulary(std::vector<TokenEntry> tokens, std::vector<MergeEntry> merges,
                       std::vector<SpecialToken> specials) {
    index_tokens(std::move(tokens));
    index_specials(std::move(specials));
    index_merges(merges);

    create_logger("Vocabulary")->debug("Built vocabulary: {} tokens, {} merges, {} specials, {}/256 bytes",
                                       tokens_.size(), merges_.size(), specials_.size(), byte_count_);
}

std::shared_ptr<const Vocabulary> Vocabulary::from_ranked_tokens(std::vector<TokenEntry> tokens,
                                                                 std::vector<SpecialToken> specials) {
    // Resolve halves against the raw table; duplicates are reported by the constructor
    std::unordered_map<std::string, chipper_token_t> lookup;
    lookup.reserve(tokens.size());
    for (const auto& entry : tokens) {
        lookup.emplace(entry.bytes, entry.id);
    }

    std::vector<MergeEntry> merges;
    for (const auto& entry : tokens) {
        const std::string& bytes = entry.bytes;
        for (size_t split = 1; split < bytes.size(); ++split) {
            auto left = lookup.find(bytes.substr(0, split));
            if (left == lookup.end()) continue;
            auto right = lookup.find(bytes.substr(split));
            if (right == lookup.end()) continue;
            merges.push_back({left->second, right->second, entry.id, entry.id});
        }
    }

    return std::make_shared<const Vocabulary>(std::move(tokens), std::move(merges), std::move(specials));
}

void Vocabulary::index_tokens(std::vector<TokenEntry> tokens) {
    tokens_.reserve(tokens.size());
    decoder_.reserve(tokens.size());

    for (auto& entry : tokens) {
        if (entry.bytes.empty()) {
            throw VocabularyError("Token " + std::to_string(entry.id) + " has an empty byte sequence");
        }
        if (decoder_.count(entry.id)) {
            throw VocabularyError("Duplicate token id " + std::to_string(entry.id));
        }
        if (tokens_.count(entry.bytes)) {
            throw VocabularyError("Duplicate token bytes \"" + printable(entry.bytes) + "\" (ids " +
                                  std::to_string(tokens_.at(entry.bytes)) + " and " +
                                  std::to_string(entry.id) + ")");
        }

        if (entry.bytes.size() == 1) {
            auto b = static_cast<uint8_t>(entry.bytes[0]);
            byte_tokens_[b] = entry.id;
            byte_present_[b] = true;
            ++byte_count_;
        }

        max_id_ = std::max(max_id_, entry.id);
        tokens_.emplace(entry.bytes, entry.id);
        decoder_.emplace(entry.id, std::move(entry.bytes));
    }
}

void Vocabulary::index_specials(std::vector<SpecialToken> specials) {
    for (const auto& special : specials) {
        if (special.bytes.empty()) {
            throw VocabularyError("Special token " + std::to_string(special.id) + " has an empty byte sequence");
        }
        if (decoder_.count(special.id)) {
            throw VocabularyError("Special token id " + std::to_string(special.id) + " is already in use");
        }
        if (tokens_.count(special.bytes) || special_ids_.count(special.bytes)) {
            throw VocabularyError("Special token \"" + printable(special.bytes) + "\" is already in use");
        }

        max_id_ = std::max(max_id_, special.id);
        special_ids_.emplace(special.bytes, special.id);
        decoder_.emplace(special.id, special.bytes);
    }
    specials_ = std::move(specials);
}

void Vocabulary::index_merges(const std::vector<MergeEntry>& merges) {
    auto is_normal = [this](chipper_token_t id) {
        return decoder_.count(id) && !special_ids_.count(decoder_.at(id));
    };

    for (const auto& merge : merges) {
        if (!is_normal(merge.left) || !is_normal(merge.right) || !is_normal(merge.merged)) {
            throw VocabularyError("Dangling merge target (" + std::to_string(merge.left) + ", " +
                                  std::to_string(merge.right) + ") -> " + std::to_string(merge.merged));
        }
    }

    check_merge_cycles(merges);

    std::unordered_map<uint32_t, chipper_token_t> rank_targets;
    merges_.reserve(merges.size());

    for (const auto& merge : merges) {
        const std::string& merged = decoder_.at(merge.merged);
        if (merged != decoder_.at(merge.left) + decoder_.at(merge.right)) {
            throw VocabularyError("Inconsistent merge (" + std::to_string(merge.left) + ", " +
                                  std::to_string(merge.right) + ") -> " + std::to_string(merge.merged) +
                                  ": bytes do not concatenate to \"" + printable(merged) + "\"");
        }

        auto rank = rank_targets.emplace(merge.rank, merge.merged);
        if (!rank.second && rank.first->second != merge.merged) {
            throw VocabularyError("Rank " + std::to_string(merge.rank) + " is shared by merges into " +
                                  std::to_string(rank.first->second) + " and " + std::to_string(merge.merged));
        }

        if (!merges_.emplace(pair_key(merge.left, merge.right), MergeRule{merge.merged, merge.rank}).second) {
            throw VocabularyError("Duplicate merge pair (" + std::to_string(merge.left) + ", " +
                                  std::to_string(merge.right) + ")");
        }
    }
}

void Vocabulary::check_merge_cycles(const std::vector<MergeEntry>& merges) const {
    // merged -> parts it is built from
    std::unordered_map<chipper_token_t, std::vector<chipper_token_t>> parts;
    for (const auto& merge : merges) {
        auto& p = parts[merge.merged];
        p.push_back(merge.left);
        p.push_back(merge.right);
    }

    enum class Mark : uint8_t { InProgress, Done };
    std::unordered_map<chipper_token_t, Mark> marks;

    for (const auto& root : parts) {
        if (marks.count(root.first)) continue;

        // (node, index of the next part to visit)
        std::vector<std::pair<chipper_token_t, size_t>> stack;
        stack.emplace_back(root.first, 0);
        marks[root.first] = Mark::InProgress;

        while (!stack.empty()) {
            auto& top = stack.back();
            auto it = parts.find(top.first);
            if (it == parts.end() || top.second >= it->second.size()) {
                marks[top.first] = Mark::Done;
                stack.pop_back();
                continue;
            }

            chipper_token_t next = it->second[top.second++];
            auto mark = marks.find(next);
            if (mark == marks.end()) {
                marks[next] = Mark::InProgress;
                stack.emplace_back(next, 0);
            } else if (mark->second == Mark::InProgress) {
                throw VocabularyError("Cyclic merge reference through token " + std::to_string(next));
            }
        }
    }
}

// ============================================================================
// Lookups
// ============================================================================

std::optional<chipper_token_t> Vocabulary::id_of(std::string_view bytes) const {
    auto it = tokens_.find(std::string(bytes));
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

const std::string* Vocabulary::bytes_of(chipper_token_t id) const {
    auto it = decoder_.find(id);
    if (it == decoder_.end()) return nullptr;
    return &it->second;
}

std::optional<chipper_token_t> Vocabulary::special_id_of(std::string_view bytes) const {
    auto it = special_ids_.find(std::string(bytes));
    if (it == special_ids_.end()) return std::nullopt;
    return it->second;
}

bool Vocabulary::is_special(chipper_token_t id) const {
    auto it = decoder_.find(id);
    return it != decoder_.end() && special_ids_.count(it->second) != 0;
}

} // namespace chipper

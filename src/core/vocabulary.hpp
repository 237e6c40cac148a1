#pragma once

#include <chipper/chipper_types.h>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chipper {

// Normal (mergeable) token
struct TokenEntry {
    std::string bytes;
    chipper_token_t id;
};

// (left, right) -> merged, lower rank merges first
struct MergeEntry {
    chipper_token_t left;
    chipper_token_t right;
    chipper_token_t merged;
    uint32_t rank;
};

// Result of a pair lookup
struct MergeRule {
    chipper_token_t merged;
    uint32_t rank;
};

// Out-of-band token matched literally by the spanner
struct SpecialToken {
    std::string bytes;
    chipper_token_t id;
};

/**
 * Vocabulary - Immutable BPE rank table
 *
 * Holds the byte-sequence <-> id mapping, the pair merge table, the
 * single-byte token table and the special tokens. Validated completely at
 * construction; every lookup afterwards is a const read, so one instance is
 * shared by all threads without locking.
 */
class Vocabulary {
public:
    // Throws VocabularyError if the table is malformed or inconsistent
    Vocabulary(std::vector<TokenEntry> tokens, std::vector<MergeEntry> merges,
               std::vector<SpecialToken> specials = {});

    // tiktoken convention: rank == id, merges derived from the token bytes
    static std::shared_ptr<const Vocabulary> from_ranked_tokens(
        std::vector<TokenEntry> tokens, std::vector<SpecialToken> specials = {});

    Vocabulary(const Vocabulary&) = delete;
    Vocabulary& operator=(const Vocabulary&) = delete;

    // Pair lookup
    std::optional<MergeRule> rank_of(chipper_token_t left, chipper_token_t right) const {
        auto it = merges_.find(pair_key(left, right));
        if (it == merges_.end()) return std::nullopt;
        return it->second;
    }

    // Normal token lookup by bytes
    std::optional<chipper_token_t> id_of(std::string_view bytes) const;

    // Bytes of a normal or special token
    const std::string* bytes_of(chipper_token_t id) const;

    // Single-byte token for a byte value
    std::optional<chipper_token_t> byte_token(uint8_t byte) const {
        if (!byte_present_[byte]) return std::nullopt;
        return byte_tokens_[byte];
    }

    // Special tokens
    std::optional<chipper_token_t> special_id_of(std::string_view bytes) const;
    bool is_special(chipper_token_t id) const;
    const std::vector<SpecialToken>& specials() const { return specials_; }

    // Sizes
    size_t size() const { return tokens_.size() + specials_.size(); }
    size_t normal_count() const { return tokens_.size(); }
    size_t merge_count() const { return merges_.size(); }
    bool empty() const { return size() == 0; }
    bool covers_all_bytes() const { return byte_count_ == 256; }

    // Highest id in use (normal or special)
    chipper_token_t max_id() const { return max_id_; }

private:
    static uint64_t pair_key(chipper_token_t left, chipper_token_t right) {
        return (static_cast<uint64_t>(left) << 32) | right;
    }

    void index_tokens(std::vector<TokenEntry> tokens);
    void index_specials(std::vector<SpecialToken> specials);
    void index_merges(const std::vector<MergeEntry>& merges);
    void check_merge_cycles(const std::vector<MergeEntry>& merges) const;

    std::unordered_map<std::string, chipper_token_t> tokens_;
    std::unordered_map<chipper_token_t, std::string> decoder_;
    std::unordered_map<uint64_t, MergeRule> merges_;

    std::array<chipper_token_t, 256> byte_tokens_{};
    std::array<bool, 256> byte_present_{};
    int byte_count_ = 0;

    std::vector<SpecialToken> specials_;
    std::unordered_map<std::string, chipper_token_t> special_ids_;

    chipper_token_t max_id_ = 0;
};

} // namespace chipper

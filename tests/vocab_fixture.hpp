#pragma once

/**
 * Chipper - Shared test vocabulary builder
 */

#include "core/vocabulary.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace chipper {
namespace testing {

// Builds a byte-level vocabulary: ids 0-255 are the single bytes, merges
// get consecutive ids from 256 and ranks in the order they are added.
class VocabFixture {
public:
    explicit VocabFixture(bool all_bytes = true) {
        if (all_bytes) {
            for (int b = 0; b < 256; ++b) {
                add_token(std::string(1, static_cast<char>(b)));
            }
        }
    }

    chipper_token_t add_token(const std::string& bytes) {
        auto it = ids_.find(bytes);
        if (it != ids_.end()) return it->second;
        chipper_token_t id = next_id_++;
        ids_.emplace(bytes, id);
        tokens_.push_back({bytes, id});
        return id;
    }

    // (left, right) -> left + right, at the next rank
    chipper_token_t merge(const std::string& left, const std::string& right) {
        chipper_token_t l = id(left);
        chipper_token_t r = id(right);
        chipper_token_t merged = add_token(left + right);
        merges_.push_back({l, r, merged, next_rank_++});
        return merged;
    }

    chipper_token_t id(const std::string& bytes) const { return ids_.at(bytes); }
    bool has(const std::string& bytes) const { return ids_.count(bytes) != 0; }

    std::shared_ptr<const Vocabulary> build(std::vector<SpecialToken> specials = {}) const {
        return std::make_shared<const Vocabulary>(tokens_, merges_, std::move(specials));
    }

    // The "hello" chain: (h,e) (he,l) (hel,l) (hell,o)
    static VocabFixture hello() {
        VocabFixture fixture;
        fixture.merge("h", "e");
        fixture.merge("he", "l");
        fixture.merge("hel", "l");
        fixture.merge("hell", "o");
        return fixture;
    }

    // English-ish merges, enough to exercise real merge orders
    static VocabFixture english() {
        VocabFixture fixture;
        const char* pairs[][2] = {
            {"t", "h"}, {"th", "e"}, {" ", "t"}, {" t", "he"}, {"i", "n"}, {"e", "r"},
            {"a", "n"}, {" ", "a"}, {"o", "n"}, {"r", "e"}, {"e", "s"}, {" ", "s"},
            {"in", "g"}, {"o", "r"}, {" a", "nd"}, {"an", "d"}, {"l", "l"}, {"h", "e"},
            {"he", "ll"}, {"hell", "o"}, {" ", "w"}, {"o", "r"}, {" w", "or"}, {"l", "d"},
            {" wor", "ld"}, {"1", "2"}, {"12", "3"}, {"\n", "\n"}, {" ", " "}, {"e", "d"},
        };
        for (const auto& pair : pairs) {
            std::string left = pair[0];
            std::string right = pair[1];
            if (fixture.has(left + right)) continue;
            if (!fixture.has(left) || !fixture.has(right)) continue;
            fixture.merge(left, right);
        }
        return fixture;
    }

private:
    std::vector<TokenEntry> tokens_;
    std::vector<MergeEntry> merges_;
    std::unordered_map<std::string, chipper_token_t> ids_;
    chipper_token_t next_id_ = 0;
    uint32_t next_rank_ = 0;
};

} // namespace testing
} // namespace chipper

/**
 * Chipper - Vocabulary Unit Tests
 */

#include "core/vocabulary.hpp"
#include "core/errors.hpp"
#include "vocab_fixture.hpp"
#include <iostream>
#include <cassert>
#include <functional>

using namespace chipper;
using chipper::testing::VocabFixture;

// Returns the code of the VocabularyError thrown by fn, or SUCCESS
static chipper_error_t construction_error(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const VocabularyError& e) {
        return e.code();
    }
    return CHIPPER_SUCCESS;
}

void test_lookups() {
    std::cout << "Testing vocabulary lookups... ";

    auto vocab = VocabFixture::hello().build();

    assert(vocab->size() == 260);
    assert(vocab->normal_count() == 260);
    assert(vocab->merge_count() == 4);
    assert(vocab->covers_all_bytes());
    assert(!vocab->empty());

    // Single bytes
    for (int b = 0; b < 256; ++b) {
        auto id = vocab->byte_token(static_cast<uint8_t>(b));
        assert(id && *id == static_cast<chipper_token_t>(b));
    }

    // Merge chain
    auto he = vocab->rank_of('h', 'e');
    assert(he && he->merged == 256 && he->rank == 0);
    auto hello = vocab->rank_of(258, 'o');
    assert(hello && hello->merged == 259 && hello->rank == 3);
    assert(!vocab->rank_of('e', 'h'));

    assert(*vocab->id_of("hell") == 258);
    assert(!vocab->id_of("hellx"));
    assert(*vocab->bytes_of(259) == "hello");
    assert(vocab->bytes_of(9999) == nullptr);
    assert(vocab->max_id() == 259);

    std::cout << "PASSED" << std::endl;
}

void test_special_tokens() {
    std::cout << "Testing special tokens... ";

    auto vocab = VocabFixture::hello().build({{"<|endoftext|>", 1000}, {"<|pad|>", 1001}});

    assert(vocab->size() == 262);
    assert(vocab->normal_count() == 260);
    assert(vocab->specials().size() == 2);
    assert(*vocab->special_id_of("<|endoftext|>") == 1000);
    assert(!vocab->special_id_of("hello"));
    assert(vocab->is_special(1001));
    assert(!vocab->is_special(259));
    assert(*vocab->bytes_of(1000) == "<|endoftext|>");

    // Specials are never normal tokens
    assert(!vocab->id_of("<|endoftext|>"));
    assert(vocab->max_id() == 1001);

    std::cout << "PASSED" << std::endl;
}

void test_ranked_tokens() {
    std::cout << "Testing merges derived from ranked tokens... ";

    std::vector<TokenEntry> tokens = {
        {"a", 0}, {"b", 1}, {"c", 2}, {"ab", 3}, {"bc", 4}, {"abc", 5},
    };
    auto vocab = Vocabulary::from_ranked_tokens(tokens);

    // ab, bc, and abc both as (ab, c) and (a, bc)
    assert(vocab->merge_count() == 4);
    assert(vocab->rank_of(0, 1)->merged == 3);
    assert(vocab->rank_of(0, 1)->rank == 3);
    assert(vocab->rank_of(3, 2)->merged == 5);
    assert(vocab->rank_of(0, 4)->merged == 5);
    assert(vocab->rank_of(0, 4)->rank == 5);
    assert(!vocab->rank_of(1, 0));

    std::cout << "PASSED" << std::endl;
}

void test_construction_errors() {
    std::cout << "Testing vocabulary construction errors... ";

    // Duplicate id
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"b", 0}}, {});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Duplicate bytes
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"a", 1}}, {});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Empty bytes
    assert(construction_error([] {
        Vocabulary v({{"", 0}}, {});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Dangling merge target
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"b", 1}}, {{0, 1, 7, 0}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Merge whose bytes do not concatenate
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"b", 1}, {"ba", 2}}, {{0, 1, 2, 0}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Cycle: 2 built from itself
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"aa", 1}, {"aaaa", 2}}, {{0, 0, 1, 0}, {2, 0, 2, 1}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Duplicate pair
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"b", 1}, {"ab", 2}}, {{0, 1, 2, 0}, {0, 1, 2, 1}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Equal rank, different results
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"b", 1}, {"ab", 2}, {"ba", 3}}, {{0, 1, 2, 5}, {1, 0, 3, 5}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Special colliding with a normal id or normal bytes
    assert(construction_error([] {
        Vocabulary v({{"a", 0}}, {}, {{"<s>", 0}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);
    assert(construction_error([] {
        Vocabulary v({{"a", 0}}, {}, {{"a", 1}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Merges may not produce or consume specials
    assert(construction_error([] {
        Vocabulary v({{"a", 0}}, {{0, 0, 1, 0}}, {{"aa", 1}});
    }) == CHIPPER_ERROR_VOCAB_INVALID);

    // Equal rank, same result is fine
    assert(construction_error([] {
        Vocabulary v({{"a", 0}, {"b", 1}, {"c", 2}, {"ab", 3}, {"bc", 4}, {"abc", 5}},
                     {{0, 1, 3, 0}, {1, 2, 4, 1}, {3, 2, 5, 2}, {0, 4, 5, 2}});
    }) == CHIPPER_SUCCESS);

    std::cout << "PASSED" << std::endl;
}

void test_partial_byte_coverage() {
    std::cout << "Testing partial byte coverage... ";

    Vocabulary vocab({{"a", 10}, {"b", 11}, {"ab", 12}}, {{10, 11, 12, 0}});

    assert(!vocab.covers_all_bytes());
    assert(*vocab.byte_token('a') == 10);
    assert(!vocab.byte_token('z'));
    assert(!vocab.byte_token(0));

    Vocabulary empty({}, {});
    assert(empty.empty());
    assert(empty.size() == 0);

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Chipper - Vocabulary Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_lookups();
        test_special_tokens();
        test_ranked_tokens();
        test_construction_errors();
        test_partial_byte_coverage();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}

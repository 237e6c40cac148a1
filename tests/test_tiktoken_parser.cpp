/**
 * Chipper - tiktoken Rank File Unit Tests
 */

#include "format/tiktoken_parser.hpp"
#include "core/errors.hpp"
#include "core/tokenizer.hpp"
#include <iostream>
#include <cassert>
#include <cstdio>
#include <fstream>

using namespace chipper;

// Returns the code of the Error thrown while parsing, or SUCCESS
static chipper_error_t parse_error(const std::string& text) {
    try {
        parse_tiktoken_vocab(text);
    } catch (const Error& e) {
        return e.code();
    }
    return CHIPPER_SUCCESS;
}

void test_base64() {
    std::cout << "Testing base64 decoding... ";

    std::string out;
    assert(base64_decode("", &out) && out.empty());
    assert(base64_decode("aGVsbG8=", &out) && out == "hello");
    assert(base64_decode("aGk=", &out) && out == "hi");
    assert(base64_decode("YQ==", &out) && out == "a");
    assert(base64_decode("IHdvcmxk", &out) && out == " world");
    assert(base64_decode("/w==", &out) && out == "\xff");

    assert(!base64_decode("aGk", &out));       // length
    assert(!base64_decode("a===", &out));      // padding too early
    assert(!base64_decode("aG=k", &out));      // data after padding
    assert(!base64_decode("aG!k", &out));      // alphabet
    assert(!base64_decode("YQ==YQ==", &out));  // padding mid-stream

    std::cout << "PASSED" << std::endl;
}

void test_parse_ranks() {
    std::cout << "Testing rank file parsing... ";

    // a=0 b=1 ab=2 c=3 abc=4
    const std::string text = "YQ== 0\nYg== 1\r\nYWI= 2\n\nYw== 3\nYWJj 4\n";
    auto vocab = parse_tiktoken_vocab(text, {{"<|endoftext|>", 100}});

    assert(vocab->normal_count() == 5);
    assert(vocab->size() == 6);
    assert(*vocab->id_of("abc") == 4);
    assert(*vocab->special_id_of("<|endoftext|>") == 100);

    // Derived merges rank by the merged token id
    auto ab = vocab->rank_of(0, 1);
    assert(ab && ab->merged == 2 && ab->rank == 2);
    auto abc = vocab->rank_of(2, 3);
    assert(abc && abc->merged == 4 && abc->rank == 4);

    chipper_tokenizer_config_t config = chipper_tokenizer_config_default();
    config.num_threads = 1;
    Tokenizer tokenizer(vocab, config);
    assert((tokenizer.encode("abcab") == std::vector<chipper_token_t>{4, 2}));
    assert((tokenizer.encode("abc<|endoftext|>") == std::vector<chipper_token_t>{4, 100}));

    std::cout << "PASSED" << std::endl;
}

void test_parse_errors() {
    std::cout << "Testing malformed rank files... ";

    assert(parse_error("YQ==\n") == CHIPPER_ERROR_FILE_INVALID);
    assert(parse_error("YQ== x\n") == CHIPPER_ERROR_FILE_INVALID);
    assert(parse_error("YQ== -1\n") == CHIPPER_ERROR_FILE_INVALID);
    assert(parse_error("YQ== 99999999999\n") == CHIPPER_ERROR_FILE_INVALID);
    assert(parse_error("Y!== 0\n") == CHIPPER_ERROR_FILE_INVALID);
    assert(parse_error("YQ== 0\nYQ== 1\n") == CHIPPER_ERROR_VOCAB_INVALID);
    assert(parse_error("YQ== 0\nYg== 0\n") == CHIPPER_ERROR_VOCAB_INVALID);

    // The message points at the line
    try {
        parse_tiktoken_vocab("YQ== 0\nbroken\n");
        assert(false);
    } catch (const Error& e) {
        assert(std::string(e.what()).find("line 2") != std::string::npos);
    }

    std::cout << "PASSED" << std::endl;
}

void test_load_file() {
    std::cout << "Testing rank file loading... ";

    const std::string path = "chipper_test_ranks.tiktoken";
    {
        std::ofstream file(path, std::ios::binary);
        file << "aA== 0\naQ== 1\naGk= 2\n";
    }

    auto vocab = load_tiktoken_vocab(path);
    assert(vocab->size() == 3);
    assert(*vocab->id_of("hi") == 2);
    std::remove(path.c_str());

    bool threw = false;
    try {
        load_tiktoken_vocab("does/not/exist.tiktoken");
    } catch (const Error& e) {
        threw = true;
        assert(e.code() == CHIPPER_ERROR_FILE_NOT_FOUND);
    }
    assert(threw);

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Chipper - tiktoken Parser Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_base64();
        test_parse_ranks();
        test_parse_errors();
        test_load_file();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}

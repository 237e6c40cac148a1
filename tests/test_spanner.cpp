/**
 * Chipper - Spanner Unit Tests
 */

#include "spanning/spanner.hpp"
#include "spanning/pattern_lexer.hpp"
#include "spanning/automaton_lexer.hpp"
#include "spanning/utf8.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <cassert>
#include <random>
#include <string>
#include <vector>

using namespace chipper;

static TextSpanner make_spanner(chipper_spanner_type_t type, const std::vector<std::string>& specials = {},
                                bool strict = false) {
    return TextSpanner(create_word_lexer(type), specials, strict);
}

// Span texts, for readable expectations
static std::vector<std::string> pieces(const TextSpanner& spanner, const std::string& text) {
    std::vector<std::string> result;
    for (const auto& span : spanner.split(text)) {
        result.push_back(text.substr(span.begin, span.size()));
    }
    return result;
}

static void check_both(const std::string& text, const std::vector<std::string>& expected) {
    auto pattern = make_spanner(CHIPPER_SPANNER_PATTERN);
    auto automaton = make_spanner(CHIPPER_SPANNER_AUTOMATON);
    assert(pieces(pattern, text) == expected);
    assert(pieces(automaton, text) == expected);
}

void test_utf8_validation() {
    std::cout << "Testing UTF-8 validation... ";

    assert(utf8::valid_prefix("") == 0);
    assert(utf8::valid_prefix("hello") == 5);
    assert(utf8::valid_prefix("h\xc3\xa9llo") == 6);                 // é
    assert(utf8::valid_prefix("\xe4\xbd\xa0\xe5\xa5\xbd") == 6);     // 你好
    assert(utf8::valid_prefix("\xf0\x9f\x98\x80") == 4);             // U+1F600

    assert(utf8::valid_prefix("abc\xff") == 3);
    assert(utf8::valid_prefix("ab\x80") == 2);                       // stray continuation
    assert(utf8::valid_prefix("ab\xc0\xaf") == 2);                   // overlong
    assert(utf8::valid_prefix("ab\xe0\x80\xaf") == 2);               // overlong
    assert(utf8::valid_prefix("ab\xed\xa0\x80") == 2);               // surrogate
    assert(utf8::valid_prefix("ab\xf4\x90\x80\x80") == 2);           // > U+10FFFF
    assert(utf8::valid_prefix("ab\xe4\xbd") == 2);                   // truncated

    std::cout << "PASSED" << std::endl;
}

void test_word_rules() {
    std::cout << "Testing word rules... ";

    check_both("", {});
    check_both("Hello world", {"Hello", " world"});
    check_both("I'm here, they'll see", {"I", "'m", " here", ",", " they", "'ll", " see"});
    check_both("WE'RE DON'T", {"WE", "'RE", " DON", "'T"});
    check_both("'sup", {"'s", "up"});
    check_both("1234567", {"123", "456", "7"});
    check_both("abc123def", {"abc", "123", "def"});
    check_both("a  b", {"a", " ", " b"});
    check_both("a   b", {"a", "  ", " b"});
    check_both("hi\n\nthere", {"hi", "\n\n", "there"});
    check_both("x  \n  y", {"x", "  \n", " ", " y"});
    check_both("trailing   ", {"trailing", "   "});
    check_both("Hello!!!\n\nNext", {"Hello", "!!!\n\n", "Next"});
    check_both("a ...b", {"a", " ...", "b"});
    check_both("\thello", {"\thello"});
    check_both("$100", {"$", "100"});
    check_both("   ", {"   "});

    std::cout << "PASSED" << std::endl;
}

void test_unicode_rules() {
    std::cout << "Testing Unicode rules... ";

    check_both("h\xc3\xa9llo w\xc3\xb6rld", {"h\xc3\xa9llo", " w\xc3\xb6rld"});
    check_both("\xe4\xbd\xa0\xe5\xa5\xbd \xe4\xb8\x96\xe7\x95\x8c",
               {"\xe4\xbd\xa0\xe5\xa5\xbd", " \xe4\xb8\x96\xe7\x95\x8c"});
    // Emoji is neither letter nor number
    check_both("hi \xf0\x9f\x98\x80\xf0\x9f\x98\x80!", {"hi", " \xf0\x9f\x98\x80\xf0\x9f\x98\x80!"});
    // U+00A0 is White_Space and may lead a word
    check_both("a\xc2\xa0" "b", {"a", "\xc2\xa0" "b"});
    // Superscript two is a number
    check_both("x\xc2\xb2", {"x", "\xc2\xb2"});

    std::cout << "PASSED" << std::endl;
}

void test_spanner_equivalence() {
    std::cout << "Testing pattern/automaton equivalence... ";

    const std::vector<std::string> alphabet = {
        "a", "Z", "q", "s", "t", "l", "L", "v", "e", "R", "0", "7", " ", " ", "\t", "\n", "\r", "'", "'",
        "!", ".", ",", "$", "-", "_",
        "\xc3\xa9",             // é
        "\xe4\xbd\xa0",         // 你
        "\xc2\xa0",             // NBSP
        "\xe2\x80\xa8",         // LINE SEPARATOR
        "\xc2\x85",             // NEL
        "\xe2\x85\xab",         // ROMAN NUMERAL TWELVE (Nl)
        "\xc2\xb2",             // SUPERSCRIPT TWO (No)
        "\xcc\x81",             // COMBINING ACUTE (Mn)
        "\xf0\x9f\x98\x80",     // GRINNING FACE
        "\xe3\x80\x80",         // IDEOGRAPHIC SPACE
    };

    auto pattern = make_spanner(CHIPPER_SPANNER_PATTERN);
    auto automaton = make_spanner(CHIPPER_SPANNER_AUTOMATON);

    std::mt19937 rng(1234);
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::uniform_int_distribution<int> length(0, 40);

    for (int round = 0; round < 3000; ++round) {
        std::string text;
        int n = length(rng);
        for (int i = 0; i < n; ++i) {
            text += alphabet[pick(rng)];
        }

        auto expected = pattern.split(text);
        auto actual = automaton.split(text);
        if (expected != actual) {
            std::cerr << "Spanner mismatch on input of " << text.size() << " bytes" << std::endl;
        }
        assert(expected == actual);
    }

    std::cout << "PASSED" << std::endl;
}

void test_spans_cover_input() {
    std::cout << "Testing span coverage... ";

    auto spanner = make_spanner(CHIPPER_SPANNER_AUTOMATON, {"<|endoftext|>"});
    std::string text = "Some text<|endoftext|>\n  more\xff\xfe";

    auto spans = spanner.split(text);
    size_t cursor = 0;
    for (const auto& span : spans) {
        assert(span.begin == cursor);
        assert(span.end > span.begin);
        cursor = span.end;
    }
    assert(cursor == text.size());

    std::cout << "PASSED" << std::endl;
}

void test_special_tokens() {
    std::cout << "Testing special token spans... ";

    auto spanner = make_spanner(CHIPPER_SPANNER_PATTERN, {"<|endoftext|>", "<s>", "<s>>"});

    std::string text = "a<|endoftext|>b";
    auto spans = spanner.split(text);
    assert(spans.size() == 3);
    assert(spans[0] == (Span{0, 1, SpanKind::Word}));
    assert(spans[1] == (Span{1, 14, SpanKind::Special}));
    assert(spans[2] == (Span{14, 15, SpanKind::Word}));

    // Longest special at a position wins
    text = "x<s>>y";
    spans = spanner.split(text);
    assert(spans.size() == 3);
    assert(spans[1] == (Span{1, 5, SpanKind::Special}));

    // Segments are lexed independently: " world" keeps its space
    assert(pieces(spanner, "hi<s> world") == (std::vector<std::string>{"hi", "<s>", " world"}));

    // Adjacent specials
    spans = spanner.split("<s><s>");
    assert(spans.size() == 2);
    assert(spans[0].kind == SpanKind::Special && spans[1].kind == SpanKind::Special);

    std::cout << "PASSED" << std::endl;
}

void test_malformed_input() {
    std::cout << "Testing malformed input handling... ";

    std::string text = "abc \xe4\xbd";

    // Default: valid prefix spanned, tail is one Gap
    auto lenient = make_spanner(CHIPPER_SPANNER_AUTOMATON);
    auto spans = lenient.split(text);
    assert(spans.size() == 3);
    assert(spans[0] == (Span{0, 3, SpanKind::Word}));
    assert(spans[1] == (Span{3, 4, SpanKind::Word}));
    assert(spans[2] == (Span{4, 6, SpanKind::Gap}));

    // Strict: error names the offset
    auto strict = make_spanner(CHIPPER_SPANNER_PATTERN, {}, true);
    bool threw = false;
    try {
        strict.split(text);
    } catch (const SpanningError& e) {
        threw = true;
        assert(e.offset() == 4);
        assert(e.code() == CHIPPER_ERROR_SPANNING_FAILED);
    }
    assert(threw);

    // Strict accepts well-formed text
    assert(strict.split("fine text").size() == 2);

    std::cout << "PASSED" << std::endl;
}

void test_gaps_and_early_exit() {
    std::cout << "Testing gaps and early exit... ";

    TextSpanner spanner(create_word_lexer(CHIPPER_SPANNER_PATTERN, "[a-z]+"), {}, false);
    std::string text = "ab12cd!";

    auto spans = spanner.split(text);
    assert(spans.size() == 4);
    assert(spans[0] == (Span{0, 2, SpanKind::Word}));
    assert(spans[1] == (Span{2, 4, SpanKind::Gap}));
    assert(spans[2] == (Span{4, 6, SpanKind::Word}));
    assert(spans[3] == (Span{6, 7, SpanKind::Gap}));

    assert(spanner.remove_gaps(text) == "abcd");
    assert(spanner.remove_gaps("xy\xff") == "xy");

    // Visitor stops after the first span
    int visited = 0;
    bool finished = spanner.for_each_span(text, [&visited](const Span&) {
        ++visited;
        return false;
    });
    assert(!finished);
    assert(visited == 1);

    // Restartable: same result twice
    assert(spanner.split(text) == spans);

    std::cout << "PASSED" << std::endl;
}

void test_configuration_errors() {
    std::cout << "Testing spanner configuration errors... ";

    bool threw = false;
    try {
        create_word_lexer(CHIPPER_SPANNER_AUTOMATON, "[a-z]+");
    } catch (const ConfigError& e) {
        threw = true;
        assert(e.code() == CHIPPER_ERROR_CONFIG_INVALID);
    }
    assert(threw);

    threw = false;
    try {
        create_word_lexer(CHIPPER_SPANNER_PATTERN, "(unclosed");
    } catch (const ConfigError& e) {
        threw = true;
        assert(e.code() == CHIPPER_ERROR_PATTERN_INVALID);
    }
    assert(threw);

    threw = false;
    try {
        create_word_lexer(CHIPPER_SPANNER_COUNT);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    assert(create_word_lexer(CHIPPER_SPANNER_PATTERN)->name() == "pattern");
    assert(create_word_lexer(CHIPPER_SPANNER_AUTOMATON)->type() == CHIPPER_SPANNER_AUTOMATON);

    std::cout << "PASSED" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Chipper - Spanner Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        test_utf8_validation();
        test_word_rules();
        test_unicode_rules();
        test_spanner_equivalence();
        test_spans_cover_input();
        test_special_tokens();
        test_malformed_input();
        test_gaps_and_early_exit();
        test_configuration_errors();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test FAILED with exception: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * Chipper - Interactive Tokenizer Example
 *
 * Loads a tiktoken rank file and tokenizes lines read from stdin, printing
 * the token ids and checking that they decode back to the input.
 *
 * Usage: tokenize_example <ranks.tiktoken> [options]
 */

#include <chipper/chipper.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <ranks.tiktoken> [options]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --pattern              Use the regex spanner (default: automaton)" << std::endl;
    std::cerr << "  --merge <name>         linear | parallel | heap (default: heap)" << std::endl;
    std::cerr << "  --strict               Reject malformed UTF-8" << std::endl;
    std::cerr << "  --threads <n>          Worker threads (default: all cores)" << std::endl;
    std::cerr << "  --special <text> <id>  Register a special token" << std::endl;
    std::cerr << "  --verbose              Debug logging" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  /quit     - Exit" << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const char* ranks_path = argv[1];
    chipper_tokenizer_config_t config = chipper_tokenizer_config_default();
    std::vector<std::string> special_texts;
    std::vector<chipper_token_t> special_ids;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pattern") {
            config.spanner = CHIPPER_SPANNER_PATTERN;
        } else if (arg == "--merge" && i + 1 < argc) {
            std::string name = argv[++i];
            if (name == "linear") {
                config.merge_strategy = CHIPPER_MERGE_LINEAR_RESCAN;
            } else if (name == "parallel") {
                config.merge_strategy = CHIPPER_MERGE_PARALLEL_RANK;
            } else if (name == "heap") {
                config.merge_strategy = CHIPPER_MERGE_HEAP_AND_LIST;
            } else {
                std::cerr << "Unknown merge strategy: " << name << std::endl;
                return 1;
            }
        } else if (arg == "--strict") {
            config.strict_spanning = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            config.num_threads = std::atoi(argv[++i]);
        } else if (arg == "--special" && i + 2 < argc) {
            special_texts.push_back(argv[++i]);
            special_ids.push_back(static_cast<chipper_token_t>(std::strtoul(argv[++i], nullptr, 10)));
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    // Print version
    std::cout << "Chipper v" << chipper_get_version_string() << std::endl;
    std::cout << "Tokenizer" << std::endl;
    std::cout << "=========" << std::endl;

    std::vector<chipper_token_entry_t> specials;
    for (size_t i = 0; i < special_texts.size(); ++i) {
        specials.push_back({special_texts[i].data(), special_texts[i].size(), special_ids[i]});
    }

    std::cout << "Loading ranks: " << ranks_path << std::endl;
    chipper_vocab_t* vocab = chipper_vocab_load_tiktoken(ranks_path, specials.data(), specials.size());
    if (!vocab) {
        std::cerr << "Failed to load ranks: " << chipper_get_last_error_message() << std::endl;
        return 1;
    }

    chipper_tokenizer_t* tokenizer = chipper_tokenizer_create(vocab, &config);
    if (!tokenizer) {
        std::cerr << "Failed to create tokenizer: " << chipper_get_last_error_message() << std::endl;
        chipper_vocab_destroy(vocab);
        return 1;
    }

    std::cout << "Vocabulary: " << chipper_vocab_size(vocab) << " tokens" << std::endl;
    std::cout << "Spanner: " << chipper_spanner_name(config.spanner) << std::endl;
    std::cout << "Merge: " << chipper_merge_strategy_name(config.merge_strategy) << std::endl;
    std::cout << std::endl;

    std::string line;
    std::vector<chipper_token_t> tokens;
    std::vector<char> decoded;

    while (std::getline(std::cin, line)) {
        if (line == "/quit" || line == "/exit") break;

        int count = chipper_encode(tokenizer, line.data(), line.size(), nullptr, 0);
        if (count < 0) {
            std::cerr << "[Error: " << chipper_error_string(chipper_get_last_error()) << ": "
                      << chipper_get_last_error_message() << "]" << std::endl;
            continue;
        }

        tokens.resize(static_cast<size_t>(count));
        count = chipper_encode(tokenizer, line.data(), line.size(), tokens.data(), tokens.size());
        if (count < 0) {
            std::cerr << "[Error: " << chipper_get_last_error_message() << "]" << std::endl;
            continue;
        }

        std::cout << "[";
        for (int i = 0; i < count; ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << tokens[i];
        }
        std::cout << "]" << std::endl;

        decoded.resize(line.size() + 1);
        int len = chipper_decode(tokenizer, tokens.data(), tokens.size(), decoded.data(), decoded.size());
        bool round_trip = len >= 0 && std::string(decoded.data(), static_cast<size_t>(len)) == line;
        std::cout << "[" << count << " tokens, " << line.size() << " bytes, round trip "
                  << (round_trip ? "ok" : "FAILED") << "]" << std::endl;
    }

    chipper_tokenizer_destroy(tokenizer);
    chipper_vocab_destroy(vocab);
    return 0;
}

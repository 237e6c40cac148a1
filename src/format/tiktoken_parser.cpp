#include "tiktoken_parser.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

#include <array>
#include <fstream>
#include <sstream>

namespace chipper {

namespace {

constexpr std::array<int8_t, 256> build_base64_table() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (int i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(alphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr std::array<int8_t, 256> kBase64Table = build_base64_table();

bool parse_rank(std::string_view text, uint32_t* rank) {
    if (text.empty() || text.size() > 10) return false;
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > UINT32_MAX) return false;
    *rank = static_cast<uint32_t>(value);
    return true;
}

Error invalid_line(size_t line_number, const std::string& reason) {
    return Error(CHIPPER_ERROR_FILE_INVALID,
                 "Invalid tiktoken rank file, line " + std::to_string(line_number) + ": " + reason);
}

} // namespace

bool base64_decode(std::string_view encoded, std::string* out) {
    if (encoded.size() % 4 != 0) return false;

    out->clear();
    out->reserve(encoded.size() / 4 * 3);

    for (size_t i = 0; i < encoded.size(); i += 4) {
        bool last = i + 4 == encoded.size();
        int padding = 0;
        uint32_t group = 0;

        for (size_t j = 0; j < 4; ++j) {
            char c = encoded[i + j];
            if (c == '=' && last && j >= 2) {
                ++padding;
                group <<= 6;
                continue;
            }
            int8_t v = kBase64Table[static_cast<uint8_t>(c)];
            if (v < 0 || padding > 0) return false;
            group = (group << 6) | static_cast<uint32_t>(v);
        }

        out->push_back(static_cast<char>((group >> 16) & 0xff));
        if (padding < 2) out->push_back(static_cast<char>((group >> 8) & 0xff));
        if (padding < 1) out->push_back(static_cast<char>(group & 0xff));
    }
    return true;
}

std::shared_ptr<const Vocabulary> parse_tiktoken_vocab(std::string_view text, std::vector<SpecialToken> specials) {
    std::vector<TokenEntry> tokens;
    size_t line_number = 0;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        std::string_view line = text.substr(pos, eol - pos);
        pos = eol + 1;
        ++line_number;

        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (line.empty()) continue;

        size_t space = line.find(' ');
        if (space == std::string_view::npos) {
            throw invalid_line(line_number, "expected \"<base64> <rank>\"");
        }

        TokenEntry entry;
        if (!base64_decode(line.substr(0, space), &entry.bytes)) {
            throw invalid_line(line_number, "malformed base64");
        }
        if (!parse_rank(line.substr(space + 1), &entry.id)) {
            throw invalid_line(line_number, "malformed rank");
        }
        tokens.push_back(std::move(entry));
    }

    create_logger("Tiktoken")->debug("Parsed {} ranked tokens", tokens.size());
    return Vocabulary::from_ranked_tokens(std::move(tokens), std::move(specials));
}

std::shared_ptr<const Vocabulary> load_tiktoken_vocab(const std::string& path, std::vector<SpecialToken> specials) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Error(CHIPPER_ERROR_FILE_NOT_FOUND, "Failed to open rank file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw Error(CHIPPER_ERROR_FILE_READ, "Failed to read rank file: " + path);
    }

    auto vocab = parse_tiktoken_vocab(contents.str(), std::move(specials));
    create_logger("Tiktoken")->info("Loaded {} ({} tokens, {} merges)", path, vocab->size(), vocab->merge_count());
    return vocab;
}

} // namespace chipper

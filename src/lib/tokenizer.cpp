#include "tokenizer.hpp"
#include "text.hpp"
#include <absl/container/flat_hash_map.h>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

using bpe::BYTE_TOKENS;
using bpe::MergeTable;
using bpe::OffsetList;
using bpe::Pair;
using bpe::PairCount;
using bpe::TokenId;
using bpe::Word;
using bpe::WordList;
using Clock = std::chrono::steady_clock;
using DurationMs = std::chrono::duration<double, std::milli>;

bpe::Tokenizer bpe::make_basic() { return Tokenizer{}; }

bpe::Tokenizer bpe::make_regex(const std::string &pattern) {
    if (pattern.empty()) {
        throw std::invalid_argument("Regex tokenizer needs a split pattern");
    }
    Tokenizer tok;
    tok.pattern = pattern;
    return tok;
}

bpe::Tokenizer bpe::make_tokenizer(const std::string &kind) {
    if (kind == "basic") return make_basic();
    if (kind == "regex") return make_regex();
    throw std::invalid_argument("Unknown tokenizer '" + kind +
                                "' (expected basic or regex)");
}

// Most frequent pair; ties go to the smallest key, i.e. the lexicographically
// smallest pair
static std::pair<uint64_t, size_t> most_frequent_pair(const PairCount &stats) {
    uint64_t best_key = 0;
    size_t best_count = 0;
    for (const auto &[key, count] : stats) {
        if (count > best_count || (count == best_count && key < best_key)) {
            best_key = key;
            best_count = count;
        }
    }
    return {best_key, best_count};
}

void bpe::train(Tokenizer &tokenizer, const std::string &text,
                size_t vocab_size, bool verbose) {
    if (vocab_size < BYTE_TOKENS) {
        throw std::invalid_argument("vocab_size must be at least 256, got " +
                                    std::to_string(vocab_size));
    }

    const auto total_start = Clock::now();
    const size_t num_merges = vocab_size - BYTE_TOKENS;

    // Split into chunks and dedup identical ones; a chunk seen n times counts
    // its pairs n times
    const auto split_start = Clock::now();
    OffsetList offsets = split_to_offsets(text, tokenizer.pattern);

    absl::flat_hash_map<std::string_view, size_t> chunk_index;
    chunk_index.reserve(offsets.size() / 2);
    WordList words;
    std::vector<size_t> word_counts;
    for (const auto &off : offsets) {
        std::string_view chunk(text.data() + off.first, off.second - off.first);
        auto [it, inserted] = chunk_index.try_emplace(chunk, words.size());
        if (inserted) {
            words.push_back(offset_to_word(text, off));
            word_counts.push_back(1);
        } else {
            ++word_counts[it->second];
        }
    }
    const DurationMs split_time =
        std::chrono::duration_cast<DurationMs>(Clock::now() - split_start);

    // Every merge removes at least one symbol, so the text bounds the merge
    // count no matter how large vocab_size is
    const size_t max_merges = std::min(num_merges, text.size());
    MergeTable merges;
    merges.reserve(max_merges);
    Vocab vocab = byte_vocab();
    vocab.reserve(BYTE_TOKENS + max_merges);

    DurationMs pair_count_time = DurationMs::zero();
    DurationMs merge_time = DurationMs::zero();

    for (size_t i = 0; i < num_merges; ++i) {
        const auto count_start = Clock::now();
        PairCount stats;
        for (size_t wi = 0; wi < words.size(); ++wi) {
            count_pairs(words[wi], stats, word_counts[wi]);
        }
        pair_count_time +=
            std::chrono::duration_cast<DurationMs>(Clock::now() - count_start);

        if (stats.empty()) {
            if (verbose) {
                std::cout << "[bpe_train] No pairs left after " << i
                          << " merges, stopping early" << std::endl;
            }
            break;
        }

        const auto [pair_key, pair_frequency] = most_frequent_pair(stats);
        const Pair pair = decode_pair(pair_key);

        const auto merge_start = Clock::now();
        const TokenId new_id = merges.insert(pair);
        for (auto &word : words) {
            merge_in_place(word, pair, new_id);
        }
        const std::string &token = extend_vocab(vocab, pair);
        merge_time +=
            std::chrono::duration_cast<DurationMs>(Clock::now() - merge_start);

        if (verbose) {
            std::cout << "[bpe_train] merge " << (i + 1) << "/" << num_merges
                      << ": (" << pair.first << ", " << pair.second << ") -> "
                      << new_id << " [" << render_token(token) << "] had "
                      << pair_frequency << " occurrences" << std::endl;
        }
    }

    if (verbose) {
        const DurationMs total_time =
            std::chrono::duration_cast<DurationMs>(Clock::now() - total_start);
        std::cout << "[bpe_train] BPE training completed. Final vocabulary "
                     "size: "
                  << vocab.size() << std::endl;
        std::cout << "[bpe_train] chunks: " << offsets.size() << " ("
                  << words.size() << " unique)" << std::endl;
        std::cout << "[bpe_train] split: " << split_time.count() << " ms"
                  << std::endl;
        std::cout << "[bpe_train] pair counting: " << pair_count_time.count()
                  << " ms" << std::endl;
        std::cout << "[bpe_train] merge pairs: " << merge_time.count() << " ms"
                  << std::endl;
        std::cout << "[bpe_train] total: " << total_time.count() << " ms"
                  << std::endl;
    }

    tokenizer.merges = std::move(merges);
    tokenizer.vocab = std::move(vocab);
}

Word bpe::encode_word(Word ids, const MergeTable &merges) {
    while (ids.size() >= 2) {
        const PairCount stats = count_pairs(ids);

        // Earliest learned merge among the pairs present
        uint64_t best_key = 0;
        TokenId best_id = std::numeric_limits<TokenId>::max();
        bool found = false;
        for (const auto &[key, count] : stats) {
            TokenId id;
            if (merges.find(key, id) && id < best_id) {
                best_key = key;
                best_id = id;
                found = true;
            }
        }
        if (!found) break;

        merge_in_place(ids, decode_pair(best_key), best_id);
    }
    return ids;
}

std::vector<TokenId> bpe::encode(const std::string &text,
                                 const Tokenizer &tokenizer) {
    std::vector<TokenId> result;
    result.reserve(text.length() / 2);

    for (const auto &off : split_to_offsets(text, tokenizer.pattern)) {
        Word encoded = encode_word(offset_to_word(text, off), tokenizer.merges);
        result.insert(result.end(), encoded.begin(), encoded.end());
    }

    return result;
}

std::string bpe::decode_bytes(const std::vector<TokenId> &tokens,
                              const Tokenizer &tokenizer) {
    std::string result;
    result.reserve(tokens.size() * 2);

    for (TokenId token : tokens) {
        if (token < tokenizer.vocab.size()) {
            result += tokenizer.vocab[token];
        }
    }

    return result;
}

std::string bpe::decode(const std::vector<TokenId> &tokens,
                        const Tokenizer &tokenizer) {
    std::string bytes = decode_bytes(tokens, tokenizer);
    std::string error;
    if (!validate_utf8(bytes, &error)) {
        return "Error decoding: " + error;
    }
    return bytes;
}

std::string bpe::visualize(const std::vector<TokenId> &tokens,
                           const Tokenizer &tokenizer) {
    std::string result;
    for (TokenId token : tokens) {
        if (token >= tokenizer.vocab.size()) continue;
        std::string tok_str = replace_control_characters(tokenizer.vocab[token]);

        // Generate color
        unsigned int hash_val = static_cast<unsigned int>(token);
        hash_val ^= hash_val >> 16;
        hash_val *= 0x85ebca6bU;
        hash_val ^= hash_val >> 13;
        hash_val *= 0xc2b2ae35U;
        hash_val ^= hash_val >> 16;
        int r = (hash_val >> 16) & 0xFF;
        int g = (hash_val >> 8) & 0xFF;
        int b = hash_val & 0xFF;
        // Pastel: blend with white
        double factor = 0.6;
        r = static_cast<int>(r * factor + 255 * (1 - factor));
        g = static_cast<int>(g * factor + 255 * (1 - factor));
        b = static_cast<int>(b * factor + 255 * (1 - factor));
        result += "\x1b[48;2;" + std::to_string(r) + ";" + std::to_string(g) +
                  ";" + std::to_string(b) + "m";
        result += "\x1b[38;2;0;0;0m";

        result += tok_str;
        result += "\x1b[0m";
    }
    return result;
}

static std::string trim(const std::string &s) {
    const char *ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

void bpe::save(const Tokenizer &tokenizer, const std::string &file_prefix) {
    if (tokenizer.pattern.find_first_of("\r\n") != std::string::npos) {
        throw std::invalid_argument(
            "Split pattern must fit on one line of the model file");
    }
    // load() trims the pattern line
    if (tokenizer.pattern != trim(tokenizer.pattern)) {
        throw std::invalid_argument(
            "Split pattern must not begin or end with whitespace");
    }

    const std::string model_file = file_prefix + ".model";
    std::ofstream model(model_file);
    if (!model.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " +
                                 model_file);
    }
    model << tokenizer.pattern << '\n';
    for (const auto &[first, second] : tokenizer.merges.pairs()) {
        model << first << ' ' << second << '\n';
    }
    model.flush();
    if (!model) {
        throw std::runtime_error("Failed to write to " + model_file);
    }

    const std::string vocab_file = file_prefix + ".vocab";
    std::ofstream vocab(vocab_file, std::ios::binary);
    if (!vocab.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " +
                                 vocab_file);
    }
    for (size_t id = 0; id < tokenizer.vocab.size(); ++id) {
        vocab << id << " [" << render_token(tokenizer.vocab[id]) << "]\n";
    }
    vocab.flush();
    if (!vocab) {
        throw std::runtime_error("Failed to write to " + vocab_file);
    }
}

bool bpe::parse_token_id(const std::string &field, TokenId &id) {
    if (field.empty() || field.size() > 10) return false;
    uint64_t value = 0;
    for (char c : field) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<TokenId>::max()) return false;
    id = static_cast<TokenId>(value);
    return true;
}

// "a b" -> (a, b); anything else (wrong field count, non-numeric) fails
static bool parse_merge_line(const std::string &line, Pair &pair) {
    std::istringstream fields(line);
    std::string first, second, extra;
    if (!(fields >> first >> second) || (fields >> extra)) return false;
    return bpe::parse_token_id(first, pair.first) &&
           bpe::parse_token_id(second, pair.second);
}

bpe::Tokenizer bpe::load(const std::string &model_file) {
    const std::string suffix = ".model";
    if (model_file.size() < suffix.size() ||
        model_file.compare(model_file.size() - suffix.size(), suffix.size(),
                           suffix) != 0) {
        throw std::invalid_argument("Model file must end in .model: " +
                                    model_file);
    }

    std::ifstream is(model_file);
    if (!is.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " +
                                 model_file);
    }

    Tokenizer tok;
    std::string line;
    if (std::getline(is, line)) {
        tok.pattern = trim(line);
    }

    while (std::getline(is, line)) {
        Pair pair;
        if (!parse_merge_line(line, pair)) continue;
        tok.merges.insert(pair);
    }
    if (is.bad()) {
        throw std::runtime_error("Failed to read from " + model_file);
    }

    tok.vocab = build_vocab(tok.merges);
    return tok;
}

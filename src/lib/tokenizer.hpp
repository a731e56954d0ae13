#pragma once

#include "pairs.hpp"
#include "split.hpp"
#include "vocab.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bpe {

// Tokenizer state. An empty pattern is the basic tokenizer (merges run over
// the whole byte stream); a non-empty pattern is the regex tokenizer (text is
// split into chunks first and merges never cross a chunk boundary).
struct Tokenizer {
    MergeTable merges;
    Vocab vocab = byte_vocab();
    std::string pattern;

    bool is_regex() const { return !pattern.empty(); }
};

Tokenizer make_basic();
Tokenizer make_regex(const std::string &pattern = GPT4_SPLIT_PATTERN);

// "basic" or "regex"; anything else throws std::invalid_argument
Tokenizer make_tokenizer(const std::string &kind);

// Training function
// vocab_size: total vocabulary size including the 256 byte tokens, so
//   vocab_size - 256 merges are learned (fewer if the text runs out of pairs)
// Replaces any merges the tokenizer already had. The most frequent pair is
// merged first; ties go to the lexicographically smallest pair.
// Throws std::invalid_argument if vocab_size < 256.
void train(Tokenizer &tokenizer, const std::string &text, size_t vocab_size,
           bool verbose = false);

// Encoding/decoding functions
std::vector<TokenId> encode(const std::string &text,
                            const Tokenizer &tokenizer);

// Applies merges to one chunk, earliest-learned merge first, until none apply
Word encode_word(Word ids, const MergeTable &merges);

// Raw bytes of the tokens; ids outside the vocabulary are skipped
std::string decode_bytes(const std::vector<TokenId> &tokens,
                         const Tokenizer &tokenizer);

// Like decode_bytes() but returns "Error decoding: ..." instead of bytes
// that are not valid UTF-8
std::string decode(const std::vector<TokenId> &tokens,
                   const Tokenizer &tokenizer);

// Save/load functions
// Writes <file_prefix>.model (pattern + merges) and <file_prefix>.vocab
// (human readable, never read back)
void save(const Tokenizer &tokenizer, const std::string &file_prefix);

// Reads a .model file. Merges get ids 256, 257, ... in file order; lines that
// are not two unsigned integers are skipped. Throws std::runtime_error if the
// file cannot be read or the merges are inconsistent.
Tokenizer load(const std::string &model_file);

// Unsigned 32-bit decimal, digits only; false on anything else, including
// values above the largest TokenId
bool parse_token_id(const std::string &field, TokenId &id);

std::string visualize(const std::vector<TokenId> &tokens,
                      const Tokenizer &tokenizer);
} // namespace bpe

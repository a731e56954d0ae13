#pragma once

#include "pairs.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace bpe {
using OffsetPair = std::pair<size_t, size_t>;
using OffsetList = std::vector<OffsetPair>;

// GPT-4 (cl100k) split pattern: contractions, letter runs, 1-3 digit runs,
// punctuation runs, newlines, whitespace runs
extern const char *const GPT4_SPLIT_PATTERN;

// Splits `text` into [start, end) chunks with `pattern`, compiled once per
// thread with Unicode classes enabled. Bytes the pattern does not match form
// chunks of their own, so the chunks always cover the whole text.
// An empty pattern yields a single chunk spanning the text.
OffsetList split_to_offsets(const std::string &text, const std::string &pattern);

std::vector<std::string> split_chunks(const std::string &text,
                                      const std::string &pattern);

// Byte-token word for text[off.first, off.second)
Word offset_to_word(const std::string &text, const OffsetPair &off);
} // namespace bpe

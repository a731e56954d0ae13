#pragma once

#include <absl/container/flat_hash_map.h>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace bpe {
using TokenId = uint32_t;
using Word = std::vector<TokenId>;
using WordList = std::vector<Word>;
using Pair = std::pair<TokenId, TokenId>;

// Pairs are packed as (first << 32 | second), so ordering keys numerically is
// the same as ordering pairs lexicographically.
using PairCount = absl::flat_hash_map<uint64_t, size_t>;

constexpr TokenId BYTE_TOKENS = 256;

constexpr uint64_t encode_pair(TokenId first, TokenId second) {
    return (static_cast<uint64_t>(first) << 32) | static_cast<uint64_t>(second);
}

constexpr uint64_t encode_pair(const Pair &pair) {
    return encode_pair(pair.first, pair.second);
}

constexpr TokenId first_from_pair(uint64_t key) {
    return static_cast<TokenId>(key >> 32);
}

constexpr TokenId second_from_pair(uint64_t key) {
    return static_cast<TokenId>(key & 0xffffffffu);
}

constexpr Pair decode_pair(uint64_t key) {
    return {first_from_pair(key), second_from_pair(key)};
}

// Adds `weight` for every adjacent pair of `word` into `counts`
void count_pairs(const Word &word, PairCount &counts, size_t weight = 1);

PairCount count_pairs(const Word &word);

// Counts accumulate across words; pairs never span two words
PairCount count_pairs(const WordList &words);

// Returns a copy of `word` with every non-overlapping occurrence of `pair`
// (scanning left to right) replaced by `new_id`
Word merge(const Word &word, const Pair &pair, TokenId new_id);

// Same as merge() but rewrites `word` in place
void merge_in_place(Word &word, const Pair &pair, TokenId new_id);

// Ordered merge table: pair -> new token id, plus the order the merges were
// learned in. Merge k always has id 256 + k.
class MergeTable {
  public:
    // Appends `pair` and returns its id. Throws std::runtime_error if the pair
    // is already present.
    TokenId insert(const Pair &pair);

    // Returns true and sets `id` if the pair has a merge
    bool find(const Pair &pair, TokenId &id) const;
    bool find(uint64_t pair_key, TokenId &id) const;

    bool contains(const Pair &pair) const {
        return ids_.contains(encode_pair(pair));
    }

    // Id the next inserted pair will get
    TokenId next_id() const {
        return BYTE_TOKENS + static_cast<TokenId>(order_.size());
    }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }
    void clear();
    void reserve(size_t n);

    // Merges in learned order; element k has id 256 + k
    const std::vector<Pair> &pairs() const { return order_; }

    bool operator==(const MergeTable &other) const {
        return order_ == other.order_;
    }
    bool operator!=(const MergeTable &other) const { return !(*this == other); }

  private:
    absl::flat_hash_map<uint64_t, TokenId> ids_;
    std::vector<Pair> order_;
};

} // namespace bpe

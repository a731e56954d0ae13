#include "pairs.hpp"
#include <stdexcept>
#include <string>

namespace bpe {

void count_pairs(const Word &word, PairCount &counts, size_t weight) {
    if (word.size() < 2) return;
    for (size_t i = 0; i + 1 < word.size(); ++i) {
        counts[encode_pair(word[i], word[i + 1])] += weight;
    }
}

PairCount count_pairs(const Word &word) {
    PairCount counts;
    count_pairs(word, counts);
    return counts;
}

PairCount count_pairs(const WordList &words) {
    PairCount counts;
    for (const auto &word : words) {
        count_pairs(word, counts);
    }
    return counts;
}

Word merge(const Word &word, const Pair &pair, TokenId new_id) {
    Word result(word);
    merge_in_place(result, pair, new_id);
    return result;
}

void merge_in_place(Word &word, const Pair &pair, TokenId new_id) {
    const size_t size = word.size();
    if (size < 2) return;

    size_t write = 0;
    size_t read = 0;

    while (read < size) {
        if (read + 1 < size && word[read] == pair.first &&
            word[read + 1] == pair.second) {
            word[write++] = new_id;
            read += 2;
        } else {
            word[write++] = word[read++];
        }
    }

    if (write < size) word.resize(write);
}

TokenId MergeTable::insert(const Pair &pair) {
    const TokenId id = next_id();
    auto [it, inserted] = ids_.try_emplace(encode_pair(pair), id);
    if (!inserted) {
        throw std::runtime_error("Duplicate merge (" +
                                 std::to_string(pair.first) + ", " +
                                 std::to_string(pair.second) +
                                 "), already merged into " +
                                 std::to_string(it->second));
    }
    order_.push_back(pair);
    return id;
}

bool MergeTable::find(const Pair &pair, TokenId &id) const {
    return find(encode_pair(pair), id);
}

bool MergeTable::find(uint64_t pair_key, TokenId &id) const {
    auto it = ids_.find(pair_key);
    if (it == ids_.end()) return false;
    id = it->second;
    return true;
}

void MergeTable::clear() {
    ids_.clear();
    order_.clear();
}

void MergeTable::reserve(size_t n) {
    ids_.reserve(n);
    order_.reserve(n);
}

} // namespace bpe

#include "vocab.hpp"
#include <cstdio>
#include <stdexcept>

namespace bpe {

Vocab byte_vocab() {
    Vocab vocab;
    vocab.reserve(BYTE_TOKENS);
    for (TokenId i = 0; i < BYTE_TOKENS; ++i) {
        vocab.push_back(std::string(1, static_cast<char>(i)));
    }
    return vocab;
}

const std::string &extend_vocab(Vocab &vocab, const Pair &pair) {
    const size_t next = vocab.size();
    if (pair.first >= next || pair.second >= next) {
        throw std::runtime_error(
            "Corrupt merge table: merge (" + std::to_string(pair.first) +
            ", " + std::to_string(pair.second) + ") -> " +
            std::to_string(next) + " refers to a token that does not exist");
    }
    std::string token = vocab[pair.first] + vocab[pair.second];
    vocab.push_back(std::move(token));
    return vocab.back();
}

Vocab build_vocab(const MergeTable &merges) {
    Vocab vocab = byte_vocab();
    vocab.reserve(BYTE_TOKENS + merges.size());
    for (const auto &pair : merges.pairs()) {
        extend_vocab(vocab, pair);
    }
    return vocab;
}

std::string render_token(const std::string &token) {
    std::string result;
    result.reserve(token.size());
    for (char ch : token) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7f) {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            result += buf;
        } else if (c < 0x80) {
            result += ch;
        } else {
            // Latin-1 code point U+0080..U+00FF as two UTF-8 bytes
            result += static_cast<char>(0xc0 | (c >> 6));
            result += static_cast<char>(0x80 | (c & 0x3f));
        }
    }
    return result;
}

} // namespace bpe

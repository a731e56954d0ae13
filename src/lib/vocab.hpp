#pragma once

#include "pairs.hpp"
#include <string>
#include <vector>

namespace bpe {
// Byte sequence of every token, indexed by token id
using Vocab = std::vector<std::string>;

// The 256 single-byte tokens
Vocab byte_vocab();

// Rebuilds the vocabulary from the merge table, in learned order.
// Throws std::runtime_error if a merge refers to an id that does not exist yet
// (corrupt or out-of-order table).
Vocab build_vocab(const MergeTable &merges);

// Appends the token for `pair` to `vocab` and returns it. The new token gets
// id vocab.size(); both operands must already be in the vocabulary.
const std::string &extend_vocab(Vocab &vocab, const Pair &pair);

// Printable form of a token for the .vocab file: bytes 0x00-0x1f and 0x7f are
// escaped as \xhh, bytes >= 0x80 are shown as their Latin-1 character
std::string render_token(const std::string &token);
} // namespace bpe

#pragma once

#include <cstddef>
#include <string>

namespace bpe {

// Length of the UTF-8 sequence introduced by lead byte `c`, 0 if `c` cannot
// start a sequence
size_t utf8_sequence_length(unsigned char c);

// Checks that `bytes` is well-formed UTF-8 (no overlongs, surrogates or code
// points above U+10FFFF). On failure `error` receives a message such as
// "invalid utf-8 sequence of 1 bytes from index 3".
bool validate_utf8(const std::string &bytes, std::string *error = nullptr);

// Replaces control characters (U+0000-U+001F, U+007F-U+009F) with \uXXXX
// escapes. Bytes that are not valid UTF-8 are copied through.
std::string replace_control_characters(const std::string &text);

} // namespace bpe

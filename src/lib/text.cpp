#include "text.hpp"
#include <cstdint>
#include <cstdio>

namespace bpe {

size_t utf8_sequence_length(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

namespace {

// Decodes one code point at `i`. Returns the number of bytes consumed, or 0 if
// the sequence is malformed; `valid_prefix` then holds how many bytes were
// still acceptable and `truncated` whether the input ended mid-sequence.
size_t decode_code_point(const std::string &s, size_t i, uint32_t &cp,
                         size_t &valid_prefix, bool &truncated) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    const size_t len = utf8_sequence_length(lead);
    valid_prefix = 0;
    truncated = false;
    if (len == 0) return 0;
    if (len == 1) {
        cp = lead;
        return 1;
    }

    cp = lead & (0xFF >> (len + 1));
    valid_prefix = 1;
    for (size_t k = 1; k < len; ++k) {
        if (i + k >= s.length()) {
            truncated = true;
            return 0;
        }
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) return 0;
        // Reject overlong forms and out-of-range values as early as the second
        // byte allows
        if (k == 1) {
            if ((lead == 0xE0 && c < 0xA0) || (lead == 0xED && c > 0x9F) ||
                (lead == 0xF0 && c < 0x90) || (lead == 0xF4 && c > 0x8F) ||
                lead < 0xC2 || lead > 0xF4) {
                return 0;
            }
        }
        cp = (cp << 6) | (c & 0x3F);
        ++valid_prefix;
    }
    return len;
}

} // namespace

bool validate_utf8(const std::string &bytes, std::string *error) {
    size_t i = 0;
    while (i < bytes.length()) {
        uint32_t cp = 0;
        size_t valid_prefix = 0;
        bool truncated = false;
        size_t n = decode_code_point(bytes, i, cp, valid_prefix, truncated);
        if (n == 0) {
            if (error) {
                if (truncated) {
                    *error = "incomplete utf-8 byte sequence from index " +
                             std::to_string(i);
                } else {
                    size_t bad = valid_prefix == 0 ? 1 : valid_prefix;
                    *error = "invalid utf-8 sequence of " +
                             std::to_string(bad) + " bytes from index " +
                             std::to_string(i);
                }
            }
            return false;
        }
        i += n;
    }
    return true;
}

std::string replace_control_characters(const std::string &text) {
    std::string result;
    result.reserve(text.length());
    size_t i = 0;
    while (i < text.length()) {
        uint32_t cp = 0;
        size_t valid_prefix = 0;
        bool truncated = false;
        size_t n = decode_code_point(text, i, cp, valid_prefix, truncated);
        if (n == 0) {
            result += text[i++];
            continue;
        }
        if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", cp);
            result += buf;
        } else {
            result.append(text, i, n);
        }
        i += n;
    }
    return result;
}

} // namespace bpe

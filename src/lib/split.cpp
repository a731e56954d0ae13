#include "split.hpp"
#include <memory>
#include <reflex/matcher.h>
#include <reflex/pattern.h>
#include <unordered_map>

namespace bpe {

const char *const GPT4_SPLIT_PATTERN =
    R"('(?i:[sdmt]|ll|ve|re)|[^\r\n\p{L}\p{N}]?\p{L}+|\p{N}{1,3}| ?[^\s\p{L}\p{N}]+[\r\n]*|\s*[\r\n]|\s+)";

namespace {

// Thread-local RE/flex pattern cache (compiles each pattern once)
thread_local std::unordered_map<std::string, std::unique_ptr<reflex::Pattern>>
    pattern_cache;

reflex::Pattern *get_pattern(const std::string &pattern_str) {
    auto it = pattern_cache.find(pattern_str);
    if (it == pattern_cache.end()) {
        // \p{L} and friends need the Unicode conversion
        std::string regex = reflex::Matcher::convert(
            pattern_str, reflex::convert_flag::unicode);
        auto pat = std::make_unique<reflex::Pattern>(regex);
        it = pattern_cache.emplace(pattern_str, std::move(pat)).first;
    }
    return it->second.get();
}

} // namespace

OffsetList split_to_offsets(const std::string &text,
                            const std::string &pattern) {
    OffsetList offsets;
    if (text.empty()) return offsets;

    if (pattern.empty()) {
        offsets.emplace_back(0, text.length());
        return offsets;
    }

    reflex::Pattern *pat = get_pattern(pattern);
    reflex::Matcher matcher(pat, reflex::Input(text.data(), text.size()));
    offsets.reserve(text.length() / 3);

    size_t pos = 0;
    while (matcher.find()) {
        size_t start = matcher.first();
        size_t len = matcher.size();
        if (len == 0) continue;
        if (start > pos) {
            offsets.emplace_back(pos, start);
        }
        offsets.emplace_back(start, start + len);
        pos = start + len;
    }
    if (pos < text.length()) {
        offsets.emplace_back(pos, text.length());
    }

    return offsets;
}

std::vector<std::string> split_chunks(const std::string &text,
                                      const std::string &pattern) {
    std::vector<std::string> chunks;
    for (const auto &off : split_to_offsets(text, pattern)) {
        chunks.emplace_back(text, off.first, off.second - off.first);
    }
    return chunks;
}

Word offset_to_word(const std::string &text, const OffsetPair &off) {
    Word word;
    word.reserve(off.second - off.first);
    for (size_t i = off.first; i < off.second; ++i) {
        word.push_back(static_cast<TokenId>(static_cast<unsigned char>(text[i])));
    }
    return word;
}

} // namespace bpe

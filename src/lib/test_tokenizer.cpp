#include "tokenizer.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

static const std::string sample_text =
    "The quick brown fox jumps over the lazy dog. The dog sleeps; the fox "
    "runs. Foxes and dogs, dogs and foxes: the story repeats and repeats "
    "until the quick fox and the lazy dog are friends.\n";

int main() {
    using bpe::Pair;
    using bpe::TokenId;
    using Ids = std::vector<TokenId>;

    // New basic tokenizer: no merges, byte vocabulary, no pattern
    {
        auto tok = bpe::make_basic();
        assert(tok.merges.empty());
        assert(tok.vocab.size() == 256);
        assert(tok.pattern.empty());
        assert(!tok.is_regex());
    }

    // Worked example: "aaabdaaabac" with vocab size 258
    {
        auto tok = bpe::make_basic();
        bpe::train(tok, "aaabdaaabac", 258);

        assert(tok.merges.size() == 2);
        assert(tok.merges.pairs()[0] == Pair(97, 97));
        // (256, 97) and (97, 98) both occur twice; the smaller pair wins
        assert(tok.merges.pairs()[1] == Pair(97, 98));
        assert(tok.vocab.size() == 258);
        assert(tok.vocab[256] == "aa");
        assert(tok.vocab[257] == "ab");

        auto ids = bpe::encode("aaabdaaabac", tok);
        assert((ids == Ids{256, 257, 100, 256, 257, 97, 99}));
        assert(bpe::decode(ids, tok) == "aaabdaaabac");
    }

    // Round trip for untrained and trained basic tokenizers
    {
        const std::vector<std::string> texts = {
            "",
            "?",
            "a",
            "hello world",
            "This is a test. Isn't it?",
            "123 45! @#$%",
            "hello world!!!? (\xec\x95\x88\xeb\x85\x95\xed\x95\x98\xec\x84\xb8"
            "\xec\x9a\x94!) lol123 \xf0\x9f\x98\x89",
            std::string("nul\0byte", 8),
        };

        auto untrained = bpe::make_basic();
        auto trained = bpe::make_basic();
        bpe::train(trained, sample_text, 300);

        for (const auto &text : texts) {
            assert(bpe::decode(bpe::encode(text, untrained), untrained) == text);
            assert(bpe::decode(bpe::encode(text, trained), trained) == text);
        }
        assert(bpe::decode(bpe::encode(sample_text, trained), trained) ==
               sample_text);

        // Untrained encoding is the raw bytes
        assert((bpe::encode("hi", untrained) == Ids{104, 105}));
    }

    // Vocabulary size invariant and monotonic ids
    {
        auto tok = bpe::make_basic();
        bpe::train(tok, sample_text, 320);
        const size_t m = tok.merges.size();
        assert(m > 0);
        assert(m <= 320 - 256);
        assert(tok.vocab.size() == 256 + m);

        TokenId previous = 255;
        for (size_t k = 0; k < m; ++k) {
            TokenId id = 0;
            assert(tok.merges.find(tok.merges.pairs()[k], id));
            assert(id == 256 + k);
            assert(id > previous);
            previous = id;
            // Operands always predate the merge
            assert(tok.merges.pairs()[k].first < id);
            assert(tok.merges.pairs()[k].second < id);
        }

        // Encoding the training text compresses it
        assert(bpe::encode(sample_text, tok).size() < sample_text.size());
    }

    // Training is deterministic
    {
        auto a = bpe::make_basic();
        auto b = bpe::make_basic();
        bpe::train(a, sample_text, 300);
        bpe::train(b, sample_text, 300);
        assert(a.merges == b.merges);
        assert(a.vocab == b.vocab);
    }

    // Retraining replaces the previous merges
    {
        auto tok = bpe::make_basic();
        bpe::train(tok, "zzzzzz", 260);
        bpe::train(tok, "aaabdaaabac", 258);
        assert(tok.merges.size() == 2);
        assert(tok.merges.pairs()[0] == Pair(97, 97));
    }

    // vocab_size 256 learns nothing
    {
        auto tok = bpe::make_basic();
        bpe::train(tok, sample_text, 256);
        assert(tok.merges.empty());
        assert(tok.vocab.size() == 256);
    }

    // vocab_size below 256 is rejected and leaves the tokenizer alone
    {
        auto tok = bpe::make_basic();
        bpe::train(tok, "aaabdaaabac", 257);
        bool threw = false;
        try {
            bpe::train(tok, "aaabdaaabac", 255);
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        assert(threw);
        assert(tok.merges.size() == 1);
    }

    // Training stops early once the sequence has no pairs left
    {
        auto tok = bpe::make_basic();
        bpe::train(tok, "ab", 300);
        assert(tok.merges.size() == 1);
        assert(tok.vocab.size() == 257);
        assert((bpe::encode("ab", tok) == Ids{256}));

        auto empty = bpe::make_basic();
        bpe::train(empty, "", 300);
        assert(empty.merges.empty());
        bpe::train(empty, "x", 300);
        assert(empty.merges.empty());
    }

    // Encoding applies the earliest learned merge first, not the leftmost
    {
        auto tok = bpe::make_basic();
        tok.merges.insert({98, 99}); // 256 = "bc"
        tok.merges.insert({97, 98}); // 257 = "ab"
        tok.vocab = bpe::build_vocab(tok.merges);

        assert((bpe::encode("abc", tok) == Ids{97, 256}));
        assert((bpe::encode("abab", tok) == Ids{257, 257}));
        assert(bpe::decode(bpe::encode("abcab", tok), tok) == "abcab");
    }

    // encode_word on its own
    {
        bpe::MergeTable merges;
        merges.insert({1, 1}); // 256
        merges.insert({256, 1}); // 257
        assert((bpe::encode_word({1, 1, 1}, merges) == bpe::Word{257}));
        assert((bpe::encode_word({1, 1, 1, 1}, merges) ==
                bpe::Word{256, 256}));
        assert((bpe::encode_word({2}, merges) == bpe::Word{2}));
        assert(bpe::encode_word({}, merges).empty());
    }

    // Ids outside the vocabulary are skipped on decode
    {
        auto tok = bpe::make_basic();
        assert(bpe::decode(Ids{104, 99999, 105}, tok) == "hi");
        assert(bpe::decode(Ids{256}, tok) == "");
        assert(bpe::decode(Ids{}, tok) == "");
    }

    // Invalid UTF-8 gives a diagnostic instead of an exception
    {
        auto tok = bpe::make_basic();
        assert(bpe::decode(Ids{255}, tok) ==
               "Error decoding: invalid utf-8 sequence of 1 bytes from index 0");
        assert(bpe::decode(Ids{104, 233}, tok) ==
               "Error decoding: incomplete utf-8 byte sequence from index 1");
        assert(bpe::decode_bytes(Ids{104, 233}, tok) == "h\xe9");
    }

    // A huge vocab size stops once the text runs out of pairs
    {
        auto tok = bpe::make_basic();
        bpe::train(tok, "ab", size_t(1) << 32);
        assert(tok.merges.size() == 1);
        assert(tok.merges.pairs()[0] == Pair(97, 98));
        assert(tok.vocab.size() == 257);
    }

    // Verbose training reports each merge step
    {
        std::ostringstream captured;
        std::streambuf *old = std::cout.rdbuf(captured.rdbuf());
        auto tok = bpe::make_basic();
        bpe::train(tok, "aaabdaaabac", 258, true);
        std::cout.rdbuf(old);

        const std::string out = captured.str();
        assert(out.find("merge 1/2: (97, 97) -> 256") != std::string::npos);
        assert(out.find("had 4 occurrences") != std::string::npos);
        assert(out.find("merge 2/2: (97, 98) -> 257") != std::string::npos);
        assert(out.find("had 2 occurrences") != std::string::npos);
    }

    // make_tokenizer by name
    {
        assert(!bpe::make_tokenizer("basic").is_regex());
        assert(bpe::make_tokenizer("regex").pattern == bpe::GPT4_SPLIT_PATTERN);
        bool threw = false;
        try {
            bpe::make_tokenizer("wordpiece");
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        assert(threw);
    }

    // Token ids parse as unsigned 32-bit decimals and never wrap
    {
        TokenId id = 0;
        assert(bpe::parse_token_id("256", id) && id == 256);
        assert(bpe::parse_token_id("4294967295", id) && id == 4294967295u);
        assert(!bpe::parse_token_id("4294967296", id));
        assert(!bpe::parse_token_id("4294967552", id));
        assert(!bpe::parse_token_id("-1", id));
        assert(!bpe::parse_token_id("12a", id));
        assert(!bpe::parse_token_id("", id));
    }

    // visualize wraps every known token and escapes control characters
    {
        auto tok = bpe::make_basic();
        std::string out = bpe::visualize(Ids{104, 10, 99999}, tok);
        assert(out.find("h") != std::string::npos);
        assert(out.find("\\u000a") != std::string::npos);
        assert(out.find('\n') == std::string::npos);
        assert(out.find("\x1b[0m") != std::string::npos);
    }

    return 0;
}

#include "vocab.hpp"
#include <cassert>
#include <stdexcept>
#include <string>

int main() {
    // Untrained vocabulary is the 256 bytes
    {
        auto vocab = bpe::byte_vocab();
        assert(vocab.size() == 256);
        assert(vocab[97] == "a");
        assert(vocab[0] == std::string(1, '\0'));
        assert(vocab[255] == std::string(1, static_cast<char>(0xff)));

        bpe::MergeTable empty;
        assert(bpe::build_vocab(empty) == vocab);
    }

    // Each merge concatenates its operands, in learned order
    {
        bpe::MergeTable merges;
        merges.insert({104, 105}); // 256 = "hi"
        merges.insert({256, 33});  // 257 = "hi!"
        merges.insert({257, 256}); // 258 = "hi!hi"
        auto vocab = bpe::build_vocab(merges);
        assert(vocab.size() == 259);
        assert(vocab[256] == "hi");
        assert(vocab[257] == "hi!");
        assert(vocab[258] == "hi!hi");
    }

    // Operand that does not exist yet is a corrupt table
    {
        bpe::MergeTable merges;
        merges.insert({97, 98});
        merges.insert({258, 97}); // 257 refers to 258
        bool threw = false;
        try {
            bpe::build_vocab(merges);
        } catch (const std::runtime_error &e) {
            threw = true;
            assert(std::string(e.what()).find("258") != std::string::npos);
        }
        assert(threw);
    }

    // A merge may not refer to itself either
    {
        bpe::MergeTable merges;
        merges.insert({256, 97});
        bool threw = false;
        try {
            bpe::build_vocab(merges);
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
    }

    // extend_vocab appends one token
    {
        auto vocab = bpe::byte_vocab();
        const std::string &token = bpe::extend_vocab(vocab, {120, 121});
        assert(token == "xy");
        assert(vocab.size() == 257);
        assert(vocab[256] == "xy");
    }

    // render_token
    {
        assert(bpe::render_token(std::string("\x00\x1f\x20\x7f", 4)) ==
               "\\x00\\x1f \\x7f");
        assert(bpe::render_token("Hello, world!") == "Hello, world!");
        assert(bpe::render_token(std::string("\x00Hello\x7f", 7)) ==
               "\\x00Hello\\x7f");
        assert(bpe::render_token("") == "");
        assert(bpe::render_token("\n\t") == "\\x0a\\x09");
        // Bytes above 0x7f are shown as Latin-1 characters
        assert(bpe::render_token("\xe9") == "\xc3\xa9");
        assert(bpe::render_token("\x80") == "\xc2\x80");
    }

    return 0;
}

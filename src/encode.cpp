#include "lib/config.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    std::string config_path = "params.yaml";
    std::string model_arg;
    std::string out_file;
    std::string input;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_file = argv[++i];
        } else {
            // Concatenate the remaining words of the text
            if (!input.empty()) input += " ";
            input += argv[i];
        }
    }

    if (input.empty()) {
        std::cerr << "Usage: " << argv[0]
                  << " [--config F] [--model F.model] [--out tokens.bin]"
                     " <text to tokenize...>"
                  << std::endl;
        std::cerr << "Example: " << argv[0] << " \"Hello world!\"" << std::endl;
        return 1;
    }

    try {
        const bpe::Config config = bpe::load_config_or_default(config_path);
        const std::string model_file =
            model_arg.empty() ? config.model_file : model_arg;
        auto tok = bpe::load(model_file);

        auto tokens = bpe::encode(input, tok);

        std::cout << bpe::visualize(tokens, tok) << std::endl;
        std::cout << "\nIds:";
        for (auto id : tokens) {
            std::cout << ' ' << id;
        }
        std::cout << "\nTokens: " << tokens.size() << std::endl;

        if (!out_file.empty()) {
            io::save_tokens(tokens, out_file);
            std::cout << "Saved to " << out_file << std::endl;
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

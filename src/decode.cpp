#include "lib/config.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    std::string config_path = "params.yaml";
    std::string model_arg;
    std::string in_file;
    std::vector<std::string> id_args;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--in") == 0 && i + 1 < argc) {
            in_file = argv[++i];
        } else {
            id_args.push_back(argv[i]);
        }
    }

    if (in_file.empty() && id_args.empty()) {
        std::cerr << "Usage: " << argv[0]
                  << " [--config F] [--model F.model] (--in tokens.bin | "
                     "<id...>)"
                  << std::endl;
        return 1;
    }

    try {
        const bpe::Config config = bpe::load_config_or_default(config_path);
        const std::string model_file =
            model_arg.empty() ? config.model_file : model_arg;

        std::cout << "Loading tokenizer from " << model_file << "..."
                  << std::endl;
        auto tok = bpe::load(model_file);
        std::cout << "Tokenizer loaded (vocab size: " << tok.vocab.size()
                  << ")" << std::endl;

        std::vector<bpe::TokenId> tokens;
        if (!in_file.empty()) {
            tokens = io::load_tokens(in_file);
        }
        for (const auto &arg : id_args) {
            bpe::TokenId id;
            if (!bpe::parse_token_id(arg, id)) {
                throw std::invalid_argument("Invalid token id: " + arg);
            }
            tokens.push_back(id);
        }

        std::string decoded = bpe::decode(tokens, tok);

        std::cout << "\n" << std::string(80, '=') << std::endl;
        std::cout << "DECODED TEXT:" << std::endl;
        std::cout << std::string(80, '=') << std::endl;
        std::cout << decoded << std::endl;
        std::cout << std::string(80, '=') << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

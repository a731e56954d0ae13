#include "lib/config.hpp"
#include "lib/dataloader.hpp"
#include "lib/io.hpp"
#include "lib/tokenizer.hpp"
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char *prog) {
    std::cerr << "Usage: " << prog
              << " [--config params.yaml] [--tokenizer basic|regex]"
                 " [--vocab-size N] [--quiet]"
              << std::endl;
}

int main(int argc, char *argv[]) {
    std::string config_path = "params.yaml";
    std::string tokenizer_arg;
    std::string vocab_size_arg;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];
        if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(arg, "--tokenizer") == 0 && i + 1 < argc) {
            tokenizer_arg = argv[++i];
        } else if (std::strcmp(arg, "--vocab-size") == 0 && i + 1 < argc) {
            vocab_size_arg = argv[++i];
        } else if (std::strcmp(arg, "--quiet") == 0) {
            quiet = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        bpe::Config config = bpe::load_config_or_default(config_path);
        if (!tokenizer_arg.empty()) config.tokenizer = tokenizer_arg;
        if (!vocab_size_arg.empty()) {
            if (vocab_size_arg.find_first_not_of("0123456789") !=
                std::string::npos) {
                throw std::invalid_argument("--vocab-size must be a "
                                            "non-negative integer, got " +
                                            vocab_size_arg);
            }
            config.vocab_size = std::stoul(vocab_size_arg);
        }
        if (quiet) config.verbose = false;
        bpe::validate_config(config);

        std::string text;
        if (!config.dataset_path.empty()) {
            auto paths = dataloader::load_file_paths(
                config.dataset_path, config.glob_pattern, config.max_files);
            std::cout << "Reading " << paths.size() << " files from "
                      << config.dataset_path << "..." << std::endl;
            text = io::concatenate_files(paths);
        } else {
            std::cout << "Reading " << config.input << "..." << std::endl;
            text = io::read_file(config.input);
        }
        std::cout << "Loaded " << text.size() << " bytes for training"
                  << std::endl;

        std::filesystem::create_directories(config.model_dir);

        const auto start = std::chrono::steady_clock::now();
        const std::string file_prefix =
            (std::filesystem::path(config.model_dir) / config.tokenizer)
                .string();

        std::cout << "\nTraining " << config.tokenizer
                  << " tokenizer (vocab size " << config.vocab_size << ")..."
                  << std::endl;
        bpe::Tokenizer tok = bpe::make_tokenizer(config.tokenizer);
        bpe::train(tok, text, config.vocab_size, config.verbose);
        bpe::save(tok, file_prefix);

        const std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - start;
        std::cout << "Tokenizer saved to " << file_prefix << ".model ("
                  << tok.merges.size() << " merges)" << std::endl;
        std::cout << "Took " << std::fixed << std::setprecision(2)
                  << elapsed.count() << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

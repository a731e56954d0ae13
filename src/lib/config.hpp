#pragma once

#include <cstddef>
#include <string>

namespace bpe {

// Settings for the command-line tools, read from params.yaml
struct Config {
    // train:
    std::string tokenizer = "regex"; // basic | regex
    std::string input = "data/taylorswift.txt";
    std::string dataset_path;         // if set, used instead of `input`
    std::string glob_pattern = "*.txt";
    size_t max_files = 0;
    size_t vocab_size = 512;
    bool verbose = true;
    std::string model_dir = "models";

    // encode:
    std::string model_file = "models/regex.model";
};

// Missing keys keep their defaults. Throws std::runtime_error if the file
// cannot be parsed and std::invalid_argument for an unknown tokenizer name or
// a vocab_size below 256.
Config load_config(const std::string &path);

// Same, but returns the defaults when `path` does not exist
Config load_config_or_default(const std::string &path);

void validate_config(const Config &config);

} // namespace bpe

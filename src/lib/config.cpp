#include "config.hpp"
#include "pairs.hpp"
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace bpe {

template <typename T>
static void read_key(const YAML::Node &section, const char *key, T &value) {
    if (section && section[key]) {
        value = section[key].as<T>();
    }
}

Config load_config(const std::string &path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        throw std::runtime_error("Failed to load config " + path + ": " +
                                 e.what());
    }

    Config result;
    try {
        const YAML::Node train = config["train"];
        read_key(train, "tokenizer", result.tokenizer);
        read_key(train, "input", result.input);
        read_key(train, "dataset_path", result.dataset_path);
        read_key(train, "glob_pattern", result.glob_pattern);
        read_key(train, "max_files", result.max_files);
        read_key(train, "vocab_size", result.vocab_size);
        read_key(train, "verbose", result.verbose);
        read_key(train, "model_dir", result.model_dir);

        const YAML::Node encode = config["encode"];
        read_key(encode, "model_file", result.model_file);
    } catch (const YAML::Exception &e) {
        throw std::runtime_error("Invalid value in config " + path + ": " +
                                 e.what());
    }

    validate_config(result);
    return result;
}

Config load_config_or_default(const std::string &path) {
    if (!std::filesystem::exists(path)) {
        return Config{};
    }
    return load_config(path);
}

void validate_config(const Config &config) {
    if (config.tokenizer != "basic" && config.tokenizer != "regex") {
        throw std::invalid_argument("Unknown tokenizer '" + config.tokenizer +
                                    "' (expected basic or regex)");
    }
    if (config.vocab_size < BYTE_TOKENS) {
        throw std::invalid_argument("vocab_size must be at least 256, got " +
                                    std::to_string(config.vocab_size));
    }
}

} // namespace bpe

#include "io.hpp"
#include "threading.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace io {

std::string read_file(const std::string &path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read from " + path);
    }
    return contents.str();
}

bool matches(const std::string &str, const std::string &pat, size_t s,
             size_t p) {
    if (p == pat.length()) {
        return s == str.length();
    }
    if (s == str.length()) {
        for (size_t i = p; i < pat.length(); ++i) {
            if (pat[i] != '*') return false;
        }
        return true;
    }
    char pc = pat[p];
    if (pc == '*') {
        if (matches(str, pat, s, p + 1)) return true;
        return matches(str, pat, s + 1, p);
    } else if (pc == '?' || pc == str[s]) {
        return matches(str, pat, s + 1, p + 1);
    }
    return false;
}

bool matches_glob(const std::string &str, const std::string &pattern) {
    return matches(str, pattern);
}

std::string concatenate_files(const std::vector<std::string> &paths,
                              const std::string &separator) {
    if (paths.empty()) return "";

    const size_t num_threads =
        std::max<size_t>(1, std::min<size_t>(std::thread::hardware_concurrency(),
                                             paths.size()));
    const size_t chunk_size = (paths.size() + num_threads - 1) / num_threads;

    // One output string per thread, each covering a contiguous run of paths,
    // so joining them in thread order keeps the path order
    std::vector<std::string> thread_results(num_threads);
    {
        threading::ThreadPool thread_pool(num_threads);
        for (size_t t = 0; t < num_threads; ++t) {
            size_t start = std::min(t * chunk_size, paths.size());
            size_t end = std::min(start + chunk_size, paths.size());
            thread_pool.enqueue([&, t, start, end]() {
                for (size_t i = start; i < end; ++i) {
                    const auto &path = paths[i];
                    std::error_code ec;
                    if (!std::filesystem::is_regular_file(path, ec)) continue;
                    std::ifstream file(path, std::ios::in | std::ios::binary);
                    if (!file.is_open()) continue;
                    thread_results[t].append(
                        std::istreambuf_iterator<char>(file.rdbuf()),
                        std::istreambuf_iterator<char>());
                    thread_results[t] += separator;
                }
            });
        }
        thread_pool.wait();
    }

    size_t total_size = 0;
    for (const auto &chunk : thread_results) {
        total_size += chunk.size();
    }
    std::string result;
    result.reserve(total_size);
    for (auto &chunk : thread_results) {
        result += chunk;
    }
    return result;
}

void save_tokens(const std::vector<bpe::TokenId> &tokens,
                 const std::string &filename) {
    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + filename + " for writing");
    }
    file.write(reinterpret_cast<const char *>(tokens.data()),
               tokens.size() * sizeof(bpe::TokenId));
    if (!file) {
        throw std::runtime_error("Failed to write to " + filename);
    }
}

std::vector<bpe::TokenId> load_tokens(const std::string &filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + filename + " for reading");
    }

    file.seekg(0, std::ios::end);
    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    if (size < 0 || size % sizeof(bpe::TokenId) != 0) {
        throw std::runtime_error("Invalid token file size: " + filename);
    }

    std::vector<bpe::TokenId> tokens(size / sizeof(bpe::TokenId));
    file.read(reinterpret_cast<char *>(tokens.data()), size);

    if (!file) {
        throw std::runtime_error("Failed to read from " + filename);
    }

    return tokens;
}

} // namespace io

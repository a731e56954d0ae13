#ifndef BPE_IO_HPP
#define BPE_IO_HPP

#include "tokenizer.hpp"
#include <string>
#include <vector>

namespace io {

std::string read_file(const std::string &path);

bool matches(const std::string &str, const std::string &pat, size_t s = 0,
             size_t p = 0);

bool matches_glob(const std::string &str, const std::string &pattern);

// Reads every regular file in `paths` (in parallel) and joins the contents in
// the order given, with `separator` after each file. Missing files are
// skipped.
std::string concatenate_files(const std::vector<std::string> &paths,
                              const std::string &separator = "");

void save_tokens(const std::vector<bpe::TokenId> &tokens,
                 const std::string &filename);
std::vector<bpe::TokenId> load_tokens(const std::string &filename);

} // namespace io

#endif

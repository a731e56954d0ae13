#ifndef BPE_DATALOADER_HPP
#define BPE_DATALOADER_HPP

#include <string>
#include <vector>

namespace dataloader {

// Regular files under `folder` (recursive) whose name matches `glob_pattern`,
// sorted by path. max_files = 0 means no limit.
std::vector<std::string> load_file_paths(const std::string &folder,
                                         const std::string &glob_pattern = "*",
                                         size_t max_files = 0);

}

#endif

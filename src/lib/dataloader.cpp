#include "dataloader.hpp"
#include "io.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace dataloader {

std::vector<std::string> load_file_paths(const std::string &folder,
                                         const std::string &glob_pattern,
                                         size_t max_files) {
    std::filesystem::path dir_path(folder);
    if (!std::filesystem::exists(dir_path) ||
        !std::filesystem::is_directory(dir_path)) {
        throw std::runtime_error("Failed to open directory: " +
                                 dir_path.string());
    }
    std::vector<std::string> paths;
    for (const auto &entry :
         std::filesystem::recursive_directory_iterator(dir_path)) {
        if (!entry.is_regular_file()) continue;
        std::string filename = entry.path().filename().string();
        if (io::matches_glob(filename, glob_pattern)) {
            paths.push_back(entry.path().string());
        }
    }

    // Directory iteration order is unspecified; sort so training is
    // reproducible
    std::sort(paths.begin(), paths.end());
    if (max_files > 0 && paths.size() > max_files) {
        paths.resize(max_files);
    }
    return paths;
}

} // namespace dataloader

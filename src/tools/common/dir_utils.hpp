//
// Created by anton on 09.07.2020.
//

#pragma once

#include <string>
#include <stdexcept>
#include <experimental/filesystem>

inline void ensure_dir_existance(const std::experimental::filesystem::path & path) {
    if (std::experimental::filesystem::exists(path) && !std::experimental::filesystem::is_directory(path)) {
        throw std::runtime_error("not a directory: " + path.string());
    }
    if (!std::experimental::filesystem::is_directory(path)) {
        std::experimental::filesystem::create_directories(path);
    }
}

// Path next to the input with an extra suffix, e.g. hits.blast -> hits.blast.swapped
inline std::experimental::filesystem::path with_suffix(const std::experimental::filesystem::path &path,
                                                      const std::string &suffix) {
    return {path.string() + suffix};
}

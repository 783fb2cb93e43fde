#pragma once

#include "gtest/gtest.h"
#include <experimental/filesystem>
#include <fstream>
#include <iterator>
#include <string>

inline std::experimental::filesystem::path WriteTempFile(const std::string &name, const std::string &content) {
    std::experimental::filesystem::path file = std::experimental::filesystem::path(testing::TempDir()) / name;
    std::ofstream os(file);
    os << content;
    os.close();
    return file;
}

inline std::string ReadFile(const std::experimental::filesystem::path &file) {
    std::ifstream is(file);
    std::string res((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    return res;
}

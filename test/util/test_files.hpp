// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace heartsock {
namespace test {

// Whole file as a string; empty string on failure
inline std::string ReadFileString(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace test
} // namespace heartsock

// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace heartsock {
namespace util {

/**
 * Replace a file's contents atomically
 *
 * Writes a sibling temp file, fsyncs it and its directory, then renames it
 * over the target. Readers (overlay tools polling the value files) see either
 * the old or the new contents, never a partial write.
 *
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

// Create directory (recursive). True if it exists afterwards.
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace heartsock

// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Parsing of untrusted text (command-line arguments, client command frames)
 into typed values. Every Safe* function requires the whole input to be
 consumed and returns std::nullopt on any error; none of them throw.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace heartsock {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

// Port number in [1, 65535]
std::optional<uint16_t> SafeParsePort(const std::string &str);

// Unsigned 64-bit value; rejects signs and leading whitespace
std::optional<uint64_t> SafeParseUint64(const std::string &str);

// ASCII lower-casing (multi-byte UTF-8 sequences pass through unchanged)
std::string ToLower(std::string str);

// Split on runs of ASCII whitespace; no empty tokens
std::vector<std::string> SplitWhitespace(const std::string &str);

// Split on a single delimiter, dropping empty tokens ("a,,b" -> {"a","b"})
std::vector<std::string> SplitList(const std::string &str, char delimiter = ',');

} // namespace util
} // namespace heartsock

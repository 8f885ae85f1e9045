// Copyright (c) 2025 The Heartsock developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace heartsock {
namespace util {

namespace {

// Leading whitespace is accepted by std::stol, so reject it explicitly
bool StartsWithSpace(const std::string &str) {
  return std::isspace(static_cast<unsigned char>(str[0])) != 0;
}

std::optional<long long> ParseWholeSigned(const std::string &str) {
  if (str.empty() || StartsWithSpace(str)) {
    return std::nullopt;
  }
  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  auto value = ParseWholeSigned(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<uint64_t> SafeParseUint64(const std::string &str) {
  if (str.empty() ||
      !std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return std::nullopt;
  }
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(value);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::string ToLower(std::string str) {
  for (auto &c : str) {
    auto uc = static_cast<unsigned char>(c);
    if (uc < 0x80) {
      c = static_cast<char>(std::tolower(uc));
    }
  }
  return str;
}

std::vector<std::string> SplitWhitespace(const std::string &str) {
  std::vector<std::string> tokens;
  std::istringstream iss(str);
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::vector<std::string> SplitList(const std::string &str, char delimiter) {
  std::vector<std::string> tokens;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(delimiter, pos);
    if (next == std::string::npos) {
      next = str.size();
    }
    if (next > pos) {
      tokens.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return tokens;
}

} // namespace util
} // namespace heartsock

// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

/** @file */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace predacl::utils {

/** Remove whitespace characters from the start of a string. */
inline std::string_view LTrim(const std::string_view s) {
  size_t start = 0;
  while (start < s.size() && isspace(s[start])) {
    ++start;
  }
  return std::string_view(s.data() + start, s.size() - start);
}

/** Remove whitespace characters from the end of a string. */
inline std::string_view RTrim(const std::string_view s) {
  size_t count = s.size();
  while (count > static_cast<size_t>(0) && isspace(s[count - 1])) {
    --count;
  }
  return std::string_view(s.data(), count);
}

/** Remove whitespace characters from the start and from the end of a string. */
inline std::string_view Trim(const std::string_view s) { return LTrim(RTrim(s)); }

/**
 * Lowercase all characters of a string.
 * Transformation is locale independent.
 */
inline std::string ToLowerCase(const std::string_view s) {
  std::string res(s.size(), '\0');
  std::transform(s.begin(), s.end(), res.begin(), [](char c) { return tolower(c); });
  return res;
}

/**
 * Join the `strings` collection separated by a given separator.
 */
inline std::string Join(const std::vector<std::string> &strings, const std::string_view separator) {
  std::string res;
  if (strings.empty()) return res;
  int64_t total_size = 0;
  for (const auto &x : strings) {
    total_size += x.size();
  }
  total_size += separator.size() * (static_cast<int64_t>(strings.size()) - 1);
  res.reserve(total_size);
  res += strings[0];
  for (auto it = strings.begin() + 1; it != strings.end(); ++it) {
    res += separator;
    res += *it;
  }
  return res;
}

/**
 * Split a string by `delimiter` with a maximum of `splits` into a vector.
 * The vector will have at most `splits` + 1 elements. Negative value of
 * `splits` indicates to perform all possible splits.
 */
inline std::vector<std::string> Split(const std::string_view src, const std::string_view delimiter, int splits = -1) {
  std::vector<std::string> res;
  if (src.empty()) return res;
  size_t index = 0;
  while (splits < 0 || splits-- != 0) {
    auto n = src.find(delimiter, index);
    if (n == std::string::npos) break;
    res.emplace_back(src.substr(index, n - index));
    index = n + delimiter.size();
  }
  res.emplace_back(src.substr(index));
  return res;
}

/**
 * Split a string by whitespace into a vector. Runs of consecutive whitespace
 * are regarded as a single delimiter; leading and trailing whitespace is
 * ignored.
 */
inline std::vector<std::string> Split(const std::string_view src) {
  std::vector<std::string> res;
  size_t pos = 0;
  while (pos < src.size()) {
    while (pos < src.size() && isspace(src[pos])) ++pos;
    const auto start = pos;
    while (pos < src.size() && !isspace(src[pos])) ++pos;
    if (pos > start) res.emplace_back(src.substr(start, pos - start));
  }
  return res;
}

/** Check if the given string `s` starts with the given `prefix`. */
inline bool StartsWith(const std::string_view s, const std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/** Perform case-insensitive string equality test. */
inline bool IEquals(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) return false;
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (tolower(lhs[i]) != tolower(rhs[i])) return false;
  }
  return true;
}

/** Check if the given string `s` starts with `prefix`, ignoring case. */
inline bool IStartsWith(const std::string_view s, const std::string_view prefix) {
  return s.size() >= prefix.size() && IEquals(s.substr(0, prefix.size()), prefix);
}

}  // namespace predacl::utils

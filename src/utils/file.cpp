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

#include "utils/file.hpp"

#include <fstream>
#include <iterator>

#include "utils/logging.hpp"

namespace predacl::utils {

bool EnsureDir(const std::filesystem::path &dir) noexcept {
  std::error_code error_code;  // For exception suppression.
  if (std::filesystem::exists(dir, error_code)) return std::filesystem::is_directory(dir, error_code);
  return std::filesystem::create_directories(dir, error_code);
}

void EnsureDirOrDie(const std::filesystem::path &dir) {
  PA_ASSERT(EnsureDir(dir),
            "Couldn't create directory '{}' due to a permission issue or the "
            "path exists and isn't a directory!",
            dir);
}

std::optional<std::string> ReadFile(const std::filesystem::path &path) noexcept {
  try {
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream.is_open()) return std::nullopt;
    std::string content{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) return std::nullopt;
    return content;
  } catch (const std::exception &e) {
    spdlog::warn("Couldn't read file {}: {}", path, e.what());
    return std::nullopt;
  }
}

}  // namespace predacl::utils

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

#include "utils/logging.hpp"

#include <regex>

namespace {
constexpr std::string_view kRegexFmt = "$1****$3";
}  // namespace

std::string predacl::logging::MaskSensitiveInformation(std::string_view const input) {
  static const std::regex re_all(R"((['"]?pass(?:word)?['"]?\s*[:=]\s*['"])([^'"]*)(['"]))",
                                 std::regex_constants::icase | std::regex_constants::optimize);

  auto str = std::string{input};
  return std::regex_replace(str, re_all, std::string{kRegexFmt});
}

void predacl::logging::AssertFailed(std::source_location const loc, char const *expr, std::string const &message) {
  spdlog::critical(
      "\nAssertion failed in file {} at line {}."
      "\n\tExpression: '{}'"
      "{}",
      loc.file_name(), loc.line(), expr, !message.empty() ? fmt::format("\n\tMessage: '{}'", message) : "");
  std::terminate();
}

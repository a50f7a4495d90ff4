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

#include "flags/log_level.hpp"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

#include "gflags/gflags.h"
#include "spdlog/common.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include <array>
#include <ctime>
#include <string_view>
#include <utility>
#include <vector>

using namespace std::string_view_literals;

// Logging flags
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(also_log_to_stderr, false, "Log messages go to stderr in addition to logfiles");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "Path to where the log should be stored.");

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string log_level_help_string = fmt::format("Minimum log level. Allowed values: {}",
                                                      predacl::utils::GetAllowedEnumValuesString(log_level_mappings));

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return predacl::flags::ValidLogLevel(value); });

bool predacl::flags::ValidLogLevel(std::string_view value) {
  const auto error = predacl::utils::ValidateEnumValueString(value, log_level_mappings);
  if (!error) return true;
  switch (*error) {
    case predacl::utils::ValidationError::EmptyValue: {
      std::cout << "Log level cannot be empty." << std::endl;
      break;
    }
    case predacl::utils::ValidationError::InvalidValue: {
      std::cout << "Invalid value for log level. Allowed values: "
                << predacl::utils::GetAllowedEnumValuesString(log_level_mappings) << std::endl;
      break;
    }
  }
  return false;
}

std::optional<spdlog::level::level_enum> predacl::flags::LogLevelToEnum(std::string_view value) {
  return predacl::utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

namespace {
spdlog::level::level_enum ParseLogLevel() {
  const auto log_level = predacl::flags::LogLevelToEnum(FLAGS_log_level);
  PA_ASSERT(log_level, "Invalid log level");
  return *log_level;
}

// 5 weeks * 7 days
inline constexpr auto log_retention_count = 35;
}  // namespace

void predacl::flags::InitializeLogger() {
  std::vector<spdlog::sink_ptr> sinks;

  // Force the stderr logger to be at the front of the sinks vector, so that
  // LogToStderr can find it.
  sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  sinks.back()->set_level(spdlog::level::off);

  if (!FLAGS_log_file.empty()) {
    time_t current_time{0};
    time(&current_time);
    struct tm local_time {};
    localtime_r(&current_time, &local_time);

    sinks.emplace_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        FLAGS_log_file, local_time.tm_hour, local_time.tm_min, false, log_retention_count));
  }

  const auto log_level = ParseLogLevel();
  auto logger = std::make_shared<spdlog::logger>("predacl_log", sinks.begin(), sinks.end());
  logger->set_level(log_level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));
  // Without a log file stderr is the only place the log can go.
  if (FLAGS_also_log_to_stderr || FLAGS_log_file.empty()) {
    LogToStderr(log_level);
  }
}

// Thread-safe because the level enum is an atomic
// NOTE: default_logger is not thread-safe and shouldn't be changed during application lifetime
void predacl::flags::LogToStderr(spdlog::level::level_enum log_level) {
  auto default_logger = spdlog::default_logger();
  auto sink = default_logger->sinks().front();
  sink->set_level(log_level);
}

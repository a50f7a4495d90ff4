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

#include "flags/auth.hpp"

#include <regex>

#include "utils/flag_validation.hpp"

namespace {
bool ValidRegex(const char *flagname, const std::string &value) {
  try {
    std::regex re(value);
    return true;
  } catch (const std::regex_error &e) {
    std::cout << "Expected --" << flagname << " to be a valid regular expression: " << e.what() << std::endl;
    return false;
  }
}
}  // namespace

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables,misc-unused-parameters)
DEFINE_VALIDATED_string(auth_user_or_group_name_regex, predacl::auth::kDefaultUserGroupRegex.data(),
                        "Set to the regular expression that each user or group name must fulfill.",
                        { return ValidRegex(flagname, value); });

DEFINE_bool(auth_password_permit_null, true, "Set to false to disable null passwords.");

DEFINE_VALIDATED_string(
    auth_password_strength_regex, predacl::auth::kDefaultPasswordRegex.data(),
    "The regular expression that should be used to match the entire entered password to ensure its strength.",
    { return ValidRegex(flagname, value); });
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables,misc-unused-parameters)

namespace predacl::flags {

auth::Auth::Config AuthConfigFromFlags() {
  return auth::Auth::Config{FLAGS_auth_user_or_group_name_regex, FLAGS_auth_password_strength_regex,
                            FLAGS_auth_password_permit_null};
}

}  // namespace predacl::flags

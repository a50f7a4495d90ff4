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

#include "flags/general.hpp"

#include <cstdint>
#include <limits>

#include "utils/flag_validation.hpp"

// Short help flag.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(h, false, "Print usage and exit.");

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(data_directory, "predacl_data", "Path to the directory in which to save all permanent data.", {
  if (!value.empty()) return true;
  std::cout << "Data directory cannot be empty." << std::endl;
  return false;
});

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables,misc-unused-parameters)
DEFINE_string(acl_secret_file, "",
              "Path to the file holding the key used to sign access tokens. The key must be at least 32 bytes long. "
              "When empty, a random key is generated at startup and tokens don't survive a restart.");

DEFINE_VALIDATED_int64(acl_access_ttl_sec, 6 * 60 * 60, "Lifetime of access tokens in seconds.",
                       FLAG_IN_RANGE(1, std::numeric_limits<int32_t>::max()));

DEFINE_VALIDATED_int64(acl_refresh_ttl_sec, 30 * 24 * 60 * 60, "Lifetime of refresh tokens in seconds.",
                       FLAG_IN_RANGE(1, std::numeric_limits<int32_t>::max()));

DEFINE_VALIDATED_int64(acl_cache_refresh_ms, 30000,
                       "Interval in milliseconds at which the ACL rules are reloaded from the store.",
                       FLAG_IN_RANGE(10, 86400000));

DEFINE_VALIDATED_int64(acl_token_purge_sec, 60 * 60, "Interval in seconds at which expired refresh tokens are dropped.",
                       FLAG_IN_RANGE(1, 86400));

DEFINE_bool(acl_require_login, false, "Set to true to reject every request that doesn't carry a valid access token.");

DEFINE_string(acl_groot_password, "password", "Password given to the groot user when it's first created.");
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables,misc-unused-parameters)

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

#pragma once

#include "gflags/gflags.h"

// Short help flag.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_bool(h);

// General purpose flags.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(data_directory);

// ACL flags.
// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
DECLARE_string(acl_secret_file);
DECLARE_int64(acl_access_ttl_sec);
DECLARE_int64(acl_refresh_ttl_sec);
DECLARE_int64(acl_cache_refresh_ms);
DECLARE_int64(acl_token_purge_sec);
DECLARE_bool(acl_require_login);
DECLARE_string(acl_groot_password);
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

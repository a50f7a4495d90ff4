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

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <gflags/gflags.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "acl/permission_cache.hpp"
#include "acl/rule_store.hpp"
#include "auth/auth.hpp"
#include "auth/crypto.hpp"
#include "auth/token.hpp"
#include "flags/auth.hpp"
#include "flags/general.hpp"
#include "flags/log_level.hpp"
#include "glue/auth_interceptor.hpp"
#include "glue/request_handler.hpp"
#include "query/dry_run_engine.hpp"
#include "utils/file.hpp"
#include "utils/logging.hpp"
#include "utils/scheduler.hpp"
#include "utils/string.hpp"

namespace {

std::string LoadSigningKey() {
  if (FLAGS_acl_secret_file.empty()) {
    spdlog::warn(
        "No --acl_secret_file given, signing access tokens with a random key. Tokens won't survive a restart.");
    return predacl::auth::RandomBytes(predacl::auth::TokenManager::kMinSigningKeySize);
  }
  auto key = predacl::utils::ReadFile(FLAGS_acl_secret_file);
  if (!key) {
    spdlog::critical("Couldn't read the signing key from {}!", FLAGS_acl_secret_file);
    std::exit(EXIT_FAILURE);
  }
  // Editors like to end files with a newline; it isn't part of the key.
  while (!key->empty() && (key->back() == '\n' || key->back() == '\r')) key->pop_back();
  return std::move(*key);
}

}  // namespace

int main(int argc, char **argv) {
  google::SetUsageMessage("Predicate level access control front end");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_h) {
    gflags::ShowUsageWithFlags(argv[0]);
    exit(1);
  }

  predacl::flags::InitializeLogger();

  const std::filesystem::path data_directory{FLAGS_data_directory};
  predacl::utils::EnsureDirOrDie(data_directory);

  std::unique_ptr<predacl::auth::SynchedAuth> auth;
  try {
    auth = std::make_unique<predacl::auth::SynchedAuth>(data_directory / "auth",
                                                        predacl::flags::AuthConfigFromFlags());
    auth->Lock()->Bootstrap(FLAGS_acl_groot_password);
  } catch (const std::exception &e) {
    spdlog::critical("Couldn't open the ACL store, shutting down. {}", e.what());
    return EXIT_FAILURE;
  }

  predacl::acl::AuthRuleStore rule_store{auth.get()};

  std::unique_ptr<predacl::auth::TokenManager> tokens;
  try {
    tokens = std::make_unique<predacl::auth::TokenManager>(
        auth.get(),
        predacl::auth::TokenManager::Config{
            .signing_key = LoadSigningKey(),
            .access_ttl = std::chrono::seconds(FLAGS_acl_access_ttl_sec),
            .refresh_ttl = std::chrono::seconds(FLAGS_acl_refresh_ttl_sec),
            .user_groups = [&rule_store](const std::string &identity) { return rule_store.LoadUserGroups(identity); }});
  } catch (const predacl::auth::AuthException &e) {
    spdlog::critical("Invalid token configuration, shutting down. {}", e.what());
    return EXIT_FAILURE;
  }

  std::unique_ptr<predacl::query::DryRunEngine> engine;
  try {
    engine = std::make_unique<predacl::query::DryRunEngine>(data_directory / "schema");
  } catch (const std::exception &e) {
    spdlog::critical("Couldn't open the schema store, shutting down. {}", e.what());
    return EXIT_FAILURE;
  }

  predacl::acl::PermissionCache cache{&rule_store};
  cache.Start(std::chrono::milliseconds(FLAGS_acl_cache_refresh_ms));

  predacl::utils::Scheduler token_purge_scheduler;
  token_purge_scheduler.SetInterval(std::chrono::seconds(FLAGS_acl_token_purge_sec));
  token_purge_scheduler.Run("ACL token purge", [&tokens] {
    if (const auto purged = tokens->PurgeExpired(); purged > 0) {
      spdlog::debug("Dropped {} expired refresh tokens.", purged);
    }
  });

  predacl::glue::AuthInterceptor interceptor{tokens.get(), &cache, engine.get(),
                                             predacl::glue::AuthInterceptor::Config{FLAGS_acl_require_login}};
  try {
    interceptor.BootstrapReservedSchema();
  } catch (const std::exception &e) {
    spdlog::critical("Couldn't declare the reserved predicates, shutting down. {}", e.what());
    return EXIT_FAILURE;
  }

  predacl::glue::RequestHandler handler{auth.get(), tokens.get(), &interceptor};
  spdlog::info("Ready to serve requests, ACL refresh interval is {}ms.", FLAGS_acl_cache_refresh_ms);

  std::string line;
  while (std::getline(std::cin, line)) {
    if (predacl::utils::Trim(line).empty()) continue;
    spdlog::trace("Request: {}", predacl::logging::MaskSensitiveInformation(line));
    const auto request = nlohmann::json::parse(line, nullptr, false);
    nlohmann::json response;
    if (request.is_discarded()) {
      response = {{"error", "the request is not valid JSON"}, {"kind", "SyntaxException"}};
    } else {
      response = handler.Handle(request);
    }
    std::cout << response.dump() << std::endl;
  }

  spdlog::info("Input closed, shutting down.");
  token_purge_scheduler.Stop();
  cache.Stop();
  return 0;
}

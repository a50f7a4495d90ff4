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

#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace predacl::auth {
/**
 * This exception class is thrown for all exceptions that can occur when dealing
 * with the Auth library.
 */
class AuthException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(AuthException)
};

// Each of the following carries its own name as a prefix of the message;
// clients match on that substring.

class InvalidCredentials final : public AuthException {
 public:
  InvalidCredentials() : AuthException("InvalidCredentials: invalid username or password") {}
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidCredentials)
};

class TokenExpired final : public AuthException {
 public:
  TokenExpired() : AuthException("TokenExpired: the access token has expired") {}
  SPECIALIZE_GET_EXCEPTION_NAME(TokenExpired)
};

class TokenInvalid final : public AuthException {
 public:
  explicit TokenInvalid(std::string_view reason) : AuthException(fmt::format("TokenInvalid: {}", reason)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(TokenInvalid)
};

class RefreshExpired final : public AuthException {
 public:
  RefreshExpired() : AuthException("RefreshExpired: the refresh token has expired") {}
  SPECIALIZE_GET_EXCEPTION_NAME(RefreshExpired)
};

class RefreshInvalid final : public AuthException {
 public:
  explicit RefreshInvalid(std::string_view reason) : AuthException(fmt::format("RefreshInvalid: {}", reason)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(RefreshInvalid)
};

class PermissionDenied final : public AuthException {
 public:
  explicit PermissionDenied(std::string_view reason) : AuthException(fmt::format("PermissionDenied: {}", reason)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(PermissionDenied)
};

/// Takes precedence over PermissionDenied on alter requests.
class ReservedPredicateViolation final : public AuthException {
 public:
  explicit ReservedPredicateViolation(std::string_view reason)
      : AuthException(fmt::format("ReservedPredicateViolation: {}", reason)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(ReservedPredicateViolation)
};

class Unauthenticated final : public AuthException {
 public:
  explicit Unauthenticated(std::string_view reason) : AuthException(fmt::format("Unauthenticated: {}", reason)) {}
  SPECIALIZE_GET_EXCEPTION_NAME(Unauthenticated)
};
}  // namespace predacl::auth

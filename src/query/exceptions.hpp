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

#include "utils/exceptions.hpp"

namespace predacl::query {

/**
 * @brief Base class of all request related exceptions. All exceptions
 * derived from this one are client errors, i. e. if the client sends the same
 * request again it will fail again.
 */
class QueryException : public utils::BasicException {
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(QueryException)
};

/// The request doesn't follow the wire format.
class SyntaxException : public QueryException {
 public:
  using QueryException::QueryException;
  SyntaxException() : QueryException("") {}
  SPECIALIZE_GET_EXCEPTION_NAME(SyntaxException)
};

/// The request was cancelled by its caller before it was dispatched.
class RequestCancelled : public QueryException {
 public:
  RequestCancelled() : QueryException("RequestCancelled: the request was cancelled") {}
  SPECIALIZE_GET_EXCEPTION_NAME(RequestCancelled)
};

}  // namespace predacl::query

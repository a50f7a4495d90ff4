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

#include <filesystem>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"

namespace predacl::kvstore {

class KVStoreError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(KVStoreError)
};

/**
 * Abstraction used to manage key-value pairs. The underlying implementation
 * (RocksDB) guarantees thread safety and durability properties.
 */
class KVStore final {
 public:
  KVStore() = delete;

  /**
   * @param storage Path to a directory where the data is persisted.
   * @throw KVStoreError if the directory or the database can't be opened.
   *
   * NOTE: Don't instantiate more instances of a KVStore with the same
   *       storage directory because that will lead to undefined behaviour.
   */
  explicit KVStore(std::filesystem::path storage);

  KVStore(const KVStore &other) = delete;
  KVStore(KVStore &&other) noexcept;

  KVStore &operator=(const KVStore &other) = delete;
  KVStore &operator=(KVStore &&other) noexcept;

  ~KVStore();

  /**
   * Store value under the given key.
   *
   * @return true if the value has been successfully stored.
   */
  bool Put(std::string_view key, std::string_view value);

  /**
   * Retrieve value for the given key.
   *
   * @return Value for the given key. std::nullopt in case of any error
   *         OR the value doesn't exist.
   */
  std::optional<std::string> Get(std::string_view key) const noexcept;

  /**
   * Deletes the key and corresponding value from storage.
   *
   * @return True on success, false on error. The return value is
   *         true if the key doesn't exist and underlying storage
   *         didn't encounter any error.
   */
  bool Delete(std::string_view key);

  bool DeleteMultiple(const std::vector<std::string> &keys);

  /**
   * Store values under the given keys and delete the keys in a single write batch.
   */
  bool PutAndDeleteMultiple(const std::map<std::string, std::string> &items, const std::vector<std::string> &keys);

  /**
   * Prefix-based iterator over the kvstore.
   *
   * It filters all (key, value) pairs where the key has a certain prefix
   * and behaves as if all of those pairs are stored in a single iterable
   * collection of std::pair<std::string, std::string>.
   */
  class iterator final {
   public:
    using iterator_concept [[maybe_unused]] = std::input_iterator_tag;
    using value_type = std::pair<std::string, std::string>;
    using difference_type = long;
    using pointer = const std::pair<std::string, std::string> *;
    using reference = const std::pair<std::string, std::string> &;

    explicit iterator(const KVStore *kvstore, const std::string &prefix = "", bool at_end = false);

    iterator(const iterator &other) = delete;
    iterator(iterator &&other) noexcept;
    ~iterator();

    iterator &operator=(iterator &&other) noexcept;
    iterator &operator=(const iterator &other) = delete;

    iterator &operator++();

    bool operator==(const iterator &other) const;
    bool operator!=(const iterator &other) const;

    reference operator*();
    pointer operator->();

   private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
  };

  iterator begin(const std::string &prefix = "") const { return iterator(this, prefix, false); }

  iterator end(const std::string &prefix = "") const { return iterator(this, prefix, true); }

 private:
  struct impl;
  std::unique_ptr<impl> pimpl_;
};

}  // namespace predacl::kvstore

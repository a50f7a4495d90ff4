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

#include "kvstore/kvstore.hpp"

#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include "utils/file.hpp"
#include "utils/logging.hpp"

namespace predacl::kvstore {

struct KVStore::impl {
  std::filesystem::path storage;
  std::unique_ptr<rocksdb::DB> db;
  rocksdb::Options options;
};

KVStore::KVStore(std::filesystem::path storage) : pimpl_(std::make_unique<impl>()) {
  pimpl_->storage = std::move(storage);
  if (!utils::EnsureDir(pimpl_->storage))
    throw KVStoreError("Folder for the key-value store {} couldn't be initialized!", pimpl_->storage.string());
  pimpl_->options.create_if_missing = true;
  rocksdb::DB *db = nullptr;
  auto s = rocksdb::DB::Open(pimpl_->options, pimpl_->storage.string(), &db);
  if (!s.ok())
    throw KVStoreError("RocksDB couldn't be initialized inside {} -- {}", pimpl_->storage.string(), s.ToString());
  pimpl_->db.reset(db);
}

KVStore::~KVStore() {
  if (pimpl_ == nullptr) return;
  spdlog::debug("Destroying KVStore at {}", pimpl_->storage.string());
  const auto sync = pimpl_->db->SyncWAL();
  if (!sync.ok()) spdlog::error("KVStore sync failed: {}", sync.ToString());
  const auto close = pimpl_->db->Close();
  if (!close.ok()) spdlog::error("KVStore close failed: {}", close.ToString());
}

KVStore::KVStore(KVStore &&other) noexcept : pimpl_(std::move(other.pimpl_)) {}

KVStore &KVStore::operator=(KVStore &&other) noexcept {
  pimpl_ = std::move(other.pimpl_);
  return *this;
}

bool KVStore::Put(std::string_view key, std::string_view value) {
  auto s = pimpl_->db->Put(rocksdb::WriteOptions{}, key, value);
  return s.ok();
}

std::optional<std::string> KVStore::Get(std::string_view key) const noexcept {
  std::string value;
  auto s = pimpl_->db->Get(rocksdb::ReadOptions{}, key, &value);
  if (!s.ok()) return std::nullopt;
  return value;
}

bool KVStore::Delete(std::string_view key) {
  auto s = pimpl_->db->Delete(rocksdb::WriteOptions{}, key);
  return s.ok();
}

bool KVStore::DeleteMultiple(const std::vector<std::string> &keys) { return PutAndDeleteMultiple({}, keys); }

bool KVStore::PutAndDeleteMultiple(const std::map<std::string, std::string> &items,
                                   const std::vector<std::string> &keys) {
  rocksdb::WriteBatch batch;
  for (const auto &[key, value] : items) {
    batch.Put(key, value);
  }
  for (const auto &key : keys) {
    batch.Delete(key);
  }
  auto s = pimpl_->db->Write(rocksdb::WriteOptions{}, &batch);
  return s.ok();
}

// iterator

struct KVStore::iterator::impl {
  const KVStore *kvstore;
  std::string prefix;
  std::unique_ptr<rocksdb::Iterator> it;
  std::pair<std::string, std::string> current;
};

KVStore::iterator::iterator(const KVStore *kvstore, const std::string &prefix, bool at_end)
    : pimpl_(std::make_unique<impl>()) {
  pimpl_->kvstore = kvstore;
  pimpl_->prefix = prefix;
  if (at_end) return;
  pimpl_->it.reset(kvstore->pimpl_->db->NewIterator(rocksdb::ReadOptions{}));
  pimpl_->it->Seek(pimpl_->prefix);
  if (!pimpl_->it->Valid() || !pimpl_->it->key().starts_with(pimpl_->prefix)) pimpl_->it = nullptr;
}

KVStore::iterator::iterator(KVStore::iterator &&other) noexcept : pimpl_(std::move(other.pimpl_)) {}

KVStore::iterator::~iterator() = default;

KVStore::iterator &KVStore::iterator::operator=(KVStore::iterator &&other) noexcept {
  pimpl_ = std::move(other.pimpl_);
  return *this;
}

KVStore::iterator &KVStore::iterator::operator++() {
  DPA_ASSERT(pimpl_->it, "Incrementing an exhausted KVStore iterator");
  pimpl_->it->Next();
  if (!pimpl_->it->Valid() || !pimpl_->it->key().starts_with(pimpl_->prefix)) pimpl_->it = nullptr;
  return *this;
}

bool KVStore::iterator::operator==(const iterator &other) const {
  return pimpl_->kvstore == other.pimpl_->kvstore && pimpl_->prefix == other.pimpl_->prefix &&
         pimpl_->it == other.pimpl_->it;
}

bool KVStore::iterator::operator!=(const iterator &other) const { return !(*this == other); }

KVStore::iterator::reference KVStore::iterator::operator*() {
  pimpl_->current = {pimpl_->it->key().ToString(), pimpl_->it->value().ToString()};
  return pimpl_->current;
}

KVStore::iterator::pointer KVStore::iterator::operator->() { return &**this; }

}  // namespace predacl::kvstore

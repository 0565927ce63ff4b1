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

#include "utils/file.hpp"
#include "utils/logging.hpp"

namespace leasehold::kvstore {

struct KVStore::impl {
  std::filesystem::path storage;
  std::unique_ptr<rocksdb::DB> db;
  rocksdb::Options options;
  bool read_only{false};
};

KVStore::KVStore(std::filesystem::path storage) : KVStore(std::move(storage), [] {
  rocksdb::Options options;
  options.create_if_missing = true;
  return options;
}()) {}

KVStore::KVStore(std::filesystem::path storage, rocksdb::Options db_options) : pimpl_(std::make_unique<impl>()) {
  pimpl_->storage = std::move(storage);
  pimpl_->options = std::move(db_options);
  if (!utils::EnsureDir(pimpl_->storage))
    throw KVStoreError("Folder for the key-value store " + pimpl_->storage.string() + " couldn't be initialized!");
  rocksdb::DB *db = nullptr;
  auto s = rocksdb::DB::Open(pimpl_->options, pimpl_->storage.string(), &db);
  if (!s.ok())
    throw KVStoreError("RocksDB couldn't be initialized inside " + pimpl_->storage.string() + " -- " +
                       std::string(s.ToString()));
  pimpl_->db.reset(db);
}

KVStore::KVStore(std::unique_ptr<impl> pimpl) : pimpl_(std::move(pimpl)) {}

KVStore KVStore::OpenForReadOnly(std::filesystem::path storage) {
  auto pimpl = std::make_unique<impl>();
  pimpl->storage = std::move(storage);
  pimpl->read_only = true;
  rocksdb::DB *db = nullptr;
  auto s = rocksdb::DB::OpenForReadOnly(pimpl->options, pimpl->storage.string(), &db);
  if (!s.ok())
    throw KVStoreError("RocksDB couldn't be opened read-only inside " + pimpl->storage.string() + " -- " +
                       std::string(s.ToString()));
  pimpl->db.reset(db);
  return KVStore(std::move(pimpl));
}

KVStore::~KVStore() {
  if (pimpl_ == nullptr) return;
  spdlog::debug("Destroying KVStore at {}", pimpl_->storage.string());
  if (!pimpl_->read_only) {
    const auto sync = pimpl_->db->SyncWAL();
    if (!sync.ok()) spdlog::error("KVStore sync failed!");
  }
  const auto close = pimpl_->db->Close();
  if (!close.ok()) spdlog::error("KVStore close failed!");
}

KVStore::KVStore(KVStore &&other) noexcept : pimpl_(std::move(other.pimpl_)) {}

KVStore &KVStore::operator=(KVStore &&other) noexcept {
  pimpl_ = std::move(other.pimpl_);
  return *this;
}

bool KVStore::Put(std::string_view key, std::string_view value, rocksdb::WriteOptions options) {
  auto s = pimpl_->db->Put(options, key, value);
  return logging::CheckRocksDBStatus(s);
}

std::optional<std::string> KVStore::Get(std::string_view key, rocksdb::ReadOptions options) const {
  std::string value;
  auto s = pimpl_->db->Get(options, key, &value);
  if (s.IsNotFound()) return std::nullopt;
  if (!logging::CheckRocksDBStatus(s)) {
    throw KVStoreError("Couldn't read key '{}' from the key-value store -- {}", key, s.ToString());
  }
  return value;
}

bool KVStore::Delete(std::string_view key, rocksdb::WriteOptions options) {
  auto s = pimpl_->db->Delete(options, key);
  return logging::CheckRocksDBStatus(s);
}

// iterator

struct KVStore::iterator::impl {
  const KVStore *kvstore;
  std::string prefix;
  std::unique_ptr<rocksdb::Iterator> it;
  std::pair<std::string, std::string> disk_prop;
};

KVStore::iterator::iterator(const KVStore *kvstore, const std::string &prefix, bool at_end,
                            rocksdb::ReadOptions options)
    : pimpl_(std::make_unique<impl>()) {
  pimpl_->kvstore = kvstore;
  pimpl_->prefix = prefix;
  if (at_end) return;
  pimpl_->it = std::unique_ptr<rocksdb::Iterator>(pimpl_->kvstore->pimpl_->db->NewIterator(options));
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
  pimpl_->it->Next();
  if (!pimpl_->it->Valid() || !pimpl_->it->key().starts_with(pimpl_->prefix)) pimpl_->it = nullptr;
  return *this;
}

bool KVStore::iterator::operator==(const iterator &other) const {
  return pimpl_->kvstore == other.pimpl_->kvstore && pimpl_->prefix == other.pimpl_->prefix &&
         pimpl_->it == other.pimpl_->it;
}

KVStore::iterator::reference KVStore::iterator::operator*() {
  pimpl_->disk_prop = {pimpl_->it->key().ToString(), pimpl_->it->value().ToString()};
  return pimpl_->disk_prop;
}

KVStore::iterator::pointer KVStore::iterator::operator->() { return &**this; }

size_t KVStore::Size(const std::string &prefix, rocksdb::ReadOptions options) const {
  size_t size = 0;
  for (auto it = this->begin(prefix, options); it != this->end(prefix, options); ++it) ++size;
  return size;
}

}  // namespace leasehold::kvstore

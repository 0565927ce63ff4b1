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
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <rocksdb/options.h>

#include "utils/exceptions.hpp"

namespace leasehold::kvstore {

class KVStoreError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(KVStoreError)
};

/**
 * Abstraction used to manage key-value pairs. The underlying implementation
 * guarantees thread safety and durability properties.
 *
 * Different kinds of records share one store by using distinct key prefixes.
 */
class KVStore final {
 public:
  KVStore() = delete;

  /**
   * @param storage Path to a directory where the data is persisted.
   *
   * NOTE: Only one KVStore (in one process) may use a storage directory at a
   *       time. RocksDB locks the directory and the constructor throws
   *       `KVStoreError` when it is already in use.
   */
  explicit KVStore(std::filesystem::path storage);
  KVStore(std::filesystem::path storage, rocksdb::Options db_options);

  /**
   * Opens an existing store without taking the directory lock, so it can be
   * read while another process has it open. The view is the state at the
   * time of opening and every write on it fails.
   *
   * @throw KVStoreError if there is no store in `storage` or it couldn't be opened.
   */
  static KVStore OpenForReadOnly(std::filesystem::path storage);

  KVStore(const KVStore &other) = delete;
  KVStore(KVStore &&other) noexcept;

  KVStore &operator=(const KVStore &other) = delete;
  KVStore &operator=(KVStore &&other) noexcept;

  ~KVStore();

  /**
   * Store value under the given key.
   *
   * @return true if the value has been successfully stored.
   *         In case of any error false is going to be returned.
   */
  bool Put(std::string_view key, std::string_view value, rocksdb::WriteOptions options = {});

  /**
   * Retrieve value for the given key.
   *
   * @return Value for the given key or std::nullopt if the key doesn't exist.
   * @throw KVStoreError if the underlying storage failed to answer.
   */
  std::optional<std::string> Get(std::string_view key, rocksdb::ReadOptions options = {}) const;

  /**
   * Deletes the key and corresponding value from storage.
   *
   * @return True on success, false on error. The return value is
   *         true if the key doesn't exist and underlying storage
   *         didn't encounter any error.
   */
  bool Delete(std::string_view key, rocksdb::WriteOptions options = {});

  /**
   * Returns total number of stored (key, value) pairs. The function takes an
   * optional prefix parameter used for filtering keys that start with that
   * prefix.
   */
  size_t Size(const std::string &prefix = "", rocksdb::ReadOptions options = {}) const;

  /**
   * Custom prefix-based iterator over kvstore.
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

    explicit iterator(const KVStore *kvstore, const std::string &prefix = "", bool at_end = false,
                      rocksdb::ReadOptions options = {});

    iterator(const iterator &other) = delete;
    iterator(iterator &&other) noexcept;

    ~iterator();

    iterator &operator=(iterator &&other) noexcept;
    iterator &operator=(const iterator &other) = delete;

    iterator &operator++();

    bool operator==(const iterator &other) const;

    reference operator*();

    pointer operator->();

   private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
  };

  iterator begin(const std::string &prefix = "", rocksdb::ReadOptions options = {}) const {
    return iterator(this, prefix, false, options);
  }

  iterator end(const std::string &prefix = "", rocksdb::ReadOptions options = {}) const {
    return iterator(this, prefix, true, options);
  }

 private:
  struct impl;

  explicit KVStore(std::unique_ptr<impl> pimpl);

  std::unique_ptr<impl> pimpl_;
};

}  // namespace leasehold::kvstore

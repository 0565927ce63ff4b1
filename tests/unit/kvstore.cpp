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

#include <unistd.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kvstore/kvstore.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;

class KVStore : public ::testing::Test {
 protected:
  void SetUp() override { leasehold::utils::EnsureDir(test_folder_); }

  void TearDown() override { fs::remove_all(test_folder_); }

  fs::path test_folder_{fs::temp_directory_path() /
                        ("unit_kvstore_test_" + std::to_string(static_cast<int>(getpid())))};
};

TEST_F(KVStore, PutGet) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "PutGet");
  ASSERT_TRUE(kvstore.Put("key", "value"));
  ASSERT_EQ(kvstore.Get("key").value(), "value");
}

TEST_F(KVStore, GetMissing) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "GetMissing");
  ASSERT_FALSE(kvstore.Get("key").has_value());
}

TEST_F(KVStore, PutOverwrites) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "PutOverwrites");
  ASSERT_TRUE(kvstore.Put("key", "first"));
  ASSERT_TRUE(kvstore.Put("key", "second"));
  ASSERT_EQ(kvstore.Get("key").value(), "second");
  EXPECT_EQ(kvstore.Size(), 1);
}

TEST_F(KVStore, PutGetDeleteGet) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "PutGetDeleteGet");
  ASSERT_TRUE(kvstore.Put("key", "value"));
  ASSERT_EQ(kvstore.Get("key").value(), "value");
  ASSERT_TRUE(kvstore.Delete("key"));
  ASSERT_FALSE(static_cast<bool>(kvstore.Get("key")));
  // Deleting a missing key isn't an error.
  ASSERT_TRUE(kvstore.Delete("key"));
}

TEST_F(KVStore, Durability) {
  {
    leasehold::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_TRUE(kvstore.Put("key", "value"));
  }
  {
    leasehold::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_EQ(kvstore.Get("key").value(), "value");
  }
}

TEST_F(KVStore, DirectoryInUse) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "DirectoryInUse");
  ASSERT_THROW(leasehold::kvstore::KVStore(test_folder_ / "DirectoryInUse"), leasehold::kvstore::KVStoreError);
}

TEST_F(KVStore, ReadOnlyWhileInUse) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "ReadOnlyWhileInUse");
  ASSERT_TRUE(kvstore.Put("key", "value"));

  auto reader = leasehold::kvstore::KVStore::OpenForReadOnly(test_folder_ / "ReadOnlyWhileInUse");
  ASSERT_EQ(reader.Get("key").value(), "value");
  EXPECT_EQ(reader.Size(), 1);
  EXPECT_FALSE(reader.Put("other", "value"));
  EXPECT_FALSE(reader.Delete("key"));

  // The writer is unaffected.
  ASSERT_TRUE(kvstore.Put("other", "value"));
  EXPECT_EQ(kvstore.Size(), 2);
}

TEST_F(KVStore, ReadOnlyMissingStore) {
  ASSERT_THROW(leasehold::kvstore::KVStore::OpenForReadOnly(test_folder_ / "ReadOnlyMissingStore"),
               leasehold::kvstore::KVStoreError);
}

TEST_F(KVStore, MoveConstruct) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "MoveConstruct");
  ASSERT_TRUE(kvstore.Put("key", "value"));
  leasehold::kvstore::KVStore moved(std::move(kvstore));
  ASSERT_EQ(moved.Get("key").value(), "value");
}

TEST_F(KVStore, Size) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "Size");

  ASSERT_TRUE(kvstore.Put("lock:proj-1", "a"));
  ASSERT_TRUE(kvstore.Put("lock:proj-2", "b"));
  ASSERT_TRUE(kvstore.Put("lock:proj-3", "c"));

  EXPECT_EQ(kvstore.Size("a"), 0);
  EXPECT_EQ(kvstore.Size(), 3);
  EXPECT_EQ(kvstore.Size("lock:"), 3);
  EXPECT_EQ(kvstore.Size("lock:proj-1"), 1);

  ASSERT_TRUE(kvstore.Put("doc:proj-1", "x"));
  ASSERT_TRUE(kvstore.Put("doc:proj-2", "y"));

  EXPECT_EQ(kvstore.Size(), 5);
  EXPECT_EQ(kvstore.Size("lock:"), 3);
  EXPECT_EQ(kvstore.Size("doc:"), 2);
  EXPECT_EQ(kvstore.Size("lo"), 3);
  EXPECT_EQ(kvstore.Size("lox"), 0);
}

TEST_F(KVStore, Iterator) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "Iterator");

  for (int i = 1; i <= 4; ++i) ASSERT_TRUE(kvstore.Put("key" + std::to_string(i), "value" + std::to_string(i)));

  auto it = kvstore.begin();
  ASSERT_FALSE(it == kvstore.end());
  EXPECT_EQ(it->first, "key1");
  EXPECT_EQ((*it).second, "value1");

  ++it;
  ASSERT_FALSE(it == kvstore.end());
  EXPECT_EQ((*it).first, "key2");
  EXPECT_EQ(it->second, "value2");

  ++it;
  ASSERT_FALSE(it == kvstore.end());
  EXPECT_EQ(it->first, "key3");

  ++it;
  ASSERT_FALSE(it == kvstore.end());
  EXPECT_EQ(it->first, "key4");
  EXPECT_EQ(it->second, "value4");

  ++it;
  ASSERT_TRUE(it == kvstore.end());
}

TEST_F(KVStore, IteratorPrefix) {
  leasehold::kvstore::KVStore kvstore(test_folder_ / "IteratorPrefix");

  ASSERT_TRUE(kvstore.Put("a_1", "value1"));
  ASSERT_TRUE(kvstore.Put("a_2", "value2"));
  ASSERT_TRUE(kvstore.Put("aa_1", "value1"));
  ASSERT_TRUE(kvstore.Put("aa_2", "value2"));
  ASSERT_TRUE(kvstore.Put("b_1", "value1"));

  std::vector<std::string> keys;
  for (auto it = kvstore.begin("a"); it != kvstore.end("a"); ++it) keys.push_back(it->first);
  EXPECT_EQ(keys, (std::vector<std::string>{"a_1", "a_2", "aa_1", "aa_2"}));

  keys.clear();
  for (auto it = kvstore.begin("aa_"); it != kvstore.end("aa_"); ++it) keys.push_back(it->first);
  EXPECT_EQ(keys, (std::vector<std::string>{"aa_1", "aa_2"}));

  ASSERT_TRUE(kvstore.begin("unexisting_prefix") == kvstore.end("unexisting_prefix"));
}

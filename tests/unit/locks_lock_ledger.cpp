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

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <utility>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "kvstore/kvstore.hpp"
#include "locks/exceptions.hpp"
#include "locks/lock_ledger.hpp"
#include "locks/lock_record.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;
using leasehold::locks::KVStoreLockLedger;
using leasehold::locks::LockLedgerError;
using leasehold::locks::LockRecord;
using leasehold::locks::Timestamp;

TEST(LockRecord, SerializeDeserialize) {
  const LockRecord record{.resource_id = "proj-1", .owner_id = "ctx-a", .renewed_at = Timestamp{1700000000123}};
  const auto data = record.Serialize();
  EXPECT_EQ(data["resource_id"], "proj-1");
  EXPECT_EQ(data["owner_id"], "ctx-a");
  EXPECT_EQ(data["renewed_at"], 1700000000123);
  EXPECT_EQ(LockRecord::Deserialize(data), record);
}

TEST(LockRecord, DeserializeRejectsMalformed) {
  EXPECT_THROW(LockRecord::Deserialize(nlohmann::json::array()), LockLedgerError);
  EXPECT_THROW(LockRecord::Deserialize({{"resource_id", "proj-1"}, {"owner_id", "ctx-a"}}), LockLedgerError);
  EXPECT_THROW(LockRecord::Deserialize({{"resource_id", "proj-1"}, {"owner_id", 7}, {"renewed_at", 1}}),
               LockLedgerError);
  EXPECT_THROW(LockRecord::Deserialize({{"resource_id", "proj-1"}, {"owner_id", "ctx-a"}, {"renewed_at", "now"}}),
               LockLedgerError);
}

TEST(LockRecord, DeserializeChecksTimestampRange) {
  const auto with_renewed_at = [](nlohmann::json renewed_at) {
    return nlohmann::json{{"resource_id", "proj-1"}, {"owner_id", "ctx-a"}, {"renewed_at", std::move(renewed_at)}};
  };
  EXPECT_THROW(LockRecord::Deserialize(with_renewed_at(-1)), LockLedgerError);
  EXPECT_THROW(LockRecord::Deserialize(with_renewed_at(std::numeric_limits<int64_t>::min())), LockLedgerError);
  EXPECT_THROW(LockRecord::Deserialize(with_renewed_at(std::numeric_limits<uint64_t>::max())), LockLedgerError);
  EXPECT_THROW(LockRecord::Deserialize(nlohmann::json::parse(
                   R"({"resource_id": "proj-1", "owner_id": "ctx-a", "renewed_at": 9223372036854775808})")),
               LockLedgerError);

  EXPECT_EQ(LockRecord::Deserialize(with_renewed_at(0)).renewed_at, Timestamp{0});
  EXPECT_EQ(LockRecord::Deserialize(with_renewed_at(std::numeric_limits<int64_t>::max())).renewed_at,
            Timestamp{std::numeric_limits<int64_t>::max()});
  // Parsed non-negative numbers are unsigned.
  const auto parsed = nlohmann::json::parse(
      R"({"resource_id": "proj-1", "owner_id": "ctx-a", "renewed_at": 9223372036854775807})");
  ASSERT_TRUE(parsed["renewed_at"].is_number_unsigned());
  EXPECT_EQ(LockRecord::Deserialize(parsed).renewed_at, Timestamp{std::numeric_limits<int64_t>::max()});
}

class KVStoreLockLedgerTest : public ::testing::Test {
 protected:
  void SetUp() override { leasehold::utils::EnsureDir(test_folder_); }

  void TearDown() override { fs::remove_all(test_folder_); }

  fs::path test_folder_{fs::temp_directory_path() /
                        ("unit_lock_ledger_test_" + std::to_string(static_cast<int>(getpid())))};
};

TEST_F(KVStoreLockLedgerTest, PutGetDelete) {
  leasehold::kvstore::KVStore storage(test_folder_ / "PutGetDelete");
  KVStoreLockLedger ledger(storage);

  ASSERT_FALSE(ledger.Get("proj-1"));

  const LockRecord record{.resource_id = "proj-1", .owner_id = "ctx-a", .renewed_at = Timestamp{100}};
  ledger.Put(record);
  ASSERT_EQ(ledger.Get("proj-1"), record);
  ASSERT_TRUE(storage.Get("lock:proj-1"));

  // Last write wins.
  const LockRecord overwrite{.resource_id = "proj-1", .owner_id = "ctx-b", .renewed_at = Timestamp{200}};
  ledger.Put(overwrite);
  ASSERT_EQ(ledger.Get("proj-1"), overwrite);

  ledger.Delete("proj-1");
  ASSERT_FALSE(ledger.Get("proj-1"));
  ASSERT_NO_THROW(ledger.Delete("proj-1"));
}

TEST_F(KVStoreLockLedgerTest, Durability) {
  const LockRecord record{.resource_id = "proj-1", .owner_id = "ctx-a", .renewed_at = Timestamp{100}};
  {
    leasehold::kvstore::KVStore storage(test_folder_ / "Durability");
    KVStoreLockLedger ledger(storage);
    ledger.Put(record);
  }
  {
    leasehold::kvstore::KVStore storage(test_folder_ / "Durability");
    KVStoreLockLedger ledger(storage);
    ASSERT_EQ(ledger.Get("proj-1"), record);
  }
}

TEST_F(KVStoreLockLedgerTest, ListOnlyLockRecords) {
  leasehold::kvstore::KVStore storage(test_folder_ / "ListOnlyLockRecords");
  KVStoreLockLedger ledger(storage);

  ASSERT_TRUE(storage.Put("doc:proj-1", R"({"title": "unrelated"})"));
  ledger.Put({.resource_id = "proj-2", .owner_id = "ctx-b", .renewed_at = Timestamp{2}});
  ledger.Put({.resource_id = "proj-1", .owner_id = "ctx-a", .renewed_at = Timestamp{1}});

  auto records = ledger.List();
  ASSERT_EQ(records.size(), 2);
  std::ranges::sort(records, {}, &LockRecord::resource_id);
  EXPECT_EQ(records[0].owner_id, "ctx-a");
  EXPECT_EQ(records[1].owner_id, "ctx-b");
}

TEST_F(KVStoreLockLedgerTest, CorruptRecord) {
  leasehold::kvstore::KVStore storage(test_folder_ / "CorruptRecord");
  KVStoreLockLedger ledger(storage);

  ASSERT_TRUE(storage.Put("lock:garbage", "{not json"));
  ASSERT_TRUE(storage.Put("lock:partial", R"({"resource_id": "partial"})"));
  ASSERT_TRUE(storage.Put("lock:misplaced", R"({"resource_id": "other", "owner_id": "ctx-a", "renewed_at": 1})"));
  ledger.Put({.resource_id = "proj-1", .owner_id = "ctx-a", .renewed_at = Timestamp{1}});

  // A corrupt record must never read as "not locked".
  EXPECT_THROW(ledger.Get("garbage"), LockLedgerError);
  EXPECT_THROW(ledger.Get("partial"), LockLedgerError);
  EXPECT_THROW(ledger.Get("misplaced"), LockLedgerError);

  const auto records = ledger.List();
  ASSERT_EQ(records.size(), 1);
  EXPECT_EQ(records[0].resource_id, "proj-1");
}

TEST_F(KVStoreLockLedgerTest, UnencodableResourceId) {
  leasehold::kvstore::KVStore storage(test_folder_ / "UnencodableResourceId");
  KVStoreLockLedger ledger(storage);

  const LockRecord record{.resource_id = "\xff", .owner_id = "ctx-a", .renewed_at = Timestamp{1}};
  EXPECT_THROW(ledger.Put(record), LockLedgerError);
  EXPECT_FALSE(ledger.Get("\xff"));
  EXPECT_EQ(storage.Size(), 0U);
}

TEST(KVStoreLockLedger, KeyFor) {
  EXPECT_EQ(KVStoreLockLedger::KeyFor("proj-1"), "lock:proj-1");
  EXPECT_EQ(KVStoreLockLedger::KeyFor(""), "lock:");
}

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

namespace leasehold::locks {

/**
 * Raised when the lock ledger can't be read or written, or when a stored lock
 * record is corrupt. Callers must treat it as "state unknown, try again" and
 * never as "not locked".
 */
class LockLedgerError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(LockLedgerError)
};

/**
 * Raised by a notification bus when a message can't be published or a
 * subscription can't be made.
 */
class BusError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(BusError)
};

class CoordinatorConfigError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(CoordinatorConfigError)
};

}  // namespace leasehold::locks

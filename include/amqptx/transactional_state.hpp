#ifndef AMQPTX_TRANSACTIONAL_STATE_HPP
#define AMQPTX_TRANSACTIONAL_STATE_HPP

/*
 *
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include "./internal/export.hpp"

#include <proton/binary.hpp>

#include <cstdint>
#include <iosfwd>

/// @file
/// @copybrief amqptx::transactional_state

struct pn_delivery_t;

namespace amqptx {

/// The AMQP transactional-state delivery state for one transaction.
///
/// The transaction context caches two of these while a transaction is
/// active: one with an accepted outcome, used by consumers to accept
/// deliveries as part of the transaction, and one without an outcome,
/// used by producers to mark transfers as enrolled.
class transactional_state {
  public:
    /// The outcome carried by the state.
    enum outcome {
        NONE,
        ACCEPTED
    };

    AMQPTX_EXTERN transactional_state(proton::binary txn_id, enum outcome o = NONE);

    const proton::binary& txn_id() const { return txn_id_; }

    enum outcome outcome() const { return outcome_; }

    /// The AMQP descriptor code of the outcome, 0 when there is none.
    AMQPTX_EXTERN uint64_t outcome_type() const;

    /// Set this as the local state of a delivery and update it.
    AMQPTX_EXTERN void apply(pn_delivery_t* d) const;

  private:
    proton::binary txn_id_;
    enum outcome outcome_;
};

AMQPTX_EXTERN bool operator==(const transactional_state&, const transactional_state&);
AMQPTX_EXTERN std::ostream& operator<<(std::ostream&, const transactional_state&);

} // namespace amqptx

#endif // AMQPTX_TRANSACTIONAL_STATE_HPP

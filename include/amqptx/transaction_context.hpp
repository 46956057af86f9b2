#ifndef AMQPTX_TRANSACTION_CONTEXT_HPP
#define AMQPTX_TRANSACTION_CONTEXT_HPP

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
#include "./completion.hpp"
#include "./coordinator.hpp"
#include "./enrollment.hpp"
#include "./transaction_id.hpp"
#include "./transactional_state.hpp"

#include <proton/binary.hpp>

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>

/// @file
/// @copybrief amqptx::transaction_context

namespace amqptx {

class send_completion;

/// Coordinates the transaction of one session.
///
/// The context carries a transaction_id while a transaction is active.
/// Once the transaction has been committed or rolled back the id is
/// cleared and a new transaction can begin.
///
/// All functions, and every completion they resolve, run on the thread
/// that drives the session's connection. Illegal requests are reported
/// through the completion, at once, without contacting the coordinator.
class transaction_context {
  public:
    /// Where the context is in the life of a transaction.
    enum state {
        /// No transaction.
        IDLE,
        /// begin() issued, waiting for the link and the declare.
        DECLARING,
        /// A transaction is bound and resources may enroll.
        ACTIVE,
        /// commit() or rollback() issued, waiting for the discharge.
        DISCHARGING
    };

    /// Create the context for the session named `session_name`.
    /// Coordinator links are opened on demand with `builder`.
    AMQPTX_EXTERN transaction_context(std::string session_name,
                                      std::unique_ptr<coordinator_builder> builder);

    AMQPTX_EXTERN ~transaction_context();

    transaction_context(const transaction_context&) = delete;
    transaction_context& operator=(const transaction_context&) = delete;

    /// Declare a new transaction named `id`.
    ///
    /// Fails with tx_error::ILLEGAL_STATE unless the context is IDLE.
    /// If there is no coordinator link, or the last one closed, a new
    /// link is opened before the declare is sent.
    AMQPTX_EXTERN void begin(const transaction_id& id, completion request);

    /// Commit the current transaction.
    ///
    /// Enrolled consumers see pre_commit() before the discharge and
    /// post_commit() after it completes. The context is IDLE again
    /// before `request` is resolved, whatever the outcome.
    AMQPTX_EXTERN void commit(const transaction_info& info, completion request);

    /// Commit the current transaction once `pending_sends` enrolled
    /// sends have been acknowledged.
    ///
    /// Each outstanding send resolves one token() of the returned
    /// aggregator. If any of them fails the transaction is rolled back
    /// instead and `request` fails with tx_error::ROLLED_BACK. Returns
    /// null if the commit was refused, in which case `request` has
    /// already failed.
    AMQPTX_EXTERN std::shared_ptr<send_completion> commit(const transaction_info& info, completion request,
                                                          size_t pending_sends);

    /// Roll back the current transaction.
    ///
    /// A transaction whose coordinator link has closed has nothing left
    /// to discharge: the rollback succeeds at once.
    AMQPTX_EXTERN void rollback(const transaction_info& info, completion request);

    /// Enroll a consumer in the current transaction.
    AMQPTX_EXTERN void register_tx_consumer(tx_consumer& c);

    /// Enroll a producer in the current transaction.
    AMQPTX_EXTERN void register_tx_producer(tx_producer& p);

    AMQPTX_EXTERN bool is_in_transaction(const consumer_id& id) const;
    AMQPTX_EXTERN bool is_in_transaction(const producer_id& id) const;

    /// True if a coordinator link exists and has closed. A transaction
    /// bound at that point is in doubt.
    AMQPTX_EXTERN bool is_transaction_failed() const;

    /// Install the coordinator link, replacing any previous one.
    /// Called by the coordinator_builder when a link is ready.
    AMQPTX_EXTERN void install_coordinator(std::unique_ptr<coordinator> c);

    /// The installed coordinator link, null if none was ever built.
    coordinator* coordinator_link() const { return coordinator_.get(); }

    enum state state() const { return state_; }

    /// The current transaction, empty if none.
    const transaction_id& current_transaction() const { return current_; }

    /// The coordinator's id for the current transaction, empty if none.
    AMQPTX_EXTERN proton::binary amqp_transaction_id() const;

    /// The state used to accept deliveries in the current transaction,
    /// null if no transaction is active.
    const transactional_state* txn_accept_state() const { return accept_state_.get(); }

    /// The state used to enroll transfers in the current transaction,
    /// null if no transaction is active.
    const transactional_state* txn_enrolled_state() const { return enrolled_state_.get(); }

    const std::string& session_name() const { return session_name_; }

    const enrollment& enrolled() const { return enrolled_; }

  private:
    void declare(const transaction_id& id, completion request);
    void declare_failed(const transaction_id& id, const tx_error& e, const completion& request);
    bool check_current(const transaction_info& info, bool commit, const completion& request);
    void in_doubt(bool commit, bool caller_in_doubt, const completion& request);
    void discharge(completion request, bool commit, bool requested_commit);
    void pre_commit();
    void pre_rollback();
    void post_commit();
    void post_rollback();
    void cleanup(bool commit);
    void reset();

    std::string session_name_;
    std::unique_ptr<coordinator_builder> builder_;
    std::unique_ptr<coordinator> coordinator_;
    enum state state_;
    transaction_id current_;
    std::unique_ptr<transactional_state> accept_state_;
    std::unique_ptr<transactional_state> enrolled_state_;
    enrollment enrolled_;

  friend class send_completion;
};

/// Name of a context state, e.g. "active".
AMQPTX_EXTERN const char* state_name(enum transaction_context::state);

/// Prints "<session name>: txContext".
AMQPTX_EXTERN std::ostream& operator<<(std::ostream&, const transaction_context&);

} // namespace amqptx

#endif // AMQPTX_TRANSACTION_CONTEXT_HPP

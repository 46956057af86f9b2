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

#include "amqptx/transaction_context.hpp"
#include "amqptx/send_completion.hpp"
#include "amqptx/tx_error.hpp"

#include "log.hpp"
#include "msg.hpp"

#include <proton/error.hpp>

#include <ostream>
#include <utility>

namespace amqptx {

transaction_context::transaction_context(std::string session_name,
                                         std::unique_ptr<coordinator_builder> builder) :
    session_name_(std::move(session_name)), builder_(std::move(builder)), state_(IDLE)
{
    if (!builder_) throw proton::error("transaction_context: null coordinator builder");
}

transaction_context::~transaction_context() = default;

void transaction_context::begin(const transaction_id& id, completion request) {
    if (state_ != IDLE) {
        request.fail(tx_error(tx_error::ILLEGAL_STATE,
                              msg() << "cannot begin " << id << ", context is " << state_name(state_)));
        return;
    }
    if (id.empty()) {
        request.fail(tx_error(tx_error::ILLEGAL_STATE, "cannot begin a transaction without an id"));
        return;
    }

    state_ = DECLARING;
    log_trace(msg() << *this << " begin TX[" << id << "]");

    if (!coordinator_ || coordinator_->closed()) {
        log_debug(msg() << *this << " opening coordinator link");
        builder_->build(*this, completion(
            [this, id, request]() { declare(id, request); },
            [this, id, request](const tx_error& e) { declare_failed(id, e, request); }));
    } else {
        declare(id, request);
    }
}

void transaction_context::declare(const transaction_id& id, completion request) {
    if (!coordinator_ || coordinator_->closed()) {
        declare_failed(id, tx_error(tx_error::LINK_FAILED, "coordinator link is not open"), request);
        return;
    }
    coordinator_->declare(id, declare_completion(
        [this, id, request](const proton::binary& txn_id) {
            current_ = id.with_hint(txn_id);
            accept_state_ = std::make_unique<transactional_state>(txn_id, transactional_state::ACCEPTED);
            enrolled_state_ = std::make_unique<transactional_state>(txn_id);
            state_ = ACTIVE;
            log_trace(msg() << *this << " declared TX[" << current_ << "]");
            request.succeed();
        },
        [this, id, request](const tx_error& e) { declare_failed(id, e, request); }));
}

// Nothing was bound: drop whatever enrolled while waiting.
void transaction_context::declare_failed(const transaction_id& id, const tx_error& e,
                                         const completion& request) {
    log_debug(msg() << *this << " declare of TX[" << id << "] failed: " << e);
    reset();
    enrolled_.clear();
    request.fail(e);
}

void transaction_context::commit(const transaction_info& info, completion request) {
    if (!check_current(info, true, request)) return;
    if (is_transaction_failed()) {
        in_doubt(true, info.in_doubt, request);
        return;
    }
    pre_commit();
    state_ = DISCHARGING;
    log_trace(msg() << *this << " commit TX[" << current_ << "]");
    discharge(request, true, true);
}

std::shared_ptr<send_completion> transaction_context::commit(const transaction_info& info, completion request,
                                                             size_t pending_sends) {
    if (!check_current(info, true, request)) return nullptr;
    if (is_transaction_failed()) {
        in_doubt(true, info.in_doubt, request);
        return nullptr;
    }
    pre_commit();
    state_ = DISCHARGING;
    log_trace(msg() << *this << " commit TX[" << current_ << "] after " << pending_sends << " sends");
    std::shared_ptr<send_completion> sends =
        std::make_shared<send_completion>(*this, current_, request, pending_sends, true);
    if (pending_sends == 0) discharge(request, true, true);
    return sends;
}

void transaction_context::rollback(const transaction_info& info, completion request) {
    if (!check_current(info, false, request)) return;
    if (is_transaction_failed()) {
        in_doubt(false, info.in_doubt, request);
        return;
    }
    pre_rollback();
    state_ = DISCHARGING;
    log_trace(msg() << *this << " rollback TX[" << current_ << "]");
    discharge(request, false, false);
}

// Returns true if the request concerns the current transaction and may
// go ahead, otherwise resolves it.
bool transaction_context::check_current(const transaction_info& info, bool commit, const completion& request) {
    const char* op = commit ? "commit" : "rollback";
    if (!current_.empty() && info.id == current_) {
        if (state_ != DISCHARGING) return true;
        request.fail(tx_error(tx_error::ILLEGAL_STATE,
                              msg() << "cannot " << op << " TX[" << current_ << "], already discharging"));
        return false;
    }
    if (info.in_doubt) {
        // Nothing to discharge: the transaction was lost with its link.
        if (commit) {
            request.fail(tx_error(tx_error::ROLLED_BACK,
                                  msg() << "TX[" << info.id << "] is in doubt and was rolled back"));
        } else {
            request.succeed();
        }
    } else if (current_.empty()) {
        request.fail(tx_error(tx_error::ILLEGAL_STATE, msg() << "cannot " << op << ", no active transaction"));
    } else {
        request.fail(tx_error(tx_error::ILLEGAL_STATE,
                              msg() << "cannot " << op << " TX[" << info.id << "], current is TX["
                              << current_ << "]"));
    }
    return false;
}

// The coordinator link closed under the current transaction.
void transaction_context::in_doubt(bool commit, bool caller_in_doubt, const completion& request) {
    if (commit && !caller_in_doubt) {
        request.fail(tx_error(tx_error::ILLEGAL_STATE,
                              msg() << "TX[" << current_ << "] is in doubt, coordinator link closed"));
        return;
    }
    log_warning(msg() << *this << " TX[" << current_ << "] in doubt, rolled back locally");
    pre_rollback();
    cleanup(false);
    if (commit) {
        request.fail(tx_error(tx_error::ROLLED_BACK, "transaction in doubt, coordinator link closed"));
    } else {
        request.succeed();
    }
}

void transaction_context::discharge(completion request, bool commit, bool requested_commit) {
    transaction_id id = current_;
    coordinator_->discharge(id, completion(
        [this, id, commit, requested_commit, request]() {
            log_trace(msg() << *this << " discharged TX[" << id << "]" << (commit ? " commit" : " rollback"));
            cleanup(commit);
            if (commit == requested_commit) {
                request.succeed();
            } else {
                request.fail(tx_error(tx_error::ROLLED_BACK,
                                      msg() << "TX[" << id << "] rolled back, a send failed"));
            }
        },
        [this, id, commit, request](const tx_error& e) {
            log_debug(msg() << *this << " discharge of TX[" << id << "] failed: " << e);
            cleanup(commit);
            request.fail(e);
        }), commit);
}

void transaction_context::pre_commit() {
    enrolled_.for_each_consumer([](tx_consumer& c) { c.pre_commit(); });
}

void transaction_context::pre_rollback() {
    enrolled_.for_each_consumer([](tx_consumer& c) { c.pre_rollback(); });
}

void transaction_context::post_commit() {
    enrolled_.for_each_consumer([](tx_consumer& c) { c.post_commit(); });
}

void transaction_context::post_rollback() {
    enrolled_.for_each_consumer([](tx_consumer& c) { c.post_rollback(); });
}

// Unbind the transaction, run the post hooks and end the enrollment.
void transaction_context::cleanup(bool commit) {
    reset();
    if (commit) post_commit(); else post_rollback();
    enrolled_.clear();
}

void transaction_context::reset() {
    current_ = transaction_id();
    accept_state_.reset();
    enrolled_state_.reset();
    state_ = IDLE;
}

void transaction_context::register_tx_consumer(tx_consumer& c) {
    log_trace(msg() << *this << " enroll " << c.id() << " in TX[" << current_ << "]");
    enrolled_.add(c);
}

void transaction_context::register_tx_producer(tx_producer& p) {
    log_trace(msg() << *this << " enroll " << p.id() << " in TX[" << current_ << "]");
    enrolled_.add(p);
}

bool transaction_context::is_in_transaction(const consumer_id& id) const {
    return enrolled_.contains(id);
}

bool transaction_context::is_in_transaction(const producer_id& id) const {
    return enrolled_.contains(id);
}

bool transaction_context::is_transaction_failed() const {
    return coordinator_ && coordinator_->closed();
}

void transaction_context::install_coordinator(std::unique_ptr<coordinator> c) {
    coordinator_ = std::move(c);
}

proton::binary transaction_context::amqp_transaction_id() const {
    return current_.provider_hint();
}

const char* state_name(enum transaction_context::state s) {
    switch (s) {
      case transaction_context::IDLE: return "idle";
      case transaction_context::DECLARING: return "declaring";
      case transaction_context::ACTIVE: return "active";
      case transaction_context::DISCHARGING: return "discharging";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& o, const transaction_context& ctx) {
    return o << ctx.session_name() << ": txContext";
}

} // namespace amqptx

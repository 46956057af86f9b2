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

#include "amqptx/send_completion.hpp"
#include "amqptx/transaction_context.hpp"

#include "log.hpp"
#include "msg.hpp"

#include <proton/error.hpp>

#include <utility>

namespace amqptx {

send_completion::send_completion(transaction_context& ctx, const transaction_id& id, completion request,
                                 size_t pending, bool commit) :
    context_(ctx), id_(id), request_(std::move(request)), pending_(pending),
    requested_commit_(commit), commit_(commit), discharged_(pending == 0)
{}

completion send_completion::token() {
    std::shared_ptr<send_completion> self = shared_from_this();
    return completion([self]() { self->on_success(); },
                      [self](const tx_error& e) { self->on_failure(e); });
}

void send_completion::on_success() {
    resolved_one();
}

void send_completion::on_failure(const tx_error& cause) {
    if (commit_ && requested_commit_) {
        log_debug(msg() << context_ << " send in TX[" << id_ << "] failed, rolling back: " << cause);
    }
    commit_ = false;
    resolved_one();
}

void send_completion::resolved_one() {
    if (pending_ == 0) {
        throw proton::error(msg() << "TX[" << id_ << "]: more send outcomes than outstanding sends");
    }
    if (--pending_ > 0) return;

    discharged_ = true;
    if (context_.current_transaction() != id_ || context_.state() != transaction_context::DISCHARGING) {
        request_.fail(tx_error(tx_error::ILLEGAL_STATE,
                               msg() << "TX[" << id_ << "] is no longer being committed"));
        return;
    }
    if (context_.is_transaction_failed()) {
        // Nothing left to discharge on: roll back locally
        log_warning(msg() << context_ << " TX[" << id_ << "] in doubt, rolled back locally");
        context_.cleanup(false);
        if (requested_commit_) {
            request_.fail(tx_error(tx_error::ROLLED_BACK, "transaction in doubt, coordinator link closed"));
        } else {
            request_.succeed();
        }
        return;
    }
    context_.discharge(request_, commit_, requested_commit_);
}

} // namespace amqptx

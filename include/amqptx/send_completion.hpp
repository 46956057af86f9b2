#ifndef AMQPTX_SEND_COMPLETION_HPP
#define AMQPTX_SEND_COMPLETION_HPP

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
#include "./transaction_id.hpp"
#include "./tx_error.hpp"

#include <cstddef>
#include <memory>

/// @file
/// @copybrief amqptx::send_completion

namespace amqptx {

class transaction_context;

/// Collects the acknowledgments of the sends enrolled in a transaction
/// into a single discharge.
///
/// Every outstanding send resolves the aggregator exactly once, through
/// its own token(). When the last one is in, the discharge is issued: a
/// commit only if every send succeeded, a rollback if any failed.
///
/// Created by transaction_context::commit(); it must not outlive that
/// context.
class send_completion : public std::enable_shared_from_this<send_completion> {
  public:
    /// @cond INTERNAL
    AMQPTX_EXTERN send_completion(transaction_context& ctx, const transaction_id& id, completion request,
                                  size_t pending, bool commit);
    /// @endcond

    send_completion(const send_completion&) = delete;
    send_completion& operator=(const send_completion&) = delete;

    /// A completion for one outstanding send, resolving this aggregator
    /// when it is resolved.
    AMQPTX_EXTERN completion token();

    /// Record a successful send acknowledgment.
    AMQPTX_EXTERN void on_success();

    /// Record a failed send. The transaction will be rolled back.
    AMQPTX_EXTERN void on_failure(const tx_error& cause);

    /// Acknowledgments still expected.
    size_t pending() const { return pending_; }

    /// True while every resolution so far has succeeded.
    bool commit() const { return commit_; }

    /// True once the discharge has been issued.
    bool discharged() const { return discharged_; }

  private:
    void resolved_one();

    transaction_context& context_;
    transaction_id id_;
    completion request_;
    size_t pending_;
    bool requested_commit_;
    bool commit_;
    bool discharged_;
};

} // namespace amqptx

#endif // AMQPTX_SEND_COMPLETION_HPP

#ifndef AMQPTX_COORDINATOR_HPP
#define AMQPTX_COORDINATOR_HPP

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

/// @file
/// @copybrief amqptx::coordinator

namespace amqptx {

class transaction_context;

/// The link to a remote transaction coordinator.
///
/// Whether the link is open is decided by the link machinery, not by
/// declare() or discharge(). A link that closes while a transaction is
/// active leaves that transaction in doubt; the transaction context
/// finds out by asking closed().
class
AMQPTX_CLASS_EXTERN coordinator {
  public:
    AMQPTX_EXTERN virtual ~coordinator();

    /// Ask the coordinator for a new transaction. On success the
    /// completion receives the coordinator's transaction id.
    virtual void declare(const transaction_id& id, declare_completion done) = 0;

    /// End the transaction `id`, committing it if `commit` is true and
    /// rolling it back otherwise.
    virtual void discharge(const transaction_id& id, completion done, bool commit) = 0;

    /// True once the link has closed, for whatever reason.
    virtual bool closed() const = 0;
};

/// Opens coordinator links on behalf of a transaction context.
class
AMQPTX_CLASS_EXTERN coordinator_builder {
  public:
    AMQPTX_EXTERN virtual ~coordinator_builder();

    /// Start opening a new coordinator link for `ctx`.
    ///
    /// When the link is ready the builder must install it with
    /// transaction_context::install_coordinator() before succeeding `done`.
    /// If it cannot be opened `done` fails with tx_error::LINK_FAILED.
    virtual void build(transaction_context& ctx, completion done) = 0;
};

} // namespace amqptx

#endif // AMQPTX_COORDINATOR_HPP

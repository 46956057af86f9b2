#ifndef AMQPTX_AMQP_COORDINATOR_HPP
#define AMQPTX_AMQP_COORDINATOR_HPP

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

#include <proton/error_condition.hpp>
#include <proton/symbol.hpp>
#include <proton/value.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

/// @file
/// AMQP 1.0 coordinator links over the Proton engine.

struct pn_delivery_t;
struct pn_event_t;
struct pn_link_t;
struct pn_session_t;

namespace amqptx {

/// The capability a coordinator target offers for local transactions.
AMQPTX_EXTERN extern const char* const LOCAL_TRANSACTIONS;

/// A coordinator link on a Proton session.
///
/// The link is a sender with a coordinator target. Declares and
/// discharges are sent as `amqp:declare:list` and `amqp:discharge:list`
/// control messages and complete when the coordinator settles them.
///
/// The object is attached to its pn_link_t; the loop driving the
/// connection passes engine events to dispatch(), which finds the
/// coordinator the event belongs to.
class
AMQPTX_CLASS_EXTERN amqp_coordinator : public coordinator {
  public:
    /// Open a coordinator link called `name` on `session`. `opened`
    /// succeeds when the coordinator attaches its end of the link and
    /// fails with tx_error::LINK_FAILED if the link closes first.
    AMQPTX_EXTERN amqp_coordinator(pn_session_t* session, const std::string& name,
                                   completion opened = completion());

    AMQPTX_EXTERN ~amqp_coordinator();

    amqp_coordinator(const amqp_coordinator&) = delete;
    amqp_coordinator& operator=(const amqp_coordinator&) = delete;

    AMQPTX_EXTERN void declare(const transaction_id& id, declare_completion done) override;
    AMQPTX_EXTERN void discharge(const transaction_id& id, completion done, bool commit) override;
    AMQPTX_EXTERN bool closed() const override;

    /// True once the coordinator has attached its end of the link.
    bool opened() const { return opened_; }

    /// Declares and discharges still waiting for an outcome.
    size_t outstanding() const { return outstanding_.size(); }

    /// The error the coordinator closed the link with, if any.
    const proton::error_condition& error() const { return error_; }

    pn_link_t* pn_link() const { return link_; }

    /// Handle an event for this coordinator's link.
    ///
    /// Completions are resolved last; their callbacks may destroy this
    /// coordinator.
    AMQPTX_EXTERN void handle(pn_event_t* e);

    /// Pass `e` to the coordinator it concerns, if any.
    ///
    /// Link and delivery events go to the coordinator attached to the
    /// link. Connection and transport close events close every
    /// coordinator on the connection. Returns true if a coordinator
    /// handled the event.
    AMQPTX_EXTERN static bool dispatch(pn_event_t* e);

    /// The coordinator attached to `l`, null if none.
    AMQPTX_EXTERN static amqp_coordinator* get(pn_link_t* l);

  private:
    struct operation {
        operation() : is_declare(false), commit(false) {}

        bool is_declare;
        declare_completion declared;
        completion discharged;
        bool commit;
    };

    pn_delivery_t* send_control(const proton::symbol& descriptor, const proton::value& body);
    void outcome(pn_delivery_t* d);
    void close(const proton::error_condition& cond);

    pn_link_t* link_;
    completion opening_;
    bool opened_;
    bool closed_;
    uint64_t next_tag_;
    proton::error_condition error_;
    std::map<pn_delivery_t*, operation> outstanding_;
};

/// Opens amqp_coordinator links on a Proton session.
class
AMQPTX_CLASS_EXTERN amqp_coordinator_builder : public coordinator_builder {
  public:
    AMQPTX_EXTERN explicit amqp_coordinator_builder(pn_session_t* session,
                                                    std::string link_name = "txn-ctrl");

    AMQPTX_EXTERN ~amqp_coordinator_builder();

    AMQPTX_EXTERN void build(transaction_context& ctx, completion done) override;

    /// The link being opened, null if none.
    amqp_coordinator* building() const { return building_.get(); }

  private:
    pn_session_t* session_;
    std::string link_name_;
    std::unique_ptr<amqp_coordinator> building_;
};

} // namespace amqptx

#endif // AMQPTX_AMQP_COORDINATOR_HPP

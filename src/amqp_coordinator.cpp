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

#include "amqptx/amqp_coordinator.hpp"
#include "amqptx/transaction_context.hpp"

#include "log.hpp"
#include "msg.hpp"

#include <proton/binary.hpp>
#include <proton/codec/encoder.hpp>
#include <proton/codec/list.hpp>
#include <proton/error.hpp>
#include <proton/message.hpp>

#include <proton/codec.h>
#include <proton/condition.h>
#include <proton/connection.h>
#include <proton/delivery.h>
#include <proton/disposition.h>
#include <proton/error.h>
#include <proton/event.h>
#include <proton/link.h>
#include <proton/object.h>
#include <proton/terminus.h>
#include <proton/transport.h>

#include <cstring>
#include <list>
#include <utility>
#include <vector>

namespace amqptx {

const char* const LOCAL_TRANSACTIONS = "amqp:local-transactions";

namespace {

PN_HANDLE(AMQPTX_COORDINATOR)

const proton::symbol DECLARE("amqp:declare:list");
const proton::symbol DISCHARGE("amqp:discharge:list");

proton::error_condition make_condition(pn_condition_t* c) {
    if (!c || !pn_condition_is_set(c)) return proton::error_condition();
    const char* name = pn_condition_get_name(c);
    const char* desc = pn_condition_get_description(c);
    return proton::error_condition(name ? name : "", desc ? desc : "");
}

proton::binary make_binary(pn_bytes_t b) {
    return proton::binary(b.start, b.start + b.size);
}

const char* outcome_name(uint64_t type) {
    return type ? pn_disposition_type_name(type) : "none";
}

} // namespace

amqp_coordinator::amqp_coordinator(pn_session_t* session, const std::string& name, completion opened) :
    link_(0), opening_(std::move(opened)), opened_(false), closed_(false), next_tag_(0)
{
    if (!session) throw proton::error("amqp_coordinator: null session");
    link_ = pn_sender(session, name.c_str());
    pn_incref(link_);

    pn_terminus_t* target = pn_link_target(link_);
    pn_terminus_set_type(target, PN_COORDINATOR);
    pn_data_t* caps = pn_terminus_capabilities(target);
    pn_data_put_array(caps, false, PN_SYMBOL);
    pn_data_enter(caps);
    pn_data_put_symbol(caps, pn_bytes(std::strlen(LOCAL_TRANSACTIONS), LOCAL_TRANSACTIONS));
    pn_data_exit(caps);

    pn_record_t* r = pn_link_attachments(link_);
    pn_record_def(r, AMQPTX_COORDINATOR, PN_VOID);
    pn_record_set(r, AMQPTX_COORDINATOR, this);

    pn_link_open(link_);
    log_debug(msg() << "coordinator link " << name << " opening");
}

amqp_coordinator::~amqp_coordinator() {
    pn_record_set(pn_link_attachments(link_), AMQPTX_COORDINATOR, 0);
    if (!(pn_link_state(link_) & PN_LOCAL_CLOSED)) pn_link_close(link_);
    pn_decref(link_);
}

amqp_coordinator* amqp_coordinator::get(pn_link_t* l) {
    return reinterpret_cast<amqp_coordinator*>(pn_record_get(pn_link_attachments(l), AMQPTX_COORDINATOR));
}

bool amqp_coordinator::closed() const { return closed_; }

pn_delivery_t* amqp_coordinator::send_control(const proton::symbol& descriptor, const proton::value& body) {
    proton::value v;
    proton::codec::encoder enc(v);
    enc << proton::codec::start::described()
        << descriptor
        << body
        << proton::codec::finish();

    proton::message m(v);
    std::vector<char> buf;
    m.encode(buf);

    uint64_t tag = next_tag_++;
    pn_delivery_t* d = pn_delivery(link_, pn_dtag(reinterpret_cast<const char*>(&tag), sizeof(tag)));
    ssize_t n = pn_link_send(link_, buf.data(), buf.size());
    if (n < 0) {
        pn_delivery_settle(d);
        throw proton::error(msg() << "coordinator link " << pn_link_name(link_) << ": send failed, "
                            << pn_code(int(n)));
    }
    pn_link_advance(link_);
    return d;
}

void amqp_coordinator::declare(const transaction_id& id, declare_completion done) {
    if (closed_) {
        done.fail(tx_error(tx_error::DECLARE_FAILED, "coordinator link closed", error_));
        return;
    }
    operation op;
    op.is_declare = true;
    op.declared = done;
    outstanding_[send_control(DECLARE, std::list<proton::value>())] = op;
    log_trace(msg() << pn_link_name(link_) << ": declare TX[" << id << "]");
}

void amqp_coordinator::discharge(const transaction_id& id, completion done, bool commit) {
    if (closed_) {
        done.fail(tx_error(tx_error::DISCHARGE_FAILED, "coordinator link closed", error_));
        return;
    }
    if (id.provider_hint().empty()) {
        done.fail(tx_error(tx_error::DISCHARGE_FAILED, msg() << "TX[" << id << "] was never declared"));
        return;
    }
    operation op;
    op.discharged = done;
    op.commit = commit;
    std::list<proton::value> fields;
    fields.push_back(id.provider_hint());
    fields.push_back(!commit);
    outstanding_[send_control(DISCHARGE, fields)] = op;
    log_trace(msg() << pn_link_name(link_) << ": discharge TX[" << id << "] fail=" << !commit);
}

void amqp_coordinator::handle(pn_event_t* e) {
    switch (pn_event_type(e)) {
      case PN_LINK_REMOTE_OPEN: {
        // A refusing coordinator attaches without a target, then detaches.
        if (opened_ || closed_ || pn_terminus_get_type(pn_link_remote_target(link_)) != PN_COORDINATOR) return;
        opened_ = true;
        log_debug(msg() << "coordinator link " << pn_link_name(link_) << " open");
        completion opening = opening_;
        opening.succeed();
        return;
      }
      case PN_LINK_REMOTE_CLOSE:
      case PN_LINK_REMOTE_DETACH:
        close(make_condition(pn_link_remote_condition(link_)));
        return;
      case PN_CONNECTION_REMOTE_CLOSE:
        close(make_condition(pn_connection_remote_condition(pn_event_connection(e))));
        return;
      case PN_TRANSPORT_CLOSED:
        close(make_condition(pn_transport_condition(pn_event_transport(e))));
        return;
      case PN_DELIVERY: {
        pn_delivery_t* d = pn_event_delivery(e);
        if (d && pn_delivery_updated(d)) {
            pn_delivery_clear(d);
            outcome(d);
        }
        return;
      }
      default:
        return;
    }
}

void amqp_coordinator::outcome(pn_delivery_t* d) {
    std::map<pn_delivery_t*, operation>::iterator i = outstanding_.find(d);
    if (i == outstanding_.end()) return;
    uint64_t type = pn_delivery_remote_state(d);
    if (!type && !pn_delivery_settled(d)) return;
    operation op = i->second;
    outstanding_.erase(i);

    pn_disposition_t* disp = pn_delivery_remote(d);
    proton::error_condition rejected;
    if (type == PN_REJECTED) rejected = make_condition(pn_rejected_disposition_condition(pn_rejected_disposition(disp)));
    proton::binary txn_id;
    if (type == PN_DECLARED) txn_id = make_binary(pn_declared_disposition_get_id(pn_declared_disposition(disp)));
    pn_delivery_settle(d);

    if (op.is_declare) {
        if (type == PN_DECLARED && !txn_id.empty()) {
            op.declared.succeed(txn_id);
        } else if (type == PN_REJECTED) {
            op.declared.fail(tx_error(tx_error::DECLARE_FAILED, "declare rejected", rejected));
        } else {
            op.declared.fail(tx_error(tx_error::DECLARE_FAILED,
                                      msg() << "unexpected declare outcome " << outcome_name(type)));
        }
    } else {
        const char* what = op.commit ? "commit" : "rollback";
        if (type == PN_ACCEPTED) {
            op.discharged.succeed();
        } else if (type == PN_REJECTED) {
            op.discharged.fail(tx_error(tx_error::DISCHARGE_FAILED, msg() << what << " rejected", rejected));
        } else {
            op.discharged.fail(tx_error(tx_error::DISCHARGE_FAILED,
                                        msg() << "unexpected " << what << " outcome " << outcome_name(type)));
        }
    }
}

// Fail everything still waiting on the link. Members are not touched once
// the first completion has run.
void amqp_coordinator::close(const proton::error_condition& cond) {
    if (closed_) return;
    closed_ = true;
    error_ = cond;
    if (!(pn_link_state(link_) & PN_LOCAL_CLOSED)) pn_link_close(link_);

    std::map<pn_delivery_t*, operation> ops;
    ops.swap(outstanding_);
    for (std::map<pn_delivery_t*, operation>::iterator i = ops.begin(); i != ops.end(); ++i) {
        pn_delivery_settle(i->first);
    }
    completion opening = opening_;
    bool was_opened = opened_;
    msg warning;
    warning << "coordinator link " << pn_link_name(link_) << " closed";
    if (!cond.empty()) warning << ": " << cond.what();
    log_warning(warning << ", " << ops.size() << " operations outstanding");

    if (!was_opened) {
        opening.fail(tx_error(tx_error::LINK_FAILED, "coordinator link closed before it opened", cond));
    }
    for (std::map<pn_delivery_t*, operation>::iterator i = ops.begin(); i != ops.end(); ++i) {
        if (i->second.is_declare) {
            i->second.declared.fail(tx_error(tx_error::DECLARE_FAILED, "coordinator link closed", cond));
        } else {
            i->second.discharged.fail(tx_error(tx_error::DISCHARGE_FAILED, "coordinator link closed", cond));
        }
    }
}

bool amqp_coordinator::dispatch(pn_event_t* e) {
    switch (pn_event_type(e)) {
      case PN_CONNECTION_REMOTE_CLOSE:
      case PN_TRANSPORT_CLOSED: {
        pn_connection_t* c = pn_event_connection(e);
        if (!c) return false;
        std::vector<amqp_coordinator*> found;
        for (pn_link_t* l = pn_link_head(c, 0); l; l = pn_link_next(l, 0)) {
            if (amqp_coordinator* ac = get(l)) found.push_back(ac);
        }
        for (std::vector<amqp_coordinator*>::iterator i = found.begin(); i != found.end(); ++i) {
            (*i)->handle(e);
        }
        return !found.empty();
      }
      case PN_LINK_REMOTE_OPEN:
      case PN_LINK_REMOTE_CLOSE:
      case PN_LINK_REMOTE_DETACH:
      case PN_DELIVERY: {
        pn_link_t* l = pn_event_link(e);
        amqp_coordinator* ac = l ? get(l) : 0;
        if (!ac) return false;
        ac->handle(e);
        return true;
      }
      default:
        return false;
    }
}

amqp_coordinator_builder::amqp_coordinator_builder(pn_session_t* session, std::string link_name) :
    session_(session), link_name_(std::move(link_name))
{
    if (!session_) throw proton::error("amqp_coordinator_builder: null session");
}

amqp_coordinator_builder::~amqp_coordinator_builder() = default;

void amqp_coordinator_builder::build(transaction_context& ctx, completion done) {
    if (building_) {
        done.fail(tx_error(tx_error::LINK_FAILED, "coordinator link already being opened"));
        return;
    }
    building_ = std::make_unique<amqp_coordinator>(session_, link_name_, completion(
        [this, &ctx, done]() {
            ctx.install_coordinator(std::move(building_));
            done.succeed();
        },
        [this, done](const tx_error& e) {
            std::unique_ptr<amqp_coordinator> failed(std::move(building_));
            done.fail(e);
        }));
}

} // namespace amqptx

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

#include "amqptx/transactional_state.hpp"

#include "msg.hpp"

#include <proton/error.hpp>

#include <proton/delivery.h>
#include <proton/disposition.h>
#include <proton/types.h>

#include <ostream>
#include <utility>

namespace amqptx {

transactional_state::transactional_state(proton::binary txn_id, enum outcome o) :
    txn_id_(std::move(txn_id)), outcome_(o)
{}

uint64_t transactional_state::outcome_type() const {
    return outcome_ == ACCEPTED ? PN_ACCEPTED : 0;
}

void transactional_state::apply(pn_delivery_t* d) const {
    pn_disposition_t* local = pn_delivery_local(d);
    pn_transactional_disposition_t* td = pn_transactional_disposition(local);
    if (!td) {
        throw proton::error(msg() << "delivery already has a " << pn_disposition_type_name(pn_disposition_type(local))
                            << " state");
    }
    pn_transactional_disposition_set_id(td, pn_bytes(txn_id_.size(), reinterpret_cast<const char*>(txn_id_.data())));
    if (outcome_ != NONE) {
        pn_transactional_disposition_set_outcome_type(td, outcome_type());
    }
    pn_delivery_update(d, PN_TRANSACTIONAL_STATE);
}

bool operator==(const transactional_state& x, const transactional_state& y) {
    return x.txn_id() == y.txn_id() && x.outcome() == y.outcome();
}

std::ostream& operator<<(std::ostream& o, const transactional_state& s) {
    o << "transactional_state{" << s.txn_id();
    if (s.outcome() == transactional_state::ACCEPTED) o << ", accepted";
    return o << "}";
}

} // namespace amqptx

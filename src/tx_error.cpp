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

#include "amqptx/tx_error.hpp"

#include "msg.hpp"

#include <ostream>
#include <utility>

namespace amqptx {

tx_error::tx_error(enum kind k, std::string description) :
    kind_(k), description_(std::move(description))
{}

tx_error::tx_error(enum kind k, std::string description, proton::error_condition remote) :
    kind_(k), description_(std::move(description)), remote_(std::move(remote))
{}

std::string tx_error::what() const {
    msg m;
    m << kind_name(kind_) << ": " << description_;
    if (!remote_.empty()) m << " (" << remote_.what() << ")";
    return m;
}

proton::error tx_error::to_error() const {
    return proton::error(what());
}

const char* kind_name(enum tx_error::kind k) {
    switch (k) {
      case tx_error::ILLEGAL_STATE: return "illegal-state";
      case tx_error::ROLLED_BACK: return "rolled-back";
      case tx_error::DECLARE_FAILED: return "declare-failed";
      case tx_error::DISCHARGE_FAILED: return "discharge-failed";
      case tx_error::LINK_FAILED: return "link-failed";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& o, const tx_error& e) {
    return o << e.what();
}

} // namespace amqptx

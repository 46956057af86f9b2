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

#include "amqptx/transaction_id.hpp"

#include <ostream>
#include <utility>

namespace amqptx {

transaction_id::transaction_id(std::string value) : value_(std::move(value)) {}

transaction_id transaction_id::with_hint(const proton::binary& hint) const {
    transaction_id t(*this);
    t.hint_ = hint;
    return t;
}

bool operator==(const transaction_id& x, const transaction_id& y) {
    return x.value() == y.value();
}

bool operator!=(const transaction_id& x, const transaction_id& y) {
    return !(x == y);
}

std::ostream& operator<<(std::ostream& o, const transaction_id& t) {
    if (t.empty()) return o << "<none>";
    o << t.value();
    if (!t.provider_hint().empty()) o << "[" << t.provider_hint() << "]";
    return o;
}

namespace internal {

std::ostream& print_resource_id(std::ostream& o, const char* kind, const std::string& value) {
    return o << kind << ":" << value;
}

}

} // namespace amqptx

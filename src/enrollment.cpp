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

#include "amqptx/enrollment.hpp"

namespace amqptx {

tx_consumer::~tx_consumer() = default;
tx_producer::~tx_producer() = default;

void enrollment::add(tx_consumer& c) {
    consumers_[c.id()] = &c;
}

void enrollment::add(tx_producer& p) {
    producers_[p.id()] = &p;
}

bool enrollment::contains(const consumer_id& id) const {
    return consumers_.find(id) != consumers_.end();
}

bool enrollment::contains(const producer_id& id) const {
    return producers_.find(id) != producers_.end();
}

size_t enrollment::consumer_count() const { return consumers_.size(); }
size_t enrollment::producer_count() const { return producers_.size(); }

bool enrollment::empty() const {
    return consumers_.empty() && producers_.empty();
}

void enrollment::for_each_consumer(const std::function<void(tx_consumer&)>& f) const {
    for (auto& entry : consumers_) {
        f(*entry.second);
    }
}

void enrollment::clear() {
    consumers_.clear();
    producers_.clear();
}

} // namespace amqptx

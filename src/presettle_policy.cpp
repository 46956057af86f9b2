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

#include "amqptx/presettle_policy.hpp"

#include <ostream>

namespace amqptx {

presettle_policy::presettle_policy() :
    all_(false), producers_(false), topic_producers_(false), queue_producers_(false),
    transacted_producers_(false), consumers_(false), topic_consumers_(false), queue_consumers_(false)
{}

presettle_policy& presettle_policy::presettle_all(bool b) { all_ = b; return *this; }
presettle_policy& presettle_policy::presettle_producers(bool b) { producers_ = b; return *this; }
presettle_policy& presettle_policy::presettle_topic_producers(bool b) { topic_producers_ = b; return *this; }
presettle_policy& presettle_policy::presettle_queue_producers(bool b) { queue_producers_ = b; return *this; }
presettle_policy& presettle_policy::presettle_transacted_producers(bool b) { transacted_producers_ = b; return *this; }
presettle_policy& presettle_policy::presettle_consumers(bool b) { consumers_ = b; return *this; }
presettle_policy& presettle_policy::presettle_topic_consumers(bool b) { topic_consumers_ = b; return *this; }
presettle_policy& presettle_policy::presettle_queue_consumers(bool b) { queue_consumers_ = b; return *this; }

bool presettle_policy::producer_presettled(destination_type dest, bool transacted) const {
    if (all_ || producers_) return true;
    if (transacted && transacted_producers_) return true;
    switch (dest) {
      case QUEUE: return queue_producers_;
      case TOPIC: return topic_producers_;
      default: return false;
    }
}

bool presettle_policy::consumer_presettled(destination_type dest, bool transacted) const {
    if (transacted) return false;
    if (all_ || consumers_) return true;
    switch (dest) {
      case QUEUE: return queue_consumers_;
      case TOPIC: return topic_consumers_;
      default: return false;
    }
}

bool operator==(const presettle_policy& x, const presettle_policy& y) {
    return x.presettle_all() == y.presettle_all() &&
        x.presettle_producers() == y.presettle_producers() &&
        x.presettle_topic_producers() == y.presettle_topic_producers() &&
        x.presettle_queue_producers() == y.presettle_queue_producers() &&
        x.presettle_transacted_producers() == y.presettle_transacted_producers() &&
        x.presettle_consumers() == y.presettle_consumers() &&
        x.presettle_topic_consumers() == y.presettle_topic_consumers() &&
        x.presettle_queue_consumers() == y.presettle_queue_consumers();
}

std::ostream& operator<<(std::ostream& o, const presettle_policy& p) {
    o << "presettle_policy{";
    const char* sep = "";
    if (p.presettle_all()) { o << sep << "all"; sep = ", "; }
    if (p.presettle_producers()) { o << sep << "producers"; sep = ", "; }
    if (p.presettle_topic_producers()) { o << sep << "topic_producers"; sep = ", "; }
    if (p.presettle_queue_producers()) { o << sep << "queue_producers"; sep = ", "; }
    if (p.presettle_transacted_producers()) { o << sep << "transacted_producers"; sep = ", "; }
    if (p.presettle_consumers()) { o << sep << "consumers"; sep = ", "; }
    if (p.presettle_topic_consumers()) { o << sep << "topic_consumers"; sep = ", "; }
    if (p.presettle_queue_consumers()) { o << sep << "queue_consumers"; }
    return o << "}";
}

} // namespace amqptx

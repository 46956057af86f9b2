#ifndef AMQPTX_PRESETTLE_POLICY_HPP
#define AMQPTX_PRESETTLE_POLICY_HPP

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

#include <iosfwd>
#include <string>

/// @file
/// @copybrief amqptx::presettle_policy

namespace amqptx {

/// The kind of node a producer sends to or a consumer reads from.
enum destination_type {
    /// Unknown, e.g. an anonymous producer.
    NO_DESTINATION,
    QUEUE,
    TOPIC
};

/// Decides when producers send presettled and when consumers ask for
/// presettled deliveries.
///
/// Options are set with the chained setters, e.g.
/// @code
/// presettle_policy p = presettle_policy().presettle_topic_producers(true);
/// @endcode
/// Consumers of a transacted session are never presettled: their
/// acknowledgments belong to the transaction.
class presettle_policy {
  public:
    AMQPTX_EXTERN presettle_policy();

    /// All producers and consumers are presettled.
    AMQPTX_EXTERN presettle_policy& presettle_all(bool);
    AMQPTX_EXTERN presettle_policy& presettle_producers(bool);
    AMQPTX_EXTERN presettle_policy& presettle_topic_producers(bool);
    AMQPTX_EXTERN presettle_policy& presettle_queue_producers(bool);
    /// Producers of a transacted session send presettled.
    AMQPTX_EXTERN presettle_policy& presettle_transacted_producers(bool);
    AMQPTX_EXTERN presettle_policy& presettle_consumers(bool);
    AMQPTX_EXTERN presettle_policy& presettle_topic_consumers(bool);
    AMQPTX_EXTERN presettle_policy& presettle_queue_consumers(bool);

    bool presettle_all() const { return all_; }
    bool presettle_producers() const { return producers_; }
    bool presettle_topic_producers() const { return topic_producers_; }
    bool presettle_queue_producers() const { return queue_producers_; }
    bool presettle_transacted_producers() const { return transacted_producers_; }
    bool presettle_consumers() const { return consumers_; }
    bool presettle_topic_consumers() const { return topic_consumers_; }
    bool presettle_queue_consumers() const { return queue_consumers_; }

    /// True if a producer sending to `dest` from a session that is
    /// `transacted` or not should send presettled.
    ///
    /// Anonymous producers ask on each send, with the destination of
    /// that message.
    AMQPTX_EXTERN bool producer_presettled(destination_type dest, bool transacted) const;

    /// True if a consumer of `dest` should ask for presettled deliveries.
    AMQPTX_EXTERN bool consumer_presettled(destination_type dest, bool transacted) const;

  private:
    bool all_;
    bool producers_;
    bool topic_producers_;
    bool queue_producers_;
    bool transacted_producers_;
    bool consumers_;
    bool topic_consumers_;
    bool queue_consumers_;
};

AMQPTX_EXTERN bool operator==(const presettle_policy&, const presettle_policy&);
AMQPTX_EXTERN std::ostream& operator<<(std::ostream&, const presettle_policy&);

/// Functions for reading a presettle_policy from a JSON configuration
/// file, in the same locations as the messaging connect.json file.
namespace presettle_config {

/// Parse a JSON configuration from `is`.
/// @throw proton::error if the configuration is invalid
AMQPTX_EXTERN presettle_policy parse(std::istream& is);

/// @return name of the default configuration file: the value of
/// MESSAGING_PRESETTLE_FILE, or the first of `presettle.json`,
/// `$HOME/.config/messaging/presettle.json` and
/// `/etc/messaging/presettle.json` that exists.
/// @throw proton::error if no default file is found
AMQPTX_EXTERN std::string default_file();

/// Parse default_file().
/// @throw proton::error if there is no default file or it is invalid
AMQPTX_EXTERN presettle_policy parse_default();

} // namespace presettle_config

} // namespace amqptx

#endif // AMQPTX_PRESETTLE_POLICY_HPP

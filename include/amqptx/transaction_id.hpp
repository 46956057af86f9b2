#ifndef AMQPTX_TRANSACTION_ID_HPP
#define AMQPTX_TRANSACTION_ID_HPP

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

#include <proton/binary.hpp>

#include <iosfwd>
#include <string>
#include <utility>

/// @file
/// Identities used by the transaction context.

namespace amqptx {

/// Identifies a transaction.
///
/// The client names a transaction before it is declared. Once the
/// coordinator has declared it, the identity also carries the
/// coordinator's own transaction id, the provider hint. Two identities
/// are equal when their client names are equal, whether or not either
/// has been declared.
class transaction_id {
  public:
    /// The empty identity, "no transaction".
    transaction_id() {}

    AMQPTX_EXTERN explicit transaction_id(std::string value);

    /// True for the empty identity.
    bool empty() const { return value_.empty(); }

    const std::string& value() const { return value_; }

    /// The coordinator's id for this transaction, empty until declared.
    const proton::binary& provider_hint() const { return hint_; }

    /// Return a copy bound to the coordinator's id.
    AMQPTX_EXTERN transaction_id with_hint(const proton::binary& hint) const;

  private:
    std::string value_;
    proton::binary hint_;
};

AMQPTX_EXTERN bool operator==(const transaction_id&, const transaction_id&);
AMQPTX_EXTERN bool operator!=(const transaction_id&, const transaction_id&);
AMQPTX_EXTERN std::ostream& operator<<(std::ostream&, const transaction_id&);

/// A transaction as the caller sees it when asking for commit or rollback.
struct transaction_info {
    transaction_info() : in_doubt(false) {}
    explicit transaction_info(const transaction_id& i, bool doubt = false) : id(i), in_doubt(doubt) {}

    transaction_id id;

    /// Set by a caller that already knows the coordinator link failed
    /// while this transaction was active.
    bool in_doubt;
};

/// @cond INTERNAL
namespace internal {

/// A string identity that only compares with identities of the same Tag.
template <class Tag>
class resource_id {
  public:
    resource_id() {}
    explicit resource_id(std::string v) : value_(std::move(v)) {}

    const std::string& value() const { return value_; }
    bool empty() const { return value_.empty(); }

    friend bool operator==(const resource_id& x, const resource_id& y) { return x.value_ == y.value_; }
    friend bool operator!=(const resource_id& x, const resource_id& y) { return x.value_ != y.value_; }
    friend bool operator<(const resource_id& x, const resource_id& y) { return x.value_ < y.value_; }

  private:
    std::string value_;
};

struct consumer_tag {};
struct producer_tag {};

AMQPTX_EXTERN std::ostream& print_resource_id(std::ostream&, const char* kind, const std::string&);

inline std::ostream& operator<<(std::ostream& o, const resource_id<consumer_tag>& id) {
    return print_resource_id(o, "consumer", id.value());
}

inline std::ostream& operator<<(std::ostream& o, const resource_id<producer_tag>& id) {
    return print_resource_id(o, "producer", id.value());
}

} // namespace internal
/// @endcond

/// Identity of a message consumer in a session.
typedef internal::resource_id<internal::consumer_tag> consumer_id;

/// Identity of a message producer in a session.
typedef internal::resource_id<internal::producer_tag> producer_id;

} // namespace amqptx

#endif // AMQPTX_TRANSACTION_ID_HPP

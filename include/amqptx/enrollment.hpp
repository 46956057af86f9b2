#ifndef AMQPTX_ENROLLMENT_HPP
#define AMQPTX_ENROLLMENT_HPP

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
#include "./transaction_id.hpp"

#include <cstddef>
#include <functional>
#include <map>

/// @file
/// Consumers and producers taking part in a transaction.

namespace amqptx {

/// A message consumer that can take part in a transaction.
///
/// The hooks let the consumer flush or release the delivery state it
/// holds for the transaction around the discharge exchange.
class
AMQPTX_CLASS_EXTERN tx_consumer {
  public:
    AMQPTX_EXTERN virtual ~tx_consumer();

    virtual consumer_id id() const = 0;

    /// Called before the commit discharge is sent.
    virtual void pre_commit() = 0;

    /// Called once the commit discharge has completed, successfully or not.
    virtual void post_commit() = 0;

    /// Called before the rollback discharge is sent.
    virtual void pre_rollback() = 0;

    /// Called once the rollback discharge has completed, successfully or not.
    virtual void post_rollback() = 0;
};

/// A message producer that can take part in a transaction.
///
/// Producers have no hooks, the outcome of their sends is collected by a
/// @ref send_completion.
class
AMQPTX_CLASS_EXTERN tx_producer {
  public:
    AMQPTX_EXTERN virtual ~tx_producer();

    virtual producer_id id() const = 0;
};

/// The consumers and producers enrolled in the current transaction.
///
/// Entries are references, not ownership: a consumer or producer must
/// outlive its enrollment, which ends when the transaction is discharged.
class enrollment {
  public:
    /// Enroll a consumer, replacing any enrolled under the same id.
    AMQPTX_EXTERN void add(tx_consumer& c);

    /// Enroll a producer, replacing any enrolled under the same id.
    AMQPTX_EXTERN void add(tx_producer& p);

    AMQPTX_EXTERN bool contains(const consumer_id& id) const;
    AMQPTX_EXTERN bool contains(const producer_id& id) const;

    AMQPTX_EXTERN size_t consumer_count() const;
    AMQPTX_EXTERN size_t producer_count() const;

    /// True if nothing is enrolled.
    AMQPTX_EXTERN bool empty() const;

    /// Call `f` for each enrolled consumer.
    AMQPTX_EXTERN void for_each_consumer(const std::function<void(tx_consumer&)>& f) const;

    /// Forget every consumer and producer.
    AMQPTX_EXTERN void clear();

  private:
    std::map<consumer_id, tx_consumer*> consumers_;
    std::map<producer_id, tx_producer*> producers_;
};

} // namespace amqptx

#endif // AMQPTX_ENROLLMENT_HPP

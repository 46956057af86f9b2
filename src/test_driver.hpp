#ifndef AMQPTX_TEST_DRIVER_HPP
#define AMQPTX_TEST_DRIVER_HPP

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

/// @file
///
/// In-memory connections for testing coordinator links against a
/// scripted transaction coordinator.

#include <proton/symbol.hpp>
#include <proton/value.hpp>

#include <proton/connection_driver.h>
#include <proton/event.h>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

std::ostream &operator<<(std::ostream &, pn_event_type_t);

namespace amqptx_test {

// Log of event types
typedef std::vector<pn_event_type_t> etypes;

// A test handler that logs the type of each event handled, and has
// slots to store proton objects for use in tests. Subclass and override
// the handle() method.
struct handler {
    etypes log;

    pn_connection_t *connection;
    pn_session_t *session;
    pn_link_t *link;
    pn_delivery_t *delivery;

    handler();
    virtual ~handler() {}

    // Log the event type then call handle(). Returns the value of handle().
    bool dispatch(pn_event_t *e);

    // Return the current log contents, clear the log.
    etypes log_clear();

  protected:
    // Return true to stop dispatching and return control to the test.
    virtual bool handle(pn_event_t *) { return false; }
};

// A pn_connection_driver_t that dispatches to a handler.
struct driver : public ::pn_connection_driver_t {
    struct handler &handler;

    driver(struct handler &h);
    ~driver();

    // Dispatch events till a handler returns true or there are no more.
    // Returns the last event handled or PN_EVENT_NONE if none were.
    pn_event_type_t run();

    // Transfer available data from src write buffer to this read buffer.
    // Return size of data transferred.
    size_t read(pn_connection_driver_t &src);
};

// A client/server pair of drivers. run() simulates a connection in memory.
struct driver_pair {
    driver client, server;

    // Sets server.transport to server mode
    driver_pair(handler &ch, handler &sh);

    // Run the drivers until a handler returns true or there is nothing
    // left to do. Opens the client connection if not already open.
    pn_event_type_t run();
};

// Client side: passes events to amqp_coordinator::dispatch(), keeps the
// last link opened and delivery received on other links.
struct client_handler : public handler {
  protected:
    bool handle(pn_event_t *e) override;
};

// A control message received by the coordinator.
struct control {
    proton::symbol descriptor;
    std::vector<proton::value> fields;
};

// Server side: opens whatever the client opens and acts as the
// transaction coordinator on links with a coordinator target.
struct coordinator_handler : public handler {
    coordinator_handler();

    // Controls received, in order
    std::vector<control> controls;
    // Capabilities of the last coordinator target attached
    std::vector<std::string> capabilities;
    // Server end of the coordinator link
    pn_link_t *coordinator;
    // Last control left unanswered
    pn_delivery_t *held;

    // Close coordinator links as soon as they attach
    bool refuse;
    // Reject declares instead of declaring
    bool reject_declare;
    // Leave discharges unanswered in `held`
    bool hold_discharge;
    // Outcome of discharges, PN_ACCEPTED or PN_REJECTED
    uint64_t discharge_outcome;
    // Transactions declared so far, ids are "txn-<n>"
    int declared;

  protected:
    bool handle(pn_event_t *e) override;

  private:
    void receive(pn_delivery_t *d);
};

// Settle `d` with a rejected outcome.
void reject(pn_delivery_t *d, const std::string &name, const std::string &description);

// Symbols of a capabilities field, single or array.
std::vector<std::string> symbols(pn_data_t *data);

} // namespace amqptx_test

#endif // AMQPTX_TEST_DRIVER_HPP

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

#include "./test_coordinator.hpp"
#include "./test_driver.hpp"

#include <catch2/catch.hpp>

#include <proton/binary.hpp>
#include <proton/value.hpp>

#include <proton/condition.h>
#include <proton/connection.h>
#include <proton/delivery.h>
#include <proton/disposition.h>
#include <proton/link.h>
#include <proton/session.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace amqptx;
using namespace amqptx_test;
using Catch::Matchers::Equals;

namespace {

pn_session_t *open_session(driver_pair &d) {
    pn_connection_open(d.client.connection);
    pn_session_t *ssn = pn_session(d.client.connection);
    pn_session_open(ssn);
    d.run();
    return ssn;
}

std::unique_ptr<coordinator_builder> builder(pn_session_t *ssn) {
    return std::make_unique<amqp_coordinator_builder>(ssn);
}

transaction_info tx(const std::string &id) { return transaction_info(transaction_id(id)); }

// Begin `id` and run the connection until it is declared.
void declare_tx(transaction_context &ctx, driver_pair &d, const std::string &id) {
    outcome o;
    ctx.begin(transaction_id(id), o.token());
    d.run();
    REQUIRE(o.succeeded == 1);
}

} // namespace

TEST_CASE("coordinator_declare_and_commit") {
    client_handler client;
    coordinator_handler server;
    driver_pair d(client, server);
    transaction_context ctx("s1", builder(open_session(d)));

    outcome begun;
    ctx.begin(transaction_id("tx1"), begun.token());
    d.run();
    REQUIRE(begun.succeeded == 1);
    CHECK_THAT(server.capabilities, Equals(std::vector<std::string>{"amqp:local-transactions"}));
    amqp_coordinator *link = dynamic_cast<amqp_coordinator *>(ctx.coordinator_link());
    REQUIRE(link);
    CHECK(link->opened());
    CHECK(std::string("txn-ctrl") == pn_link_name(link->pn_link()));
    CHECK(ctx.amqp_transaction_id() == proton::binary("txn-1"));
    REQUIRE(server.controls.size() == 1);
    CHECK(server.controls[0].descriptor == "amqp:declare:list");
    CHECK(server.controls[0].fields.empty());

    outcome committed;
    ctx.commit(tx("tx1"), committed.token());
    d.run();
    CHECK(committed.succeeded == 1);
    REQUIRE(server.controls.size() == 2);
    CHECK(server.controls[1].descriptor == "amqp:discharge:list");
    REQUIRE(server.controls[1].fields.size() == 2);
    CHECK(proton::get<proton::binary>(server.controls[1].fields[0]) == proton::binary("txn-1"));
    CHECK(proton::get<bool>(server.controls[1].fields[1]) == false);
    CHECK(link->outstanding() == 0);
    CHECK(ctx.state() == transaction_context::IDLE);

    // The same link carries the next transaction
    declare_tx(ctx, d, "tx2");
    CHECK(ctx.coordinator_link() == link);
    CHECK(ctx.amqp_transaction_id() == proton::binary("txn-2"));
}

TEST_CASE("coordinator_rollback") {
    client_handler client;
    coordinator_handler server;
    driver_pair d(client, server);
    transaction_context ctx("s1", builder(open_session(d)));
    declare_tx(ctx, d, "tx1");

    outcome rolled;
    ctx.rollback(tx("tx1"), rolled.token());
    d.run();
    CHECK(rolled.succeeded == 1);
    REQUIRE(server.controls.size() == 2);
    CHECK(proton::get<bool>(server.controls[1].fields[1]) == true);
}

TEST_CASE("coordinator_declare_rejected") {
    client_handler client;
    coordinator_handler server;
    server.reject_declare = true;
    driver_pair d(client, server);
    transaction_context ctx("s1", builder(open_session(d)));

    outcome begun;
    ctx.begin(transaction_id("tx1"), begun.token());
    d.run();
    REQUIRE(begun.failed());
    CHECK(begun.kind() == tx_error::DECLARE_FAILED);
    CHECK(begun.errors[0].remote_condition().name() == "amqp:internal-error");
    CHECK(ctx.state() == transaction_context::IDLE);
    CHECK(!ctx.is_transaction_failed());
}

TEST_CASE("coordinator_discharge_rejected") {
    client_handler client;
    coordinator_handler server;
    server.discharge_outcome = PN_REJECTED;
    driver_pair d(client, server);
    transaction_context ctx("s1", builder(open_session(d)));
    declare_tx(ctx, d, "tx1");

    outcome committed;
    ctx.commit(tx("tx1"), committed.token());
    d.run();
    REQUIRE(committed.failed());
    CHECK(committed.kind() == tx_error::DISCHARGE_FAILED);
    CHECK(committed.errors[0].remote_condition().name() == "amqp:transaction:rollback");
    CHECK(ctx.current_transaction().empty());
    CHECK(ctx.state() == transaction_context::IDLE);
}

TEST_CASE("coordinator_refused") {
    client_handler client;
    coordinator_handler server;
    server.refuse = true;
    driver_pair d(client, server);
    std::unique_ptr<amqp_coordinator_builder> owned = std::make_unique<amqp_coordinator_builder>(open_session(d));
    amqp_coordinator_builder *b = owned.get();
    transaction_context ctx("s1", std::move(owned));

    outcome begun;
    ctx.begin(transaction_id("tx1"), begun.token());
    REQUIRE(b->building() != 0);
    CHECK(!b->building()->opened());
    d.run();
    CHECK(b->building() == 0);
    REQUIRE(begun.failed());
    CHECK(begun.kind() == tx_error::LINK_FAILED);
    CHECK(begun.errors[0].remote_condition().name() == "amqp:not-implemented");
    CHECK(ctx.coordinator_link() == 0);
    CHECK(ctx.state() == transaction_context::IDLE);
    CHECK(server.controls.empty());
}

TEST_CASE("coordinator_detach_leaves_transaction_in_doubt") {
    client_handler client;
    coordinator_handler server;
    driver_pair d(client, server);
    transaction_context ctx("s1", builder(open_session(d)));
    declare_tx(ctx, d, "tx1");

    REQUIRE(server.coordinator);
    pn_condition_set_name(pn_link_condition(server.coordinator), "amqp:internal-error");
    pn_link_close(server.coordinator);
    d.run();
    CHECK(ctx.is_transaction_failed());
    amqp_coordinator *link = dynamic_cast<amqp_coordinator *>(ctx.coordinator_link());
    REQUIRE(link);
    CHECK(link->error().name() == "amqp:internal-error");

    outcome rolled;
    ctx.rollback(tx("tx1"), rolled.token());
    CHECK(rolled.succeeded == 1);
    CHECK(server.controls.size() == 1);

    // A new link is opened for the next transaction
    server.coordinator = 0;
    declare_tx(ctx, d, "tx2");
    CHECK(server.coordinator);
    CHECK(!ctx.is_transaction_failed());
    CHECK(ctx.amqp_transaction_id() == proton::binary("txn-2"));
}

TEST_CASE("coordinator_detach_during_discharge") {
    client_handler client;
    coordinator_handler server;
    server.hold_discharge = true;
    driver_pair d(client, server);
    transaction_context ctx("s1", builder(open_session(d)));
    declare_tx(ctx, d, "tx1");

    outcome committed;
    ctx.commit(tx("tx1"), committed.token());
    d.run();
    REQUIRE(server.held);
    CHECK(!committed.done());

    pn_link_close(server.coordinator);
    d.run();
    REQUIRE(committed.failed());
    CHECK(committed.kind() == tx_error::DISCHARGE_FAILED);
    CHECK(ctx.current_transaction().empty());
    CHECK(ctx.is_transaction_failed());
}

TEST_CASE("coordinator_connection_close") {
    client_handler client;
    coordinator_handler server;
    driver_pair d(client, server);
    transaction_context ctx("s1", builder(open_session(d)));
    declare_tx(ctx, d, "tx1");

    pn_condition_set_name(pn_connection_condition(server.connection), "amqp:connection:forced");
    pn_connection_close(server.connection);
    d.run();
    CHECK(ctx.is_transaction_failed());

    outcome committed;
    ctx.commit(transaction_info(transaction_id("tx1"), true), committed.token());
    REQUIRE(committed.failed());
    CHECK(committed.kind() == tx_error::ROLLED_BACK);
    CHECK(server.controls.size() == 1);
}

TEST_CASE("coordinator_transactional_accept") {
    client_handler client;
    coordinator_handler server;
    driver_pair d(client, server);
    pn_session_t *ssn = open_session(d);
    transaction_context ctx("s1", builder(ssn));
    declare_tx(ctx, d, "tx1");

    pn_link_t *rcv = pn_receiver(ssn, "q");
    pn_terminus_set_address(pn_link_source(rcv), "q");
    pn_link_open(rcv);
    pn_link_flow(rcv, 1);
    d.run();
    REQUIRE(server.link);

    pn_delivery(server.link, pn_dtag("m1", 2));
    pn_link_send(server.link, "x", 1);
    pn_link_advance(server.link);
    d.run();
    REQUIRE(client.delivery);

    REQUIRE(ctx.txn_accept_state());
    ctx.txn_accept_state()->apply(client.delivery);
    d.run();
    REQUIRE(server.delivery);
    CHECK(pn_delivery_remote_state(server.delivery) == PN_TRANSACTIONAL_STATE);
    pn_transactional_disposition_t *td = pn_transactional_disposition(pn_delivery_remote(server.delivery));
    REQUIRE(td);
    pn_bytes_t id = pn_transactional_disposition_get_id(td);
    CHECK(std::string(id.start, id.size) == "txn-1");
    CHECK(pn_transactional_disposition_get_outcome_type(td) == PN_ACCEPTED);
}

TEST_CASE("coordinator_transactional_send") {
    client_handler client;
    coordinator_handler server;
    driver_pair d(client, server);
    pn_session_t *ssn = open_session(d);
    transaction_context ctx("s1", builder(ssn));
    declare_tx(ctx, d, "tx1");

    pn_link_t *snd = pn_sender(ssn, "q");
    pn_terminus_set_address(pn_link_target(snd), "q");
    pn_link_open(snd);
    d.run();
    REQUIRE(server.link);
    pn_link_flow(server.link, 1);
    d.run();

    pn_delivery_t *dlv = pn_delivery(snd, pn_dtag("m1", 2));
    REQUIRE(ctx.txn_enrolled_state());
    ctx.txn_enrolled_state()->apply(dlv);
    CHECK(pn_delivery_local_state(dlv) == PN_TRANSACTIONAL_STATE);
    pn_link_send(snd, "x", 1);
    pn_link_advance(snd);
    d.run();

    REQUIRE(server.delivery);
    pn_transactional_disposition_t *td = pn_transactional_disposition(pn_delivery_remote(server.delivery));
    REQUIRE(td);
    pn_bytes_t id = pn_transactional_disposition_get_id(td);
    CHECK(std::string(id.start, id.size) == "txn-1");
    CHECK(pn_transactional_disposition_get_outcome_type(td) == 0);
}

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

#include "amqptx/send_completion.hpp"
#include "amqptx/transaction_context.hpp"

#include "test_coordinator.hpp"

#include <catch2/catch.hpp>

#include <proton/error.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace amqptx;
using namespace amqptx_test;
using Catch::Matchers::Equals;

typedef std::vector<std::string> strings;

namespace {
transaction_info tx1() { return transaction_info(transaction_id("tx1")); }
} // namespace

TEST_CASE("send_completion_all_sends_succeed") {
    fake_context f;
    f.declared("tx1", "txn-1");
    outcome o;
    std::shared_ptr<send_completion> sends = f.ctx.commit(tx1(), o.token(), 2);
    REQUIRE(sends);
    CHECK(f.ctx.state() == transaction_context::DISCHARGING);

    completion a = sends->token(), b = sends->token();
    a.succeed();
    CHECK(f.link().discharges.empty());
    CHECK(sends->pending() == 1);
    b.succeed();
    CHECK(sends->discharged());
    REQUIRE(f.link().discharges.size() == 1);
    CHECK(f.link().discharges[0].commit);

    f.link().discharges[0].done.succeed();
    CHECK(o.succeeded == 1);
    CHECK(f.ctx.state() == transaction_context::IDLE);
}

TEST_CASE("send_completion_one_failure_rolls_back") {
    fake_context f;
    strings log;
    recording_consumer c1("c1", log);
    f.declared("tx1", "txn-1");
    f.ctx.register_tx_consumer(c1);

    outcome o;
    std::shared_ptr<send_completion> sends = f.ctx.commit(tx1(), o.token(), 2);
    REQUIRE(sends);
    completion a = sends->token(), b = sends->token();
    bool fail_first = GENERATE(true, false);
    if (fail_first) {
        a.fail(tx_error(tx_error::ROLLED_BACK, "send rejected"));
        CHECK(!sends->commit());
        b.succeed();
    } else {
        a.succeed();
        CHECK(sends->commit());
        b.fail(tx_error(tx_error::ROLLED_BACK, "send rejected"));
    }
    REQUIRE(f.link().discharges.size() == 1);
    CHECK(!f.link().discharges[0].commit);
    CHECK(f.link().discharges[0].id == transaction_id("tx1"));

    f.link().discharges[0].done.succeed();
    REQUIRE(o.failed());
    CHECK(o.kind() == tx_error::ROLLED_BACK);
    CHECK_THAT(log, Equals(strings{"c1:pre_commit", "c1:post_rollback"}));
    CHECK(f.ctx.current_transaction().empty());
    CHECK(f.ctx.enrolled().empty());
}

TEST_CASE("send_completion_no_pending_sends") {
    fake_context f;
    f.declared("tx1", "txn-1");
    outcome o;
    std::shared_ptr<send_completion> sends = f.ctx.commit(tx1(), o.token(), 0);
    REQUIRE(sends);
    CHECK(sends->discharged());
    REQUIRE(f.link().discharges.size() == 1);
    CHECK(f.link().discharges[0].commit);
    CHECK_THROWS_AS(sends->on_success(), proton::error);
    CHECK(f.link().discharges.size() == 1);
}

TEST_CASE("send_completion_over_resolution") {
    fake_context f;
    f.declared("tx1", "txn-1");
    outcome o;
    std::shared_ptr<send_completion> sends = f.ctx.commit(tx1(), o.token(), 1);
    completion t = sends->token();
    t.succeed();
    CHECK_THROWS_AS(t.succeed(), proton::error);
    CHECK_THROWS_AS(sends->on_failure(tx_error(tx_error::ROLLED_BACK, "late")), proton::error);
    CHECK(f.link().discharges.size() == 1);
    CHECK(f.link().discharges[0].commit);
}

TEST_CASE("send_completion_refused_commit") {
    fake_context f;
    outcome o;
    CHECK(!f.ctx.commit(tx1(), o.token(), 3));
    REQUIRE(o.failed());
    CHECK(o.kind() == tx_error::ILLEGAL_STATE);
}

TEST_CASE("send_completion_discharge_failure") {
    fake_context f;
    f.declared("tx1", "txn-1");
    outcome o;
    std::shared_ptr<send_completion> sends = f.ctx.commit(tx1(), o.token(), 1);
    sends->on_failure(tx_error(tx_error::ROLLED_BACK, "send rejected"));
    REQUIRE(f.link().discharges.size() == 1);
    f.link().discharges[0].done.fail(tx_error(tx_error::DISCHARGE_FAILED, "gone"));
    REQUIRE(o.failed());
    CHECK(o.kind() == tx_error::DISCHARGE_FAILED);
    CHECK(f.ctx.state() == transaction_context::IDLE);
}

TEST_CASE("send_completion_link_closed_while_sending") {
    fake_context f;
    strings log;
    recording_consumer c1("c1", log);
    f.declared("tx1", "txn-1");
    f.ctx.register_tx_consumer(c1);

    outcome o;
    std::shared_ptr<send_completion> sends = f.ctx.commit(tx1(), o.token(), 1);
    REQUIRE(sends);
    f.link().is_closed = true;
    sends->on_success();
    CHECK(sends->discharged());
    CHECK(f.link().discharges.empty());
    REQUIRE(o.failed());
    CHECK(o.kind() == tx_error::ROLLED_BACK);
    CHECK_THAT(log, Equals(strings{"c1:pre_commit", "c1:post_rollback"}));
    CHECK(f.ctx.state() == transaction_context::IDLE);
    CHECK(f.ctx.current_transaction().empty());
    CHECK(!f.ctx.is_in_transaction(consumer_id("c1")));
}

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "connection/connection.hpp"

#include "tests/mock/mock_transport.hpp"
#include "tests/mock/run_sync.hpp"

#include <catch2/catch.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace tidepool;
using namespace tidepool::test;

namespace {
    struct fixture {
        asio::io_context ctx;
        std::shared_ptr<mock_server> server = std::make_shared<mock_server>();
        connection conn{ctx, connection_config{}, mock_factory(server)};

        int count(const char* event) {
            auto counter = std::make_shared<int>(0);
            conn.on(event, [counter](const event_args&) { ++*counter; });
            counters.push_back(counter);
            return static_cast<int>(counters.size()) - 1;
        }

        std::vector<std::shared_ptr<int>> counters;
    };
} // namespace

TEST_CASE("connection: concurrent connects share one handshake") {
    fixture f;
    auto connected = f.count(connection_event::connected);
    auto connecting = f.count(connection_event::connecting);

    auto first = spawn(f.ctx, f.conn.connect());
    auto second = spawn(f.ctx, f.conn.connect());
    auto third = spawn(f.ctx, f.conn.connect());
    REQUIRE(f.conn.state() == connection_state::connecting);
    drain(f.ctx);

    REQUIRE_NOTHROW(first.get());
    REQUIRE_NOTHROW(second.get());
    REQUIRE_NOTHROW(third.get());
    REQUIRE(f.server->connects == 1);
    REQUIRE(*f.counters[connecting] == 1);
    REQUIRE(*f.counters[connected] == 3);
    REQUIRE(f.conn.state() == connection_state::idle);
    REQUIRE(f.conn.live());
}

TEST_CASE("connection: connect on a live connection resolves at once") {
    fixture f;
    run_sync(f.ctx, f.conn.connect());
    auto connected = f.count(connection_event::connected);
    run_sync(f.ctx, f.conn.connect());
    REQUIRE(f.server->connects == 1);
    REQUIRE(*f.counters[connected] == 1);
}

TEST_CASE("connection: failed handshake rejects every caller") {
    fixture f;
    f.server->config.fail_connect = true;
    auto connected = f.count(connection_event::connected);

    auto first = spawn(f.ctx, f.conn.connect());
    auto second = spawn(f.ctx, f.conn.connect());
    drain(f.ctx);

    REQUIRE_THROWS_AS(first.get(), protocol_error);
    REQUIRE_THROWS_WITH(second.get(), Catch::Contains("mock transport failure"));
    REQUIRE(f.server->connects == 1);
    REQUIRE(*f.counters[connected] == 0);
    REQUIRE(f.conn.state() == connection_state::idle);
    REQUIRE_FALSE(f.conn.live());

    f.server->config.fail_connect = false;
    run_sync(f.ctx, f.conn.connect());
    REQUIRE(f.conn.live());
}

TEST_CASE("connection: busy states refuse connect and disconnect") {
    fixture f;
    run_sync(f.ctx, f.conn.connect());
    f.conn.enter(connection_state::executing);

    REQUIRE_THROWS_AS(f.conn.connect(), state_error);
    REQUIRE_THROWS_WITH(f.conn.disconnect(), Catch::Contains("EXECUTING"));
    REQUIRE_THROWS_AS(f.conn.enter(connection_state::transacting), state_error);

    f.conn.leave();
    REQUIRE(f.conn.state() == connection_state::idle);
    f.conn.enter(connection_state::transacting);
    REQUIRE_THROWS_AS(f.conn.connect(), state_error);
    f.conn.leave();
}

TEST_CASE("connection: only working states can be entered") {
    fixture f;
    REQUIRE_THROWS_WITH(f.conn.enter(connection_state::executing), Catch::Contains("not connected"));
    run_sync(f.ctx, f.conn.connect());
    REQUIRE_THROWS_AS(f.conn.enter(connection_state::idle), state_error);
    REQUIRE_THROWS_AS(f.conn.enter(connection_state::connecting), state_error);
}

TEST_CASE("connection: state changes are announced") {
    fixture f;
    std::vector<std::string> states;
    f.conn.on(connection_event::state, [&states](const event_args& args) {
        states.push_back(std::get<std::string>(args));
    });

    run_sync(f.ctx, f.conn.connect());
    f.conn.enter(connection_state::executing);
    f.conn.leave();
    run_sync(f.ctx, f.conn.disconnect());

    REQUIRE(states ==
            std::vector<std::string>{"CONNECTING", "IDLE", "EXECUTING", "IDLE", "DISCONNECTING", "IDLE"});
}

TEST_CASE("connection: disconnect") {
    fixture f;
    auto disconnected = f.count(connection_event::disconnected);

    // nothing to close yet
    run_sync(f.ctx, f.conn.disconnect());
    REQUIRE(f.server->closes == 0);
    REQUIRE(*f.counters[disconnected] == 1);

    run_sync(f.ctx, f.conn.connect());
    auto first = spawn(f.ctx, f.conn.disconnect());
    auto second = spawn(f.ctx, f.conn.disconnect());
    drain(f.ctx);
    REQUIRE_NOTHROW(first.get());
    REQUIRE_NOTHROW(second.get());

    REQUIRE(f.server->closes == 1);
    REQUIRE(*f.counters[disconnected] == 3);
    REQUIRE_FALSE(f.conn.live());
    REQUIRE_THROWS_AS(f.conn.transport(), state_error);
}

TEST_CASE("connection: a remote drop allows reconnecting") {
    fixture f;
    run_sync(f.ctx, f.conn.connect());
    static_cast<mock_transport&>(f.conn.transport()).drop();

    REQUIRE_FALSE(f.conn.live());
    REQUIRE(f.conn.state() == connection_state::idle);
    REQUIRE_THROWS_AS(f.conn.enter(connection_state::executing), state_error);

    run_sync(f.ctx, f.conn.connect());
    REQUIRE(f.server->connects == 2);
    REQUIRE(f.conn.live());
}

TEST_CASE("connection: ids are distinct") {
    asio::io_context ctx;
    auto server = std::make_shared<mock_server>();
    connection a(ctx, connection_config{}, mock_factory(server));
    connection b(ctx, connection_config{}, mock_factory(server));
    REQUIRE(a.id().size() == 32);
    REQUIRE(a.id() != b.id());
}

TEST_CASE("connection: config masks the password") {
    connection_config config;
    config.auth.user = "sa";
    config.auth.password = "hunter2";
    std::ostringstream out;
    out << config;
    REQUIRE(out.str().find("hunter2") == std::string::npos);
    REQUIRE(out.str().find("********") != std::string::npos);
}

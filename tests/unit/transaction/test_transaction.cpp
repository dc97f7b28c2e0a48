// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "transaction/transaction.hpp"

#include "tests/mock/mock_pool.hpp"
#include "tests/mock/run_sync.hpp"

#include <catch2/catch.hpp>
#include <set>
#include <string>
#include <vector>

using namespace tidepool;
using namespace tidepool::test;

using operations = std::vector<std::string>;

TEST_CASE("transaction: savepoints must follow a query") {
    pool_fixture f;
    transaction tx(f.pool);
    REQUIRE_THROWS_WITH(tx.save_point(), "A savepoint must follow a query.");

    tx.query("INSERT INTO t VALUES (1)");
    tx.save_point("first");
    REQUIRE_THROWS_WITH(tx.save_point(), Catch::Contains("cannot follow another savepoint"));
    REQUIRE_THROWS_AS(tx.save_point(std::string{}), validation_error);
    REQUIRE(tx.entries().size() == 2);
}

TEST_CASE("transaction: generated savepoint names are distinct") {
    pool_fixture f;
    transaction tx(f.pool);
    std::set<std::string> names;
    for (int i = 0; i < 50; ++i) {
        tx.query("INSERT INTO t VALUES (1)");
        auto name = tx.save_point();
        REQUIRE(name.rfind("sp_", 0) == 0);
        REQUIRE(name.size() == 19);
        names.insert(name);
    }
    REQUIRE(names.size() == 50);
}

TEST_CASE("transaction: commit runs the queue in order") {
    pool_fixture f;
    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");
    tx.save_point("one");
    tx.query("INSERT INTO t VALUES (@v)", {{"v", int64_t{2}}});

    auto out = run_sync(f.ctx, tx.commit());
    REQUIRE(out.has_value());
    REQUIRE(std::get<std::vector<result>>(*out).size() == 2);
    REQUIRE(f.server->operations == operations{"begin:READ COMMITTED", "save:one", "commit"});
    REQUIRE(f.server->requests.size() == 2);
    REQUIRE(f.server->requests[1].second->parameters().size() == 1);

    REQUIRE_FALSE(tx.open());
    REQUIRE(tx.entries().empty());
    REQUIRE(f.pool.resources().borrowed() == 0);
    REQUIRE(f.pool.resources().idle() == 1);
}

TEST_CASE("transaction: an empty commit still opens and closes the boundary") {
    pool_fixture f;
    transaction tx(f.pool, isolation_level::serializable);
    auto out = run_sync(f.ctx, tx.commit());
    REQUIRE_FALSE(out.has_value());
    REQUIRE(f.server->operations == operations{"begin:SERIALIZABLE", "commit"});
}

TEST_CASE("transaction: failed begin returns the connection") {
    pool_fixture f;
    f.server->config.failing_operations = {"begin"};
    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");

    REQUIRE_THROWS_AS(run_sync(f.ctx, tx.commit()), protocol_error);
    REQUIRE_FALSE(tx.open());
    REQUIRE(f.server->requests.empty());
    REQUIRE(f.pool.resources().borrowed() == 0);
}

TEST_CASE("transaction: failed reconnect returns the connection") {
    pool_fixture f;
    {
        auto lease = run_sync(f.ctx, f.pool.acquire());
        static_cast<mock_transport&>(lease->transport()).drop();
    }
    REQUIRE(f.pool.resources().idle() == 1);
    f.server->config.fail_connect = true;

    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");
    REQUIRE_THROWS_AS(run_sync(f.ctx, tx.commit()), protocol_error);
    REQUIRE_FALSE(tx.open());
    REQUIRE(f.server->operations.empty());
    REQUIRE(f.pool.resources().borrowed() == 0);
}

TEST_CASE("transaction: failed commit can be rolled back") {
    pool_fixture f;
    f.server->config.failing_operations = {"commit"};
    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");

    REQUIRE_THROWS_AS(run_sync(f.ctx, tx.commit()), protocol_error);
    REQUIRE(tx.open());
    REQUIRE(f.pool.resources().borrowed() == 1);

    run_sync(f.ctx, tx.rollback());
    REQUIRE_FALSE(tx.open());
    REQUIRE(f.server->operations == operations{"begin:READ COMMITTED", "commit", "rollback"});
    REQUIRE(f.pool.resources().borrowed() == 0);
    REQUIRE(f.pool.resources().idle() == 1);
}

TEST_CASE("transaction: rollback to a savepoint keeps the boundary open") {
    pool_fixture f;
    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");
    tx.save_point("one");
    tx.query("INSERT INTO t VALUES (2)");
    tx.save_point("two");
    tx.query("FAIL");

    REQUIRE_THROWS_AS(run_sync(f.ctx, tx.commit()), protocol_error);
    REQUIRE(tx.issued_savepoints() == operations{"one", "two"});

    run_sync(f.ctx, tx.rollback(std::string("one")));
    REQUIRE(tx.open());
    REQUIRE(tx.issued_savepoints() == operations{"one"});
    REQUIRE_THROWS_AS(run_sync(f.ctx, tx.rollback(std::string("two"))), validation_error);

    tx.query("INSERT INTO t VALUES (3)");
    auto out = run_sync(f.ctx, tx.commit());
    REQUIRE(std::holds_alternative<result>(*out));
    REQUIRE(f.server->operations ==
            operations{"begin:READ COMMITTED", "save:one", "save:two", "rollback:one", "commit"});
    REQUIRE(f.pool.resources().borrowed() == 0);
}

TEST_CASE("transaction: rollback to an unknown savepoint") {
    pool_fixture f;
    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");
    tx.save_point("queued");
    // queued but never sent to the database
    REQUIRE_THROWS_WITH(run_sync(f.ctx, tx.rollback(std::string("queued"))), Catch::Contains("has not been issued"));
    REQUIRE(f.server->operations.empty());
}

TEST_CASE("transaction: rollback without a boundary only clears the queue") {
    pool_fixture f;
    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");
    run_sync(f.ctx, tx.rollback());
    REQUIRE(tx.entries().empty());
    REQUIRE(f.server->operations.empty());
    REQUIRE(f.server->connects == 0);
}

TEST_CASE("transaction: failed rollback discards the connection") {
    pool_fixture f;
    f.server->config.failing_operations = {"commit", "rollback"};
    transaction tx(f.pool);
    tx.query("INSERT INTO t VALUES (1)");
    REQUIRE_THROWS(run_sync(f.ctx, tx.commit()));

    REQUIRE_THROWS_AS(run_sync(f.ctx, tx.rollback()), protocol_error);
    REQUIRE_FALSE(tx.open());
    drain(f.ctx);
    REQUIRE(f.pool.resources().size() == 0);
    REQUIRE(f.server->closes == 1);
}

TEST_CASE("transaction: dropping an open transaction discards its connection") {
    pool_fixture f;
    f.server->config.failing_operations = {"commit"};
    {
        transaction tx(f.pool);
        tx.query("INSERT INTO t VALUES (1)");
        REQUIRE_THROWS(run_sync(f.ctx, tx.commit()));
        REQUIRE(tx.open());
    }
    drain(f.ctx);
    REQUIRE(f.pool.resources().size() == 0);
    REQUIRE(f.pool.resources().borrowed() == 0);
}

TEST_CASE("transaction: a busy connection is never reused") {
    pool_fixture f;
    transaction first(f.pool);
    transaction second(f.pool);
    first.query("INSERT INTO t VALUES (1)");
    second.query("INSERT INTO t VALUES (2)");

    auto a = spawn(f.ctx, first.commit());
    auto b = spawn(f.ctx, second.commit());
    drain(f.ctx);
    REQUIRE(a.get().has_value());
    REQUIRE(b.get().has_value());
    REQUIRE(f.server->connects == 2);
}

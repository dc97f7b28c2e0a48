// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "bulk/bulk_loader.hpp"

#include "tests/mock/mock_pool.hpp"
#include "tests/mock/run_sync.hpp"

#include <catch2/catch.hpp>

using namespace tidepool;
using namespace tidepool::test;

TEST_CASE("bulk_loader: table is required") {
    pool_fixture f;
    REQUIRE_THROWS_AS(bulk_loader(f.pool, ""), validation_error);
}

TEST_CASE("bulk_loader: columns and rows reach the transport") {
    pool_fixture f;
    bulk_options options;
    options.table_lock = true;
    bulk_loader loader(f.pool, "dbo.people", options);

    bulk_column_options name_options;
    name_options.length = 50;
    name_options.nullable = false;
    run_sync(f.ctx, loader.column("id", sql_type::Int));
    run_sync(f.ctx, loader.column("name", sql_type::NVarChar, name_options));
    run_sync(f.ctx, loader.add(value_row{int64_t{1}, std::string("Ada")}));
    run_sync(f.ctx, loader.add(record{{"id", int64_t{2}}, {"name", std::string("Grace")}}));
    run_sync(f.ctx, loader.add(std::monostate{}));
    REQUIRE(loader.column_count() == 2);
    REQUIRE(loader.row_count() == 2);
    REQUIRE(f.pool.resources().borrowed() == 1);

    auto inserted = run_sync(f.ctx, loader.execute());
    REQUIRE(inserted == 2);
    REQUIRE(loader.executed());

    REQUIRE(f.server->bulk_loads.size() == 1);
    const auto& load = *f.server->bulk_loads[0];
    REQUIRE(load.table() == "dbo.people");
    REQUIRE(load.options().table_lock);
    REQUIRE(load.columns()[1].length == std::optional<uint32_t>(50));
    REQUIRE_FALSE(load.columns()[1].nullable);
    REQUIRE(std::holds_alternative<record>(load.rows()[1]));

    REQUIRE(f.pool.resources().borrowed() == 0);
    REQUIRE(f.pool.resources().idle() == 1);
}

TEST_CASE("bulk_loader: positional rows must match the columns") {
    pool_fixture f;
    bulk_loader loader(f.pool, "dbo.people");
    run_sync(f.ctx, loader.column("id", sql_type::Int));
    REQUIRE_THROWS_AS(run_sync(f.ctx, loader.add(value_row{int64_t{1}, int64_t{2}})), validation_error);
    REQUIRE_THROWS_AS(run_sync(f.ctx, loader.column("", sql_type::Int)), validation_error);
    REQUIRE(loader.row_count() == 0);
}

TEST_CASE("bulk_loader: nothing can be added once executed") {
    pool_fixture f;
    bulk_loader loader(f.pool, "dbo.people");
    run_sync(f.ctx, loader.column("id", sql_type::Int));
    run_sync(f.ctx, loader.execute());

    REQUIRE_THROWS_AS(run_sync(f.ctx, loader.add(value_row{int64_t{1}})), state_error);
    REQUIRE_THROWS_AS(run_sync(f.ctx, loader.column("other", sql_type::Int)), state_error);
    REQUIRE_THROWS_AS(run_sync(f.ctx, loader.execute()), state_error);
}

TEST_CASE("bulk_loader: failure releases the connection") {
    pool_fixture f;
    f.server->config.failing_operations = {"bulk"};
    bulk_loader loader(f.pool, "dbo.people");
    run_sync(f.ctx, loader.column("id", sql_type::Int));
    run_sync(f.ctx, loader.add(value_row{int64_t{1}}));

    REQUIRE_THROWS_AS(run_sync(f.ctx, loader.execute()), protocol_error);
    REQUIRE(loader.executed());
    REQUIRE(f.pool.resources().borrowed() == 0);

    // the connection went back idle and is usable
    auto lease = run_sync(f.ctx, f.pool.acquire());
    REQUIRE(lease->state() == connection_state::idle);
    REQUIRE(f.server->connects == 1);
}

TEST_CASE("bulk_loader: dropping a prepared load returns the connection") {
    pool_fixture f;
    {
        bulk_loader loader(f.pool, "dbo.people");
        run_sync(f.ctx, loader.column("id", sql_type::Int));
        REQUIRE(f.pool.resources().borrowed() == 1);
    }
    REQUIRE(f.pool.resources().borrowed() == 0);
    REQUIRE(f.pool.resources().idle() == 1);
    REQUIRE(f.server->bulk_loads.empty());
}

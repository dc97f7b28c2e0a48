// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "bulk/bulk_loader.hpp"
#include "pool/connection_pool.hpp"
#include "query/query.hpp"
#include "result/result.hpp"
#include "transaction/transaction.hpp"
#include "utility/logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace tidepool {

    struct client_config {
        connection_config connection;
        pool_config pool;
        log_config log;
    };

    // Query builder bound to a pool. execute() acquires a connection, makes sure it is
    // connected, runs the query and returns the connection on every path.
    class executable_query : public query {
    public:
        explicit executable_query(connection_pool& pool)
            : pool_(&pool) {}

        template<typename... Args>
        executable_query& in(Args&&... args) {
            query::in(std::forward<Args>(args)...);
            return *this;
        }

        template<typename... Args>
        executable_query& out(Args&&... args) {
            query::out(std::forward<Args>(args)...);
            return *this;
        }

        executable_query& timeout(std::optional<std::chrono::milliseconds> value) {
            query::timeout(value);
            return *this;
        }

        executable_query& batch() {
            query::batch();
            return *this;
        }

        executable_query& exec() {
            query::exec();
            return *this;
        }

        asio::awaitable<query_result> execute() const;

    private:
        connection_pool* pool_;
    };

    class client {
    public:
        client(asio::io_context& ctx, client_config config, transport_factory factory);

        client(const client&) = delete;
        client& operator=(const client&) = delete;

        executable_query query(std::string_view statement);
        executable_query query(std::string_view statement, const tidepool::query::named_values& params);

        tidepool::transaction transaction(isolation_level level = isolation_level::read_committed);

        bulk_loader bulk(std::string table, bulk_options options = {});

        // True when a connection could be acquired; failures are logged, not thrown.
        asio::awaitable<bool> ping();

        // Closes the pool, disconnecting every idle connection.
        asio::awaitable<void> destroy();

        const client_config& config() const noexcept { return config_; }
        connection_pool& pool() noexcept { return pool_; }

    private:
        client_config config_;
        log_t log_;
        connection_pool pool_;
    };

} // namespace tidepool

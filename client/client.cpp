// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "client.hpp"

#include "executor/query_executor.hpp"

namespace tidepool {

    asio::awaitable<query_result> executable_query::execute() const {
        // copied up front: the builder may be reused while the request is in flight
        tidepool::query statement = *this;
        auto lease = co_await pool_->acquire();
        co_await lease->connect();
        query_executor executor(*lease);
        co_return co_await executor.execute(std::move(statement));
    }

    client::client(asio::io_context& ctx, client_config config, transport_factory factory)
        : config_(std::move(config))
        , log_((initialize_all_loggers(config_.log), get_logger(logger_tag::CLIENT)))
        , pool_(ctx, config_.connection, config_.pool, std::move(factory), get_logger(logger_tag::POOL)) {
        log_->debug("Client created for server \"{}\".", config_.connection.server);
    }

    executable_query client::query(std::string_view statement) {
        executable_query q(pool_);
        q.sql(statement);
        return q;
    }

    executable_query client::query(std::string_view statement, const tidepool::query::named_values& params) {
        executable_query q(pool_);
        q.sql(statement, params);
        return q;
    }

    tidepool::transaction client::transaction(isolation_level level) {
        return tidepool::transaction(pool_, level, get_logger(logger_tag::TRANSACTION));
    }

    bulk_loader client::bulk(std::string table, bulk_options options) {
        return bulk_loader(pool_, std::move(table), options, get_logger(logger_tag::BULK_LOAD));
    }

    asio::awaitable<bool> client::ping() {
        try {
            auto lease = co_await pool_.acquire();
            co_await lease->connect();
            co_return true;
        } catch (const std::exception& e) {
            log_->error("Ping failed: {}", e.what());
        }
        co_return false;
    }

    asio::awaitable<void> client::destroy() {
        log_->debug("Destroying client pool.");
        co_await pool_.close();
    }

} // namespace tidepool

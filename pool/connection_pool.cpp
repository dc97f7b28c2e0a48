// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "connection_pool.hpp"

namespace tidepool {

    connection_pool::connection_pool(asio::io_context& ctx,
                                     connection_config config,
                                     pool_config limits,
                                     transport_factory factory,
                                     log_t log,
                                     validator validate)
        : ctx_(ctx)
        , config_(std::move(config))
        , factory_(std::move(factory))
        , log_(log ? std::move(log) : get_logger(logger_tag::POOL)) {
        if (!factory_) {
            throw validation_error("The \"factory\" argument is required.");
        }
        resource_pool<connection>::factory hooks;
        hooks.create = [this]() { return create(); };
        hooks.destroy = [this](std::shared_ptr<connection> conn) { return destroy(std::move(conn)); };
        // permissive unless the application plugs in a check
        if (validate) {
            hooks.validate = std::move(validate);
        } else {
            hooks.validate = [](const connection&) { return true; };
        }
        pool_ = std::make_shared<resource_pool<connection>>(ctx_.get_executor(), limits, std::move(hooks), log_);
    }

    asio::awaitable<connection_lease> connection_pool::acquire() { return pool_->lease(); }

    asio::awaitable<void> connection_pool::close() { return pool_->close(); }

    asio::awaitable<std::shared_ptr<connection>> connection_pool::create() {
        log_->debug("Pool creating resource...");
        auto conn = std::make_shared<connection>(ctx_, config_, factory_, get_logger(logger_tag::CONNECTION));
        co_await conn->connect();
        co_return conn;
    }

    asio::awaitable<void> connection_pool::destroy(std::shared_ptr<connection> conn) {
        log_->debug("Pool destroying resource [{}]...", conn->id());
        // a connection abandoned mid-request is closed regardless
        conn->leave();
        co_await conn->disconnect();
    }

} // namespace tidepool

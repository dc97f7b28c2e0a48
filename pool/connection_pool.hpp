// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "connection/connection.hpp"
#include "resource_pool.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <functional>
#include <memory>

namespace tidepool {

    using connection_lease = pool_lease<connection>;

    // Connections handed out by the pool are created connected and disconnected
    // before they leave it.
    class connection_pool {
    public:
        using validator = std::function<bool(const connection&)>;

        connection_pool(asio::io_context& ctx,
                        connection_config config,
                        pool_config limits,
                        transport_factory factory,
                        log_t log = nullptr,
                        validator validate = nullptr);

        connection_pool(const connection_pool&) = delete;
        connection_pool& operator=(const connection_pool&) = delete;

        // The lease returns the connection on destruction.
        asio::awaitable<connection_lease> acquire();

        asio::awaitable<void> close();

        const connection_config& config() const noexcept { return config_; }
        resource_pool<connection>& resources() noexcept { return *pool_; }
        const log_t& log() const noexcept { return log_; }

    private:
        asio::awaitable<std::shared_ptr<connection>> create();
        asio::awaitable<void> destroy(std::shared_ptr<connection> conn);

        asio::io_context& ctx_;
        connection_config config_;
        transport_factory factory_;
        log_t log_;
        std::shared_ptr<resource_pool<connection>> pool_;
    };

} // namespace tidepool

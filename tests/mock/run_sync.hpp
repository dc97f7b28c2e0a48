// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <future>
#include <utility>

namespace tidepool::test {

    // Drives the context until `task` and everything it scheduled are done.
    template<typename T>
    T run_sync(boost::asio::io_context& ctx, boost::asio::awaitable<T> task) {
        auto future = boost::asio::co_spawn(ctx, std::move(task), boost::asio::use_future);
        ctx.restart();
        ctx.run();
        return future.get();
    }

    template<typename T>
    std::future<T> spawn(boost::asio::io_context& ctx, boost::asio::awaitable<T> task) {
        return boost::asio::co_spawn(ctx, std::move(task), boost::asio::use_future);
    }

    inline void drain(boost::asio::io_context& ctx) {
        ctx.restart();
        ctx.run();
    }

    // Runs only what is ready now; pending timers stay pending.
    inline void settle(boost::asio::io_context& ctx) {
        ctx.restart();
        ctx.poll();
    }

} // namespace tidepool::test

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "transport.hpp"
#include "utility/async_wrapper.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <exception>

namespace tidepool {

    // Runs a callback-style transport call, e.g.
    //   co_await await_callback([&](auto done) { transport.commit_transaction(done); });
    // and resumes once the callback fires, rethrowing its error.
    template<typename Start>
    asio::awaitable<void> await_callback(Start start) {
        auto executor = co_await asio::this_coro::executor;
        auto done = create_async_wrapper<bool>(executor);
        transport_connection::callback_t callback = [done](std::exception_ptr error) {
            if (error) {
                done->release_on_error(std::move(error));
            } else {
                done->release(true);
            }
        };
        try {
            start(callback);
        } catch (const std::exception&) {
            done->release_on_error(std::current_exception());
        }
        co_await done->async_wait(asio::use_awaitable);
    }

} // namespace tidepool

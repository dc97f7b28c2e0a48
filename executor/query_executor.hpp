// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "connection/connection.hpp"
#include "query/query.hpp"
#include "result/result.hpp"

#include <boost/asio/awaitable.hpp>

namespace tidepool {

    // Binds queries to one acquired connection.
    class query_executor {
    public:
        explicit query_executor(connection& conn)
            : conn_(conn) {}

        // Marks the connection EXECUTING for the duration of the request.
        asio::awaitable<query_result> execute(query q);

        // Runs the request without touching the connection state; used inside a
        // transaction where the connection is already TRANSACTING.
        asio::awaitable<query_result> run(query q);

    private:
        connection& conn_;
    };

} // namespace tidepool

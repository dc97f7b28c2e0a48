// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "mock_transport.hpp"
#include "pool/connection_pool.hpp"

#include <memory>

namespace tidepool::test {

    // Pool over mock transports. Statements equal to "FAIL" answer with an error.
    struct pool_fixture {
        explicit pool_fixture(pool_config limits = {})
            : pool(ctx, connection_config{}, limits, mock_factory(server)) {
            server->responder = [s = server.get()](request& req) {
                if (req.statement() == "FAIL") {
                    req.emit(transport_event::error, mock_error(*s));
                    req.complete(mock_error(*s), 0);
                    return;
                }
                req.emit(transport_event::statement_complete, done_info{1, false, std::nullopt});
                finish(req, 1);
            };
        }

        asio::io_context ctx;
        std::shared_ptr<mock_server> server = std::make_shared<mock_server>();
        connection_pool pool;
    };

} // namespace tidepool::test

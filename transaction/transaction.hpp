// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "pool/connection_pool.hpp"
#include "query/query.hpp"
#include "result/result.hpp"

#include <boost/asio/awaitable.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tidepool {

    struct savepoint_marker {
        std::string name;
    };

    using transaction_entry = std::variant<query, savepoint_marker>;

    // Queues statements and savepoints and runs them as one unit on commit(). The
    // connection is acquired on the first commit() and held until the boundary closes,
    // so a failed commit() can still be rolled back on the same connection.
    class transaction {
    public:
        explicit transaction(connection_pool& pool,
                             isolation_level level = isolation_level::read_committed,
                             log_t log = nullptr);
        ~transaction();

        transaction(transaction&&) = default;
        transaction(const transaction&) = delete;
        transaction& operator=(const transaction&) = delete;

        transaction& query(std::string_view statement, const tidepool::query::named_values& params = {});
        transaction& query(tidepool::query statement);

        // Marks a savepoint after the last queued statement and returns its name; a random
        // name unique within this transaction is used when none is given.
        std::string save_point(std::optional<std::string> name = std::nullopt);

        asio::awaitable<std::optional<query_result>> commit();

        // Without a name reverts everything and closes the boundary; with a name reverts
        // to that savepoint and keeps the boundary open.
        asio::awaitable<void> rollback(std::optional<std::string> name = std::nullopt);

        // Drops queued entries without touching the database.
        void clear() noexcept { entries_.clear(); }

        const std::vector<transaction_entry>& entries() const noexcept { return entries_; }
        bool open() const noexcept { return open_; }
        isolation_level level() const noexcept { return level_; }
        const std::vector<std::string>& issued_savepoints() const noexcept { return issued_; }

    private:
        asio::awaitable<void> begin();
        void close_boundary(bool discard);

        connection_pool* pool_;
        isolation_level level_;
        log_t log_;
        std::vector<transaction_entry> entries_;
        std::set<std::string> names_;
        // savepoints the database has received, oldest first
        std::vector<std::string> issued_;
        connection_lease lease_;
        bool open_{false};
    };

} // namespace tidepool

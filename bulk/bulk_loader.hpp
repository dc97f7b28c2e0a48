// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "pool/connection_pool.hpp"
#include "transport/transport.hpp"
#include "utility/async_wrapper.hpp"

#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <variant>

namespace tidepool {

    // std::monostate rows are skipped
    using bulk_row = std::variant<std::monostate, value_row, record>;

    // Accumulates columns and rows for one bulk insert. The connection is acquired by the
    // first column() or add() and released once execute() settles.
    class bulk_loader {
    public:
        bulk_loader(connection_pool& pool, std::string table, bulk_options options = {}, log_t log = nullptr);
        ~bulk_loader();

        bulk_loader(bulk_loader&&) = default;
        bulk_loader(const bulk_loader&) = delete;
        bulk_loader& operator=(const bulk_loader&) = delete;

        asio::awaitable<void> column(std::string name, sql_type type, bulk_column_options options = {});
        asio::awaitable<void> add(bulk_row row);

        // Resolves with the number of inserted rows.
        asio::awaitable<std::size_t> execute();

        const std::string& table() const noexcept { return table_; }
        const bulk_options& options() const noexcept { return options_; }
        std::size_t column_count() const noexcept { return load_ ? load_->columns().size() : 0; }
        std::size_t row_count() const noexcept { return load_ ? load_->rows().size() : 0; }
        bool executed() const noexcept { return executed_; }

    private:
        asio::awaitable<void> acquire();
        void ensure_pending() const;
        void finish();

        connection_pool* pool_;
        std::string table_;
        bulk_options options_;
        log_t log_;
        connection_lease lease_;
        std::shared_ptr<bulk_load> load_;
        shared_completion<std::size_t> done_;
        bool executed_{false};
    };

} // namespace tidepool

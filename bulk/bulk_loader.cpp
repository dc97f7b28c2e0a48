// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "bulk_loader.hpp"

#include "utility/errors.hpp"

#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace tidepool {

    bulk_loader::bulk_loader(connection_pool& pool, std::string table, bulk_options options, log_t log)
        : pool_(&pool)
        , table_(std::move(table))
        , options_(options)
        , log_(log ? std::move(log) : get_logger(logger_tag::BULK_LOAD)) {
        if (table_.empty()) {
            throw validation_error("The parameter \"table\" argument is required.");
        }
    }

    bulk_loader::~bulk_loader() {
        if (lease_) {
            log_->warn("[{}] Bulk load into \"{}\" dropped before it was executed.", lease_->id(), table_);
            finish();
        }
    }

    void bulk_loader::ensure_pending() const {
        if (executed_) {
            throw state_error("The bulk load into \"" + table_ + "\" has already been executed.");
        }
    }

    asio::awaitable<void> bulk_loader::acquire() {
        if (load_) {
            co_return;
        }
        auto executor = co_await asio::this_coro::executor;
        auto lease = co_await pool_->acquire();
        co_await lease->connect();
        lease->enter(connection_state::executing);
        lease_ = std::move(lease);

        done_ = create_async_wrapper<std::size_t>(executor);
        load_ = lease_->transport().new_bulk_load(
            table_,
            options_,
            [done = done_](std::exception_ptr error, std::size_t row_count) {
                if (error) {
                    done->release_on_error(std::move(error));
                } else {
                    done->release(row_count);
                }
            });
        log_->debug("[{}] Bulk load into \"{}\" prepared.", lease_->id(), table_);
    }

    asio::awaitable<void> bulk_loader::column(std::string name, sql_type type, bulk_column_options options) {
        ensure_pending();
        if (name.empty()) {
            throw validation_error("The column \"name\" argument is required.");
        }
        co_await acquire();
        load_->add_column(std::move(name), type, options);
    }

    asio::awaitable<void> bulk_loader::add(bulk_row row) {
        ensure_pending();
        if (std::holds_alternative<std::monostate>(row)) {
            co_return;
        }
        if (auto* values = std::get_if<value_row>(&row); values && values->size() != column_count()) {
            throw validation_error("The row has " + std::to_string(values->size()) + " values but " +
                                   std::to_string(column_count()) + " columns were declared.");
        }
        co_await acquire();
        if (auto* values = std::get_if<value_row>(&row)) {
            load_->add_row(std::move(*values));
        } else {
            load_->add_row(std::get<record>(std::move(row)));
        }
    }

    asio::awaitable<std::size_t> bulk_loader::execute() {
        ensure_pending();
        executed_ = true;
        std::exception_ptr failure;
        std::size_t inserted = 0;
        try {
            co_await acquire();
            try {
                lease_->transport().exec_bulk_load(load_);
            } catch (const std::exception&) {
                done_->release_on_error(std::current_exception());
            }
            inserted = co_await done_->async_wait(asio::use_awaitable);
        } catch (const std::exception& e) {
            log_->error("Bulk load into \"{}\" failed: {}", table_, e.what());
            failure = std::current_exception();
        }
        finish();
        if (failure) {
            std::rethrow_exception(failure);
        }
        log_->debug("Bulk load into \"{}\" inserted {} rows.", table_, inserted);
        co_return inserted;
    }

    void bulk_loader::finish() {
        if (!lease_) {
            return;
        }
        lease_->leave();
        lease_.release();
    }

} // namespace tidepool

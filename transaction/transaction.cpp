// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "transaction.hpp"

#include "executor/query_executor.hpp"
#include "transport/await_callback.hpp"
#include "utility/connection_uid.hpp"
#include "utility/errors.hpp"

#include <algorithm>

namespace tidepool {

    transaction::transaction(connection_pool& pool, isolation_level level, log_t log)
        : pool_(&pool)
        , level_(level)
        , log_(log ? std::move(log) : get_logger(logger_tag::TRANSACTION)) {}

    transaction::~transaction() {
        if (open_ && lease_) {
            log_->warn("[{}] Transaction dropped while still open, discarding its connection.", lease_->id());
            close_boundary(true);
        }
    }

    transaction& transaction::query(std::string_view statement, const tidepool::query::named_values& params) {
        tidepool::query q;
        q.sql(statement, params);
        entries_.emplace_back(std::move(q));
        return *this;
    }

    transaction& transaction::query(tidepool::query statement) {
        if (statement.statement().empty()) {
            throw validation_error("The parameter \"statement\" argument is required.");
        }
        entries_.emplace_back(std::move(statement));
        return *this;
    }

    std::string transaction::save_point(std::optional<std::string> name) {
        if (entries_.empty()) {
            throw validation_error("A savepoint must follow a query.");
        }
        if (std::holds_alternative<savepoint_marker>(entries_.back())) {
            throw validation_error("A savepoint cannot follow another savepoint, it must follow a query.");
        }
        if (name && name->empty()) {
            throw validation_error("The savepoint \"name\" argument must be a non-empty string.");
        }
        if (!name) {
            do {
                name = "sp_" + random_hex_id().substr(0, 16);
            } while (names_.count(*name) != 0);
        }
        names_.insert(*name);
        entries_.push_back(savepoint_marker{*name});
        return *name;
    }

    asio::awaitable<void> transaction::begin() {
        if (!lease_) {
            lease_ = co_await pool_->acquire();
        }
        auto& conn = *lease_;
        try {
            co_await conn.connect();
            conn.enter(connection_state::transacting);
        } catch (const std::exception& e) {
            log_->error("[{}] Unable to begin the transaction: {}", conn.id(), e.what());
            lease_.release();
            throw;
        }
        try {
            co_await await_callback([&conn, this](auto done) { conn.transport().begin_transaction(done, level_); });
        } catch (const std::exception& e) {
            log_->error("[{}] Unable to begin the transaction: {}", conn.id(), e.what());
            conn.leave();
            lease_.release();
            throw;
        }
        open_ = true;
        log_->debug("[{}] Transaction started ({}).", conn.id(), to_string(level_));
    }

    asio::awaitable<std::optional<query_result>> transaction::commit() {
        auto entries = std::move(entries_);
        entries_.clear();

        if (!open_) {
            co_await begin();
        }
        auto& conn = *lease_;
        query_executor executor(conn);
        std::vector<query_result> results;
        try {
            for (auto& entry : entries) {
                if (auto* marker = std::get_if<savepoint_marker>(&entry)) {
                    co_await await_callback(
                        [&conn, marker](auto done) { conn.transport().save_transaction(done, marker->name); });
                    issued_.push_back(marker->name);
                    continue;
                }
                results.push_back(co_await executor.run(std::get<tidepool::query>(std::move(entry))));
            }
            co_await await_callback([&conn](auto done) { conn.transport().commit_transaction(done); });
        } catch (const std::exception& e) {
            log_->error("[{}] Commit failed, the transaction stays open for rollback: {}", conn.id(), e.what());
            throw;
        }
        log_->debug("[{}] Transaction committed.", conn.id());
        close_boundary(false);
        co_return flatten(results);
    }

    asio::awaitable<void> transaction::rollback(std::optional<std::string> name) {
        if (name) {
            auto it = std::find(issued_.begin(), issued_.end(), *name);
            if (!open_ || it == issued_.end()) {
                throw validation_error("The savepoint \"" + *name + "\" has not been issued to the database.");
            }
            auto& conn = *lease_;
            co_await await_callback(
                [&conn, &name](auto done) { conn.transport().rollback_transaction(done, *name); });
            // later savepoints are gone once the database reverts past them
            issued_.erase(it + 1, issued_.end());
            log_->debug("[{}] Rolled back to savepoint \"{}\".", conn.id(), *name);
            co_return;
        }

        entries_.clear();
        if (!open_) {
            co_return;
        }
        auto& conn = *lease_;
        std::exception_ptr failure;
        try {
            co_await await_callback([&conn](auto done) { conn.transport().rollback_transaction(done, std::string{}); });
        } catch (const std::exception& e) {
            log_->error("[{}] Rollback failed, discarding the connection: {}", conn.id(), e.what());
            failure = std::current_exception();
        }
        close_boundary(failure != nullptr);
        if (failure) {
            std::rethrow_exception(failure);
        }
        log_->debug("Transaction rolled back.");
    }

    void transaction::close_boundary(bool discard) {
        open_ = false;
        issued_.clear();
        if (!lease_) {
            return;
        }
        lease_->leave();
        if (discard) {
            lease_.discard();
        } else {
            lease_.release();
        }
    }

} // namespace tidepool

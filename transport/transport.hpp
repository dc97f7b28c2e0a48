// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "connection/connection_config.hpp"
#include "query/parameter.hpp"
#include "types/column.hpp"
#include "utility/event_emitter.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tidepool {

    namespace asio = boost::asio;

    namespace transport_event {
        // request
        inline constexpr const char* error = "error";
        inline constexpr const char* column_metadata = "column-metadata";
        inline constexpr const char* row = "row";
        inline constexpr const char* statement_complete = "statement-complete";
        inline constexpr const char* in_procedure_complete = "in-procedure-complete";
        inline constexpr const char* procedure_complete = "procedure-complete";
        inline constexpr const char* return_value = "return-value";
        inline constexpr const char* request_completed = "request-completed";
        // connection
        inline constexpr const char* connect = "connect";
        inline constexpr const char* end = "end";
        inline constexpr const char* debug = "debug";
        inline constexpr const char* info = "info";
    } // namespace transport_event

    // statement-complete / in-procedure-complete / procedure-complete payload
    struct done_info {
        std::size_t row_count = 0;
        bool more = false;
        std::optional<int32_t> return_status;
    };

    struct return_value_info {
        std::string name;
        sql_value value;
    };

    // `connect` carries std::monostate on success, the failure otherwise.
    using event_args = std::variant<std::monostate,
                                    std::exception_ptr,
                                    std::string,
                                    column_list,
                                    row_data,
                                    done_info,
                                    return_value_info>;

    using transport_emitter = event_emitter<event_args>;
    using handler_ptr = transport_emitter::handler_ptr;

    template<typename Callable>
    handler_ptr make_event_handler(Callable&& callable) {
        return make_handler<event_args>(std::forward<Callable>(callable));
    }

    enum class isolation_level : uint8_t
    {
        read_uncommitted,
        read_committed,
        repeatable_read,
        serializable,
        snapshot
    };

    std::string_view to_string(isolation_level level) noexcept;

    // One statement handed to the transport. Transports read the bound parameters back
    // when the request is dispatched and report progress through the emitter surface.
    class request : public transport_emitter {
    public:
        using completion_t = std::function<void(std::exception_ptr, std::size_t)>;

        request(std::string statement, completion_t completion)
            : statement_(std::move(statement))
            , completion_(std::move(completion)) {}

        virtual void add_parameter(const parameter& param) { parameters_.push_back(param); }

        virtual void add_output_parameter(const parameter& param) { output_parameters_.push_back(param); }

        virtual void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

        const std::string& statement() const noexcept { return statement_; }
        const std::vector<parameter>& parameters() const noexcept { return parameters_; }
        const std::vector<parameter>& output_parameters() const noexcept { return output_parameters_; }
        std::optional<std::chrono::milliseconds> timeout() const noexcept { return timeout_; }

        // Invoked by the transport once the request is over.
        void complete(std::exception_ptr error, std::size_t row_count) {
            if (completion_) {
                auto completion = std::move(completion_);
                completion_ = nullptr;
                completion(std::move(error), row_count);
            }
        }

    private:
        std::string statement_;
        completion_t completion_;
        std::vector<parameter> parameters_;
        std::vector<parameter> output_parameters_;
        std::optional<std::chrono::milliseconds> timeout_;
    };

    struct bulk_options {
        bool check_constraints = false;
        bool fire_triggers = false;
        bool keep_nulls = false;
        bool table_lock = false;
        std::optional<std::chrono::milliseconds> timeout;
    };

    struct bulk_column_options {
        bool nullable = true;
        std::optional<uint32_t> length;
        std::optional<uint8_t> precision;
        std::optional<uint8_t> scale;
    };

    class bulk_load {
    public:
        using completion_t = std::function<void(std::exception_ptr, std::size_t)>;
        using row_t = std::variant<value_row, record>;

        bulk_load(std::string table, bulk_options options, completion_t completion)
            : table_(std::move(table))
            , options_(options)
            , completion_(std::move(completion)) {}

        virtual ~bulk_load() = default;

        virtual void add_column(std::string name, sql_type type, const bulk_column_options& options) {
            column_metadata column;
            column.name = std::move(name);
            column.type = type;
            column.length = options.length;
            column.precision = options.precision;
            column.scale = options.scale;
            column.nullable = options.nullable;
            columns_.push_back(std::move(column));
        }

        virtual void add_row(row_t row) { rows_.push_back(std::move(row)); }

        const std::string& table() const noexcept { return table_; }
        const bulk_options& options() const noexcept { return options_; }
        const column_list& columns() const noexcept { return columns_; }
        const std::vector<row_t>& rows() const noexcept { return rows_; }

        void complete(std::exception_ptr error, std::size_t row_count) {
            if (completion_) {
                auto completion = std::move(completion_);
                completion_ = nullptr;
                completion(std::move(error), row_count);
            }
        }

    private:
        std::string table_;
        bulk_options options_;
        completion_t completion_;
        column_list columns_;
        std::vector<row_t> rows_;
    };

    // The wire-level connection. Implementations own the socket and the protocol codec
    // and surface everything else through events and callbacks.
    class transport_connection : public transport_emitter {
    public:
        using callback_t = std::function<void(std::exception_ptr)>;

        virtual void connect() = 0;
        virtual void close() = 0;
        virtual bool closed() const noexcept = 0;
        virtual bool logged_in() const noexcept = 0;

        virtual std::shared_ptr<request> new_request(std::string statement, request::completion_t completion) {
            return std::make_shared<request>(std::move(statement), std::move(completion));
        }

        virtual void exec_sql(std::shared_ptr<request> req) = 0;
        virtual void exec_sql_batch(std::shared_ptr<request> req) = 0;
        virtual void call_procedure(std::shared_ptr<request> req) = 0;
        // sends an attention for an in-flight request; its completion still follows
        virtual void cancel(std::shared_ptr<request> req) = 0;

        virtual void begin_transaction(callback_t callback, isolation_level level) = 0;
        virtual void commit_transaction(callback_t callback) = 0;
        // empty name rolls back the whole transaction
        virtual void rollback_transaction(callback_t callback, const std::string& name) = 0;
        virtual void save_transaction(callback_t callback, const std::string& name) = 0;

        virtual std::shared_ptr<bulk_load>
        new_bulk_load(std::string table, bulk_options options, bulk_load::completion_t completion) {
            return std::make_shared<bulk_load>(std::move(table), options, std::move(completion));
        }

        virtual void exec_bulk_load(std::shared_ptr<bulk_load> load) = 0;
    };

    using transport_factory =
        std::function<std::unique_ptr<transport_connection>(asio::io_context&, const connection_config&)>;

} // namespace tidepool

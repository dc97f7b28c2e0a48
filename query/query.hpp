// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "parameter.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tidepool {

    enum class query_mode : uint8_t
    {
        query,
        exec,
        batch
    };

    std::string_view to_string(query_mode mode) noexcept;

    inline std::ostream& operator<<(std::ostream& os, query_mode mode) { return os << to_string(mode); }

    // True when `text` holds more than one statement: a ';' or a GO line followed by
    // more text. Quoted text, bracketed identifiers and comments are skipped.
    bool has_statement_separator(std::string_view text) noexcept;

    // Statement text plus ordered parameters. Builder calls return *this so they chain:
    //
    //   query q;
    //   q.sql("SELECT @valid = is_customer FROM contacts WHERE name LIKE @name")
    //       .in("name", "John")
    //       .out("valid", sql_type::Bit);
    class query {
    public:
        using named_values = std::vector<std::pair<std::string, sql_value>>;

        query() = default;
        explicit query(std::string_view statement) { sql(statement); }

        // Sets the statement and classifies it as QUERY, EXEC or BATCH.
        query& sql(std::string_view statement);
        query& sql(std::string_view statement, const named_values& params);

        query& in(std::string_view name, sql_value value);
        query& in(std::string_view name, sql_type type, sql_value value, parameter_options options = {});
        query& in(std::string_view name, std::string_view type, sql_value value, parameter_options options = {});

        query& out(std::string_view name, sql_type type, sql_value value = {}, parameter_options options = {});
        query& out(std::string_view name, std::string_view type, sql_value value = {}, parameter_options options = {});

        // Returns whether a parameter with that name existed.
        bool remove(std::string_view name);

        query& clear();

        // nullopt falls back to the connection's request timeout
        query& timeout(std::optional<std::chrono::milliseconds> timeout);

        query& batch();
        query& exec();

        const std::string& statement() const noexcept { return statement_; }
        query_mode mode() const noexcept { return mode_; }
        const std::vector<parameter>& parameters() const noexcept { return params_; }
        std::optional<std::chrono::milliseconds> request_timeout() const noexcept { return timeout_; }

        const parameter* find(std::string_view name) const noexcept;

    private:
        query& add(std::string_view name, parameter_direction direction, sql_type type, sql_value value, parameter_options options);

        std::string statement_;
        query_mode mode_{query_mode::query};
        std::vector<parameter> params_;
        std::optional<std::chrono::milliseconds> timeout_;
    };

} // namespace tidepool

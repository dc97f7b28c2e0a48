// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "types/column.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tidepool {

    // Outcome of one statement. Rows are either positional or keyed by column name,
    // never a mix of both.
    class result {
    public:
        using rows_t = std::variant<std::vector<value_row>, std::vector<record>>;

        explicit result(bool use_column_names = false);

        const column_list& columns() const noexcept { return columns_; }
        const rows_t& rows() const noexcept { return rows_; }
        bool keyed() const noexcept { return std::holds_alternative<std::vector<record>>(rows_); }
        std::size_t row_count() const noexcept;

        // Only valid for the matching row shape; throws std::bad_variant_access otherwise.
        const std::vector<value_row>& value_rows() const { return std::get<std::vector<value_row>>(rows_); }
        const std::vector<record>& records() const { return std::get<std::vector<record>>(rows_); }

        // procedure return status
        const std::optional<int32_t>& returned() const noexcept { return returned_; }
        void set_returned(std::optional<int32_t> value) noexcept { returned_ = value; }

        // output parameter values, keyed by parameter name
        const record& outputs() const noexcept { return outputs_; }
        void set_output(std::string name, sql_value value);

        // Record mode merges by column name, positional mode replaces the list.
        void apply_columns(const column_list& columns);
        void add_row(const row_data& row);

        // No columns and no rows.
        bool empty() const noexcept { return columns_.empty() && row_count() == 0; }
        // Has a return value, columns or rows.
        bool has_content() const noexcept { return returned_.has_value() || !empty(); }

    private:
        column_list columns_;
        rows_t rows_;
        std::optional<int32_t> returned_;
        record outputs_;
    };

    // A single statement settles with one result, batches and procedures with several.
    using query_result = std::variant<result, std::vector<result>>;

    namespace detail {

        inline void collect(std::vector<result>&, std::nullptr_t) {}
        inline void collect(std::vector<result>&, std::nullopt_t) {}
        inline void collect(std::vector<result>& out, const result& value) { out.push_back(value); }
        inline void collect(std::vector<result>& out, result&& value) { out.push_back(std::move(value)); }

        void collect(std::vector<result>& out, const query_result& value);

        template<typename T>
        void collect(std::vector<result>& out, const std::optional<T>& value);
        template<typename T>
        void collect(std::vector<result>& out, const std::vector<T>& values);

        template<typename T>
        void collect(std::vector<result>& out, const std::optional<T>& value) {
            if (value) {
                collect(out, *value);
            }
        }

        template<typename T>
        void collect(std::vector<result>& out, const std::vector<T>& values) {
            for (const auto& value : values) {
                collect(out, value);
            }
        }

    } // namespace detail

    // Gathers every result found in the arguments, however nested, in argument order.
    // None found -> nullopt; exactly one -> that result; otherwise the ordered list.
    template<typename... Args>
    std::optional<query_result> flatten(Args&&... args) {
        std::vector<result> found;
        (detail::collect(found, std::forward<Args>(args)), ...);
        if (found.empty()) {
            return std::nullopt;
        }
        if (found.size() == 1) {
            return query_result{std::move(found.front())};
        }
        return query_result{std::move(found)};
    }

} // namespace tidepool

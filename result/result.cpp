// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "result.hpp"

#include <algorithm>

namespace tidepool {

    result::result(bool use_column_names)
        : rows_(use_column_names ? rows_t{std::vector<record>{}} : rows_t{std::vector<value_row>{}}) {}

    std::size_t result::row_count() const noexcept {
        return std::visit([](const auto& rows) { return rows.size(); }, rows_);
    }

    void result::set_output(std::string name, sql_value value) { outputs_.insert_or_assign(std::move(name), std::move(value)); }

    void result::apply_columns(const column_list& columns) {
        if (!keyed()) {
            columns_ = columns;
            return;
        }
        for (const auto& column : columns) {
            auto it = std::find_if(columns_.begin(), columns_.end(), [&column](const column_metadata& known) {
                return known.name == column.name;
            });
            if (it == columns_.end()) {
                columns_.push_back(column);
            } else {
                *it = column;
            }
        }
    }

    void result::add_row(const row_data& row) {
        if (auto* records = std::get_if<std::vector<record>>(&rows_)) {
            record keyed_row;
            for (const auto& cell : row) {
                keyed_row.insert_or_assign(cell.metadata.name, cell.value);
            }
            records->push_back(std::move(keyed_row));
            return;
        }
        value_row values;
        values.reserve(row.size());
        for (const auto& cell : row) {
            values.push_back(cell.value);
        }
        std::get<std::vector<value_row>>(rows_).push_back(std::move(values));
    }

    namespace detail {

        void collect(std::vector<result>& out, const query_result& value) {
            if (auto* single = std::get_if<result>(&value)) {
                out.push_back(*single);
                return;
            }
            const auto& many = std::get<std::vector<result>>(value);
            out.insert(out.end(), many.begin(), many.end());
        }

    } // namespace detail

} // namespace tidepool

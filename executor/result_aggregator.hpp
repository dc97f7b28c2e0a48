// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "query/query.hpp"
#include "result/result.hpp"
#include "transport/transport.hpp"

#include <vector>

namespace tidepool {

    // Folds the event stream of one request into ordered results. Every event mutates the
    // last result in the list; completion tokens decide when a new one starts.
    class result_aggregator {
    public:
        result_aggregator(bool use_column_names, query_mode mode);

        void on_columns(const column_list& columns);
        void on_row(const row_data& row);
        void on_statement_complete(const done_info& done);
        void on_in_procedure_complete(const done_info& done);
        void on_procedure_complete(const done_info& done);
        void on_return_value(const return_value_info& value);

        const std::vector<result>& results() const noexcept { return results_; }

        // One result settles as itself, anything else (including none) as the ordered list.
        query_result finish();

    private:
        result& current() {
            if (results_.empty()) {
                start_next();
            }
            return results_.back();
        }
        void start_next() { results_.emplace_back(use_column_names_); }

        bool use_column_names_;
        query_mode mode_;
        std::vector<result> results_;
    };

} // namespace tidepool

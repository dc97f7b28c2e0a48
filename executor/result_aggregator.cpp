// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "result_aggregator.hpp"

namespace tidepool {

    result_aggregator::result_aggregator(bool use_column_names, query_mode mode)
        : use_column_names_(use_column_names)
        , mode_(mode) {
        start_next();
    }

    void result_aggregator::on_columns(const column_list& columns) { current().apply_columns(columns); }

    void result_aggregator::on_row(const row_data& row) { current().add_row(row); }

    void result_aggregator::on_statement_complete(const done_info& done) {
        if (done.more) {
            start_next();
        }
    }

    void result_aggregator::on_in_procedure_complete(const done_info&) {
        // an empty token inside a procedure does not open a new result
        if (current().has_content()) {
            start_next();
        }
    }

    void result_aggregator::on_procedure_complete(const done_info& done) {
        current().set_returned(done.return_status);
        if (done.more) {
            start_next();
        } else if (mode_ != query_mode::exec && results_.size() > 1 && current().empty()) {
            // a lone statement always settles with its own result
            results_.pop_back();
        }
    }

    void result_aggregator::on_return_value(const return_value_info& value) {
        current().set_output(value.name, value.value);
    }

    query_result result_aggregator::finish() {
        if (results_.size() == 1) {
            return query_result{std::move(results_.front())};
        }
        return query_result{std::move(results_)};
    }

} // namespace tidepool

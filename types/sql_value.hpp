// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "sql_type.hpp"

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tidepool {

    using binary_t = std::vector<uint8_t>;
    using date_time_t = std::chrono::system_clock::time_point;

    // A single database value as seen by the client. std::monostate is SQL NULL.
    using sql_value = std::variant<std::monostate, bool, int64_t, double, std::string, binary_t, date_time_t>;

    inline bool is_null(const sql_value& value) noexcept { return std::holds_alternative<std::monostate>(value); }

    bool is_guid(std::string_view text) noexcept;
    bool has_non_ascii(std::string_view text) noexcept;

    // Picks the TDS type for a value when the caller did not name one.
    sql_type infer_sql_type(const sql_value& value) noexcept;
    sql_type infer_integer_type(int64_t value) noexcept;

    std::string to_string(const sql_value& value);

    inline std::ostream& operator<<(std::ostream& os, const sql_value& value) { return os << to_string(value); }

} // namespace tidepool

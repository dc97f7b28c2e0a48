// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "sql_type.hpp"
#include "sql_value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tidepool {

    struct column_metadata {
        std::string name;
        sql_type type = sql_type::Null;
        std::optional<uint32_t> length;
        std::optional<uint8_t> precision;
        std::optional<uint8_t> scale;
        bool nullable = true;

        bool operator==(const column_metadata&) const = default;
    };

    using column_list = std::vector<column_metadata>;

    // One cell as delivered by the transport.
    struct column_value {
        column_metadata metadata;
        sql_value value;
    };

    using row_data = std::vector<column_value>;

    // Row shapes exposed to callers: positional or keyed by column name.
    using value_row = std::vector<sql_value>;
    using record = std::map<std::string, sql_value, std::less<>>;

} // namespace tidepool

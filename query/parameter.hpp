// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "types/sql_type.hpp"
#include "types/sql_value.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tidepool {

    enum class parameter_direction : uint8_t
    {
        in,
        out
    };

    struct parameter_options {
        std::optional<uint32_t> length;
        std::optional<uint8_t> precision;
        std::optional<uint8_t> scale;
    };

    struct parameter {
        std::string name;
        parameter_direction direction = parameter_direction::in;
        sql_type type = sql_type::VarChar;
        sql_value value;
        parameter_options options;
    };

} // namespace tidepool

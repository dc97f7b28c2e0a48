// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace tidepool {

    // TDS data types understood by the transport.
    enum class sql_type : uint8_t
    {
        Null,
        TinyInt,
        Bit,
        SmallInt,
        Int,
        SmallDateTime,
        Real,
        Money,
        DateTime,
        Float,
        Decimal,
        Numeric,
        SmallMoney,
        BigInt,
        Image,
        Text,
        UniqueIdentifier,
        NText,
        VarBinary,
        VarChar,
        Binary,
        Char,
        NVarChar,
        NChar,
        Xml,
        Time,
        Date,
        DateTime2,
        DateTimeOffset,
        UDT,
        TVP,
        Variant
    };

    inline constexpr std::array<sql_type, 32> all_sql_types = {
        sql_type::Null,      sql_type::TinyInt,        sql_type::Bit,
        sql_type::SmallInt,  sql_type::Int,            sql_type::SmallDateTime,
        sql_type::Real,      sql_type::Money,          sql_type::DateTime,
        sql_type::Float,     sql_type::Decimal,        sql_type::Numeric,
        sql_type::SmallMoney, sql_type::BigInt,        sql_type::Image,
        sql_type::Text,      sql_type::UniqueIdentifier, sql_type::NText,
        sql_type::VarBinary, sql_type::VarChar,        sql_type::Binary,
        sql_type::Char,      sql_type::NVarChar,       sql_type::NChar,
        sql_type::Xml,       sql_type::Time,           sql_type::Date,
        sql_type::DateTime2, sql_type::DateTimeOffset, sql_type::UDT,
        sql_type::TVP,       sql_type::Variant,
    };

    std::string_view to_string(sql_type type) noexcept;

    // Case-insensitive lookup by type name ("INT", "nvarchar").
    // Throws validation_error for unknown names.
    sql_type parse_sql_type(std::string_view name);

    inline std::ostream& operator<<(std::ostream& os, sql_type type) { return os << to_string(type); }

} // namespace tidepool

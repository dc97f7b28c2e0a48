// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "sql_type.hpp"

#include "utility/errors.hpp"
#include "utility/string_utils.hpp"

#include <string>

namespace tidepool {

    std::string_view to_string(sql_type type) noexcept {
        switch (type) {
            case sql_type::Null:
                return "Null";
            case sql_type::TinyInt:
                return "TinyInt";
            case sql_type::Bit:
                return "Bit";
            case sql_type::SmallInt:
                return "SmallInt";
            case sql_type::Int:
                return "Int";
            case sql_type::SmallDateTime:
                return "SmallDateTime";
            case sql_type::Real:
                return "Real";
            case sql_type::Money:
                return "Money";
            case sql_type::DateTime:
                return "DateTime";
            case sql_type::Float:
                return "Float";
            case sql_type::Decimal:
                return "Decimal";
            case sql_type::Numeric:
                return "Numeric";
            case sql_type::SmallMoney:
                return "SmallMoney";
            case sql_type::BigInt:
                return "BigInt";
            case sql_type::Image:
                return "Image";
            case sql_type::Text:
                return "Text";
            case sql_type::UniqueIdentifier:
                return "UniqueIdentifier";
            case sql_type::NText:
                return "NText";
            case sql_type::VarBinary:
                return "VarBinary";
            case sql_type::VarChar:
                return "VarChar";
            case sql_type::Binary:
                return "Binary";
            case sql_type::Char:
                return "Char";
            case sql_type::NVarChar:
                return "NVarChar";
            case sql_type::NChar:
                return "NChar";
            case sql_type::Xml:
                return "Xml";
            case sql_type::Time:
                return "Time";
            case sql_type::Date:
                return "Date";
            case sql_type::DateTime2:
                return "DateTime2";
            case sql_type::DateTimeOffset:
                return "DateTimeOffset";
            case sql_type::UDT:
                return "UDT";
            case sql_type::TVP:
                return "TVP";
            case sql_type::Variant:
                return "Variant";
        }
        return "Unknown";
    }

    sql_type parse_sql_type(std::string_view name) {
        if (name.empty()) {
            throw validation_error("The parameter \"type\" argument is required.");
        }
        for (auto type : all_sql_types) {
            if (iequals(to_string(type), name)) {
                return type;
            }
        }
        throw validation_error("The parameter \"type\" argument value \"" + std::string(name) +
                               "\" is not a valid or supported TDS type.");
    }

} // namespace tidepool

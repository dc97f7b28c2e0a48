// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "sql_value.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace {
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    bool read_hex_run(std::string_view text, size_t& pos, size_t count) {
        for (size_t i = 0; i < count; ++i, ++pos) {
            if (pos >= text.size() || !std::isxdigit(static_cast<unsigned char>(text[pos]))) {
                return false;
            }
        }
        return true;
    }

    void skip_dash(std::string_view text, size_t& pos) {
        if (pos < text.size() && text[pos] == '-') {
            ++pos;
        }
    }
} // namespace

namespace tidepool {

    // 8-4-4-4-12 hex digits, dashes optional, optionally wrapped in {} or ()
    bool is_guid(std::string_view text) noexcept {
        if (!text.empty() && (text.front() == '{' || text.front() == '(')) {
            text.remove_prefix(1);
        }
        if (!text.empty() && (text.back() == '}' || text.back() == ')')) {
            text.remove_suffix(1);
        }
        size_t pos = 0;
        if (!read_hex_run(text, pos, 8)) {
            return false;
        }
        skip_dash(text, pos);
        for (int group = 0; group < 3; ++group) {
            if (!read_hex_run(text, pos, 4)) {
                return false;
            }
            skip_dash(text, pos);
        }
        return read_hex_run(text, pos, 12) && pos == text.size();
    }

    bool has_non_ascii(std::string_view text) noexcept {
        for (char c : text) {
            if (static_cast<unsigned char>(c) > 0x7F) {
                return true;
            }
        }
        return false;
    }

    sql_type infer_integer_type(int64_t value) noexcept {
        if (value >= 0 && value <= 255) {
            return sql_type::TinyInt;
        }
        if (value >= -32767 && value <= 32767) {
            return sql_type::SmallInt;
        }
        if (value >= -2147483647 && value <= 2147483647) {
            return sql_type::Int;
        }
        return sql_type::BigInt;
    }

    sql_type infer_sql_type(const sql_value& value) noexcept {
        return std::visit(overloaded{
                              [](std::monostate) { return sql_type::VarChar; },
                              [](const std::string& v) {
                                  if (has_non_ascii(v)) {
                                      return sql_type::NVarChar;
                                  }
                                  if (is_guid(v)) {
                                      return sql_type::UniqueIdentifier;
                                  }
                                  return sql_type::VarChar;
                              },
                              [](bool) { return sql_type::Bit; },
                              [](double v) {
                                  if (!std::isfinite(v) || std::fmod(v, 1.0) != 0.0) {
                                      return sql_type::Float;
                                  }
                                  // integral doubles follow the integer table
                                  if (v < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
                                      v >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
                                      return sql_type::BigInt;
                                  }
                                  return infer_integer_type(static_cast<int64_t>(v));
                              },
                              [](int64_t v) { return infer_integer_type(v); },
                              [](const binary_t&) { return sql_type::VarBinary; },
                              [](const date_time_t&) { return sql_type::DateTimeOffset; },
                          },
                          value);
    }

    std::string to_string(const sql_value& value) {
        return std::visit(overloaded{
                              [](std::monostate) -> std::string { return "NULL"; },
                              [](bool v) -> std::string { return v ? "true" : "false"; },
                              [](int64_t v) { return std::to_string(v); },
                              [](double v) {
                                  std::ostringstream os;
                                  os << v;
                                  return os.str();
                              },
                              [](const std::string& v) { return v; },
                              [](const binary_t& v) {
                                  std::ostringstream os;
                                  os << "0x" << std::hex << std::uppercase << std::setfill('0');
                                  for (auto byte : v) {
                                      os << std::setw(2) << static_cast<int>(byte);
                                  }
                                  return os.str();
                              },
                              [](const date_time_t& v) {
                                  auto time = std::chrono::system_clock::to_time_t(v);
                                  std::tm tm{};
                                  gmtime_r(&time, &tm);
                                  std::ostringstream os;
                                  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
                                  return os.str();
                              },
                          },
                          value);
    }

} // namespace tidepool

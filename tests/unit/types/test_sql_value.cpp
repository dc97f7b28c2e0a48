// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "types/sql_value.hpp"
#include "utility/errors.hpp"

#include <catch2/catch.hpp>

using namespace tidepool;

TEST_CASE("sql_value: integer inference boundaries") {
    REQUIRE(infer_sql_type(int64_t{0}) == sql_type::TinyInt);
    REQUIRE(infer_sql_type(int64_t{1}) == sql_type::TinyInt);
    REQUIRE(infer_sql_type(int64_t{255}) == sql_type::TinyInt);
    REQUIRE(infer_sql_type(int64_t{256}) == sql_type::SmallInt);
    REQUIRE(infer_sql_type(int64_t{3223}) == sql_type::SmallInt);
    REQUIRE(infer_sql_type(int64_t{-1}) == sql_type::SmallInt);
    REQUIRE(infer_sql_type(int64_t{32767}) == sql_type::SmallInt);
    REQUIRE(infer_sql_type(int64_t{-32767}) == sql_type::SmallInt);
    REQUIRE(infer_sql_type(int64_t{32768}) == sql_type::Int);
    REQUIRE(infer_sql_type(int64_t{-32768}) == sql_type::Int);
    REQUIRE(infer_sql_type(int64_t{2147483647}) == sql_type::Int);
    REQUIRE(infer_sql_type(int64_t{-2147483647}) == sql_type::Int);
    REQUIRE(infer_sql_type(int64_t{2147483648}) == sql_type::BigInt);
    REQUIRE(infer_sql_type(int64_t{-2147483648}) == sql_type::BigInt);
}

TEST_CASE("sql_value: doubles") {
    REQUIRE(infer_sql_type(1.5) == sql_type::Float);
    REQUIRE(infer_sql_type(-0.25) == sql_type::Float);
    // integral doubles go through the integer table
    REQUIRE(infer_sql_type(2.0) == sql_type::TinyInt);
    REQUIRE(infer_sql_type(40000.0) == sql_type::Int);
    REQUIRE(infer_sql_type(1e12) == sql_type::BigInt);
    REQUIRE(infer_sql_type(1e30) == sql_type::BigInt);
}

TEST_CASE("sql_value: strings") {
    REQUIRE(infer_sql_type(std::string("hello")) == sql_type::VarChar);
    REQUIRE(infer_sql_type(std::string("h\xC3\xA9llo")) == sql_type::NVarChar);
    REQUIRE(infer_sql_type(std::string("6F9619FF-8B86-D011-B42D-00C04FC964FF")) == sql_type::UniqueIdentifier);
    REQUIRE(infer_sql_type(std::string("{6f9619ff-8b86-d011-b42d-00c04fc964ff}")) == sql_type::UniqueIdentifier);
    REQUIRE(infer_sql_type(std::string("6F9619FF8B86D011B42D00C04FC964FF")) == sql_type::UniqueIdentifier);
    REQUIRE(infer_sql_type(std::string("6F9619FF-8B86-D011-B42D-00C04FC964F")) == sql_type::VarChar);
    REQUIRE(infer_sql_type(std::string("6F9619FF-8B86-D011-B42D-00C04FC964FZ")) == sql_type::VarChar);
}

TEST_CASE("sql_value: other shapes") {
    REQUIRE(infer_sql_type(sql_value{}) == sql_type::VarChar);
    REQUIRE(infer_sql_type(true) == sql_type::Bit);
    REQUIRE(infer_sql_type(binary_t{0x01, 0x02}) == sql_type::VarBinary);
    REQUIRE(infer_sql_type(std::chrono::system_clock::now()) == sql_type::DateTimeOffset);
}

TEST_CASE("sql_value: guid shapes") {
    REQUIRE(is_guid("(6F9619FF-8B86-D011-B42D-00C04FC964FF)"));
    REQUIRE_FALSE(is_guid(""));
    REQUIRE_FALSE(is_guid("not a guid"));
    REQUIRE_FALSE(is_guid("6F9619FF-8B86-D011-B42D-00C04FC964FF0"));
}

TEST_CASE("sql_type: parse by name") {
    REQUIRE(parse_sql_type("INT") == sql_type::Int);
    REQUIRE(parse_sql_type("nvarchar") == sql_type::NVarChar);
    REQUIRE(parse_sql_type("DateTimeOffset") == sql_type::DateTimeOffset);
    REQUIRE_THROWS_AS(parse_sql_type("integer"), validation_error);
    REQUIRE_THROWS_WITH(parse_sql_type(""), Catch::Contains("type"));
    REQUIRE(to_string(sql_type::UniqueIdentifier) == "UniqueIdentifier");
}

TEST_CASE("sql_value: text rendering") {
    REQUIRE(to_string(sql_value{}) == "NULL");
    REQUIRE(to_string(sql_value{int64_t{42}}) == "42");
    REQUIRE(to_string(sql_value{binary_t{0xAB, 0x01}}) == "0xAB01");
    REQUIRE(to_string(sql_value{std::chrono::system_clock::time_point{}}) == "1970-01-01T00:00:00Z");
}

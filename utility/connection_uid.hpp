// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <string>

// 128 random bits rendered as 32 lowercase hex digits
inline std::string random_hex_id() {
    static constexpr char digits[] = "0123456789abcdef";
    thread_local boost::uuids::random_generator generator;
    boost::uuids::uuid id = generator();
    std::string out;
    out.reserve(id.size() * 2);
    for (auto byte : id) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

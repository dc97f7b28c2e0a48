// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <algorithm>
#include <cctype>
#include <string_view>

namespace tidepool {

    inline char ascii_lower(char c) noexcept { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

    inline bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                   return ascii_lower(a) == ascii_lower(b);
               });
    }

    inline bool istarts_with(std::string_view text, std::string_view prefix) noexcept {
        return text.size() >= prefix.size() && iequals(text.substr(0, prefix.size()), prefix);
    }

    inline bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

    // trims whitespace and any extra characters given in `also`
    inline std::string_view trim(std::string_view text, std::string_view also = {}) noexcept {
        auto skip = [also](char c) { return is_space(c) || also.find(c) != std::string_view::npos; };
        while (!text.empty() && skip(text.front())) {
            text.remove_prefix(1);
        }
        while (!text.empty() && skip(text.back())) {
            text.remove_suffix(1);
        }
        return text;
    }

} // namespace tidepool

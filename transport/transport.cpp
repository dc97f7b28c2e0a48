// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "transport.hpp"

namespace tidepool {

    std::string_view to_string(isolation_level level) noexcept {
        switch (level) {
            case isolation_level::read_uncommitted:
                return "READ UNCOMMITTED";
            case isolation_level::read_committed:
                return "READ COMMITTED";
            case isolation_level::repeatable_read:
                return "REPEATABLE READ";
            case isolation_level::serializable:
                return "SERIALIZABLE";
            case isolation_level::snapshot:
                return "SNAPSHOT";
        }
        return "UNKNOWN";
    }

} // namespace tidepool

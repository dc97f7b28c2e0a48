// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace tidepool {

    enum class auth_type : uint8_t
    {
        sql_server,
        ntlm
    };

    struct authentication {
        auth_type type = auth_type::sql_server;
        std::string user;
        std::string password;
        // ntlm only
        std::string domain;
    };

    struct connection_config {
        std::string server = "localhost";
        uint16_t port = 1433;
        // when set, the port is resolved through the browser service instead
        std::string instance_name;
        std::string database;
        std::string app_name = "tidepool";
        bool encrypt = false;
        authentication auth;
        std::chrono::milliseconds connect_timeout{15000};
        std::chrono::milliseconds request_timeout{15000};
        // rows as name-keyed records instead of positional arrays
        bool use_column_names = false;
        // relay transport debug packets to the connection logger
        bool debug = false;
    };

    inline std::ostream& operator<<(std::ostream& os, const connection_config& config) {
        os << "Server: " << config.server << std::endl;
        os << "Port: " << config.port << std::endl;
        if (!config.instance_name.empty()) {
            os << "Instance: " << config.instance_name << std::endl;
        }
        os << "Database: " << config.database << std::endl;
        os << "Application: " << config.app_name << std::endl;
        os << "Encrypt: " << std::boolalpha << config.encrypt << std::endl;
        os << "User: " << config.auth.user << std::endl;
        os << "Password: " << (config.auth.password.empty() ? "" : "********") << std::endl;
        if (config.auth.type == auth_type::ntlm) {
            os << "Domain: " << config.auth.domain << std::endl;
        }
        os << "Connect timeout: " << config.connect_timeout.count() << "ms" << std::endl;
        os << "Request timeout: " << config.request_timeout.count() << "ms" << std::endl;
        os << "Use column names: " << std::boolalpha << config.use_column_names << std::endl;
        return os;
    }

    struct pool_config {
        std::size_t max = 10;
        std::chrono::milliseconds acquire_timeout{30000};
    };

} // namespace tidepool

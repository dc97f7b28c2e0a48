// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tidepool {

    class error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Bad call-site argument, raised before anything reaches the transport.
    class validation_error : public error {
    public:
        using error::error;
    };

    // Illegal connection state transition attempt.
    class state_error : public error {
    public:
        using error::error;
    };

    // Failure reported by the transport while a request or handshake was in flight.
    class protocol_error : public error {
    public:
        explicit protocol_error(const std::string& message,
                                std::optional<int32_t> number = std::nullopt,
                                std::optional<uint8_t> state = std::nullopt,
                                std::optional<uint8_t> severity = std::nullopt)
            : error(message)
            , number_(number)
            , state_(state)
            , severity_(severity) {}

        std::optional<int32_t> number() const noexcept { return number_; }
        std::optional<uint8_t> state() const noexcept { return state_; }
        std::optional<uint8_t> severity() const noexcept { return severity_; }

    private:
        std::optional<int32_t> number_;
        std::optional<uint8_t> state_;
        std::optional<uint8_t> severity_;
    };

    class timeout_error : public protocol_error {
    public:
        explicit timeout_error(const std::string& message)
            : protocol_error(message) {}
    };

    class pool_error : public error {
    public:
        using error::error;
    };

} // namespace tidepool

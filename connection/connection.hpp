// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "connection_config.hpp"
#include "transport/transport.hpp"
#include "utility/async_wrapper.hpp"
#include "utility/event_tracker.hpp"
#include "utility/logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>

namespace tidepool {

    enum class connection_state : uint8_t
    {
        idle,
        connecting,
        disconnecting,
        transacting,
        executing
    };

    std::string_view to_string(connection_state state) noexcept;

    namespace connection_event {
        inline constexpr const char* connecting = "connecting";
        inline constexpr const char* connected = "connected";
        inline constexpr const char* disconnecting = "disconnecting";
        inline constexpr const char* disconnected = "disconnected";
        // payload: new state name
        inline constexpr const char* state = "state";
    } // namespace connection_event

    // One physical connection and its lifecycle. connect() and disconnect() coalesce:
    // callers arriving while a handshake is in flight share its outcome.
    //
    // Both validate the current state and start the handshake before returning, so a
    // state_error surfaces at the call site rather than at co_await.
    class connection : public event_emitter<event_args> {
    public:
        connection(asio::io_context& ctx, connection_config config, transport_factory factory, log_t log = nullptr);
        ~connection() override;

        const std::string& id() const noexcept { return id_; }
        connection_state state() const noexcept { return state_; }
        const connection_config& config() const noexcept { return config_; }
        const log_t& log() const noexcept { return log_; }

        // Logged in and not closed.
        bool live() const noexcept;

        // Throws state_error when there is no live transport.
        transport_connection& transport();

        asio::awaitable<void> connect();
        asio::awaitable<void> disconnect();

        // Settles on the next state change; fails if that change carried an error.
        asio::awaitable<void> next_transition();

        void enter(connection_state state);
        void leave();

    private:
        void transition(connection_state next, std::exception_ptr error = nullptr);

        void start_connect();
        void start_disconnect();
        void attach_relays();
        void end_handshake();
        void detach_transport();

        asio::awaitable<void> follow(shared_completion<connection_state> waiter, const char* event);
        asio::awaitable<void> announce(const char* event);

        asio::io_context& ctx_;
        connection_config config_;
        transport_factory factory_;
        log_t log_;
        std::string id_;
        connection_state state_{connection_state::idle};
        bool live_{false};
        std::unique_ptr<transport_connection> transport_;
        shared_completion<connection_state> transition_;
        // relays that live as long as the transport
        event_tracker<event_args> tracker_;
        // listeners of the handshake in flight
        event_tracker<event_args> handshake_;
    };

    // Pulls the failure out of an error-carrying event payload.
    std::exception_ptr to_exception(const event_args& args);

} // namespace tidepool

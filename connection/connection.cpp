// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "connection.hpp"

#include "utility/connection_uid.hpp"
#include "utility/errors.hpp"

#include <boost/asio/use_awaitable.hpp>

#include <utility>

namespace tidepool {

    std::string_view to_string(connection_state state) noexcept {
        switch (state) {
            case connection_state::idle:
                return "IDLE";
            case connection_state::connecting:
                return "CONNECTING";
            case connection_state::disconnecting:
                return "DISCONNECTING";
            case connection_state::transacting:
                return "TRANSACTING";
            case connection_state::executing:
                return "EXECUTING";
        }
        return "UNKNOWN";
    }

    std::exception_ptr to_exception(const event_args& args) {
        if (auto* error = std::get_if<std::exception_ptr>(&args); error && *error) {
            return *error;
        }
        if (auto* message = std::get_if<std::string>(&args)) {
            return std::make_exception_ptr(protocol_error(*message));
        }
        return std::make_exception_ptr(protocol_error("Unknown transport error."));
    }

    connection::connection(asio::io_context& ctx, connection_config config, transport_factory factory, log_t log)
        : ctx_(ctx)
        , config_(std::move(config))
        , factory_(std::move(factory))
        , log_(log ? std::move(log) : get_logger(logger_tag::CONNECTION))
        , id_(random_hex_id())
        , transition_(create_async_wrapper<connection_state>(ctx.get_executor())) {}

    connection::~connection() {
        if (transport_) {
            handshake_.remove_from(*transport_);
            tracker_.remove_from(*transport_);
            if (!transport_->closed()) {
                transport_->close();
            }
        }
    }

    bool connection::live() const noexcept {
        return transport_ && live_ && !transport_->closed() && transport_->logged_in();
    }

    transport_connection& connection::transport() {
        if (!live()) {
            throw state_error("[" + id_ + "] The connection is not connected.");
        }
        return *transport_;
    }

    asio::awaitable<void> connection::next_transition() {
        auto waiter = transition_;
        co_await waiter->async_wait(asio::use_awaitable);
    }

    asio::awaitable<void> connection::connect() {
        switch (state_) {
            case connection_state::idle:
                if (live()) {
                    return announce(connection_event::connected);
                }
                break;
            case connection_state::connecting:
                return follow(transition_, connection_event::connected);
            default:
                throw state_error(fmt::format("[{}] Unable to connect while the connection is in the {} state.",
                                              id_,
                                              to_string(state_)));
        }

        transition(connection_state::connecting);
        emit(connection_event::connecting);
        auto waiter = transition_;
        start_connect();
        return follow(std::move(waiter), connection_event::connected);
    }

    asio::awaitable<void> connection::disconnect() {
        switch (state_) {
            case connection_state::idle:
                if (!live()) {
                    return announce(connection_event::disconnected);
                }
                break;
            case connection_state::disconnecting:
                return follow(transition_, connection_event::disconnected);
            default:
                throw state_error(fmt::format("[{}] Unable to disconnect while the connection is in the {} state.",
                                              id_,
                                              to_string(state_)));
        }

        transition(connection_state::disconnecting);
        emit(connection_event::disconnecting);
        auto waiter = transition_;
        start_disconnect();
        return follow(std::move(waiter), connection_event::disconnected);
    }

    void connection::enter(connection_state state) {
        if (state != connection_state::executing && state != connection_state::transacting) {
            throw state_error(fmt::format("[{}] The {} state can not be entered directly.", id_, to_string(state)));
        }
        if (state_ != connection_state::idle || !live()) {
            throw state_error(fmt::format("[{}] Unable to enter the {} state from the {} state{}.",
                                          id_,
                                          to_string(state),
                                          to_string(state_),
                                          live() ? "" : " (not connected)"));
        }
        transition(state);
    }

    void connection::leave() {
        if (state_ == connection_state::executing || state_ == connection_state::transacting) {
            transition(connection_state::idle);
        }
    }

    void connection::transition(connection_state next, std::exception_ptr error) {
        log_->trace("[{}] {} -> {}", id_, to_string(state_), to_string(next));
        state_ = next;
        auto released = std::exchange(transition_, create_async_wrapper<connection_state>(ctx_.get_executor()));
        emit(connection_event::state, std::string(to_string(next)));
        if (error) {
            released->release_on_error(std::move(error));
        } else {
            released->release(next);
        }
    }

    void connection::start_connect() {
        try {
            detach_transport();
            transport_ = factory_(ctx_, config_);
            if (!transport_) {
                throw error("The transport factory did not produce a connection.");
            }

            auto on_connect = make_event_handler([this](const event_args& args) {
                end_handshake();
                if (auto* failure = std::get_if<std::exception_ptr>(&args); failure && *failure) {
                    log_->error("[{}] Connection to server \"{}\" failed.", id_, config_.server);
                    transition(connection_state::idle, *failure);
                    return;
                }
                live_ = true;
                attach_relays();
                log_->debug("[{}] Connected to server \"{}\".", id_, config_.server);
                transition(connection_state::idle);
            });
            auto on_error = make_event_handler([this](const event_args& args) {
                end_handshake();
                auto failure = to_exception(args);
                log_->error("[{}] Connection to server \"{}\" failed.", id_, config_.server);
                transition(connection_state::idle, failure);
            });
            handshake_.register_on(*transport_, transport_event::connect, {on_connect});
            handshake_.register_on(*transport_, transport_event::error, {on_error});
            transport_->connect();
        } catch (const std::exception& e) {
            log_->error("[{}] Connection to server \"{}\" failed: {}", id_, config_.server, e.what());
            if (transport_) {
                end_handshake();
            }
            if (state_ == connection_state::connecting) {
                transition(connection_state::idle, std::current_exception());
            }
        }
    }

    void connection::start_disconnect() {
        if (!transport_ || transport_->closed()) {
            live_ = false;
            transition(connection_state::idle);
            return;
        }
        try {
            auto on_end = make_event_handler([this](const event_args&) {
                end_handshake();
                tracker_.remove_from(*transport_);
                tracker_.unregister();
                live_ = false;
                log_->debug("[{}] Disconnected from server \"{}\".", id_, config_.server);
                transition(connection_state::idle);
            });
            auto on_error = make_event_handler([this](const event_args& args) {
                end_handshake();
                log_->error("[{}] Disconnect from server \"{}\" failed.", id_, config_.server);
                transition(connection_state::idle, to_exception(args));
            });
            handshake_.register_on(*transport_, transport_event::end, {on_end});
            handshake_.register_on(*transport_, transport_event::error, {on_error});
            transport_->close();
        } catch (const std::exception& e) {
            log_->error("[{}] Disconnect from server \"{}\" failed: {}", id_, config_.server, e.what());
            end_handshake();
            if (state_ == connection_state::disconnecting) {
                transition(connection_state::idle, std::current_exception());
            }
        }
    }

    void connection::attach_relays() {
        auto on_end = make_event_handler([this](const event_args&) {
            if (live_ && state_ != connection_state::disconnecting) {
                log_->warn("[{}] Connection to server \"{}\" was closed by the remote side.", id_, config_.server);
            }
            live_ = false;
        });
        auto on_error = make_event_handler([this](const event_args& args) {
            try {
                std::rethrow_exception(to_exception(args));
            } catch (const std::exception& e) {
                log_->error("[{}] {}", id_, e.what());
            }
        });
        tracker_.register_on(*transport_, transport_event::end, {on_end});
        tracker_.register_on(*transport_, transport_event::error, {on_error});

        if (config_.debug) {
            auto on_message = make_event_handler([this](const event_args& args) {
                if (auto* message = std::get_if<std::string>(&args)) {
                    log_->debug("[{}] {}", id_, *message);
                }
            });
            tracker_.register_on(*transport_, transport_event::debug, {on_message});
            tracker_.register_on(*transport_, transport_event::info, {on_message});
        }
    }

    void connection::end_handshake() {
        if (transport_) {
            handshake_.remove_from(*transport_);
        }
        handshake_.unregister();
    }

    void connection::detach_transport() {
        end_handshake();
        if (!transport_) {
            return;
        }
        tracker_.remove_from(*transport_);
        tracker_.unregister();
        if (!transport_->closed()) {
            transport_->close();
        }
        transport_.reset();
        live_ = false;
    }

    asio::awaitable<void> connection::follow(shared_completion<connection_state> waiter, const char* event) {
        co_await waiter->async_wait(asio::use_awaitable);
        emit(event);
    }

    asio::awaitable<void> connection::announce(const char* event) {
        emit(event);
        co_return;
    }

} // namespace tidepool

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "event_emitter.hpp"
#include "utility/errors.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tidepool {

    // Remembers which (event, handler) pairs a component attached, so it can later
    // detach exactly those from an emitter without touching foreign listeners.
    template<typename Args>
    class event_tracker {
    public:
        using emitter_t = event_emitter<Args>;
        using handler_ptr = typename emitter_t::handler_ptr;

        struct registration {
            std::string event;
            handler_ptr handler;
        };

        void register_handlers(std::string_view event, std::initializer_list<handler_ptr> handlers) {
            register_handlers(event, std::vector<handler_ptr>(handlers));
        }

        void register_handlers(std::string_view event, const std::vector<handler_ptr>& handlers) {
            validate(event, handlers);
            for (const auto& handler : handlers) {
                if (!contains(event, handler)) {
                    registrations_.push_back({std::string(event), handler});
                }
            }
        }

        void register_on(emitter_t& emitter, std::string_view event, std::initializer_list<handler_ptr> handlers) {
            register_on(std::vector<emitter_t*>{&emitter}, event, std::vector<handler_ptr>(handlers));
        }

        void register_on(const std::vector<emitter_t*>& emitters,
                         std::string_view event,
                         const std::vector<handler_ptr>& handlers) {
            register_handlers(event, handlers);
            for (auto* emitter : emitters) {
                if (emitter == nullptr) {
                    throw validation_error("The \"emitter\" argument is required.");
                }
                for (const auto& handler : handlers) {
                    emitter->add_listener(std::string(event), handler);
                }
            }
        }

        // Detaches every instance of every tracked handler from `emitter`, for one event
        // or for all events the emitter currently has listeners on.
        void remove_from(emitter_t& emitter, std::optional<std::string_view> event = std::nullopt, bool unregister_too = false) {
            std::vector<std::string> events;
            if (event) {
                events.emplace_back(*event);
            } else {
                events = emitter.event_names();
            }
            for (const auto& name : events) {
                std::vector<handler_ptr> removed;
                for (const auto& handler : emitter.listeners(name)) {
                    if (contains(name, handler)) {
                        emitter.remove_listener(name, handler);
                        removed.push_back(handler);
                    }
                }
                // handlers that were not on the emitter stay tracked
                if (unregister_too && !removed.empty()) {
                    unregister(name, removed);
                }
            }
        }

        // No event and no handlers clears all bookkeeping.
        void unregister(std::optional<std::string_view> event = std::nullopt, const std::vector<handler_ptr>& handlers = {}) {
            if (!event && handlers.empty()) {
                registrations_.clear();
                return;
            }
            auto matches = [&](const registration& entry) {
                if (event && entry.event != *event) {
                    return false;
                }
                return handlers.empty() ||
                       std::find(handlers.begin(), handlers.end(), entry.handler) != handlers.end();
            };
            registrations_.erase(std::remove_if(registrations_.begin(), registrations_.end(), matches),
                                 registrations_.end());
        }

        bool contains(std::string_view event, const handler_ptr& handler) const {
            return std::any_of(registrations_.begin(), registrations_.end(), [&](const registration& entry) {
                return entry.event == event && entry.handler == handler;
            });
        }

        const std::vector<registration>& registrations() const noexcept { return registrations_; }

        bool empty() const noexcept { return registrations_.empty(); }

    private:
        static void validate(std::string_view event, const std::vector<handler_ptr>& handlers) {
            if (event.empty()) {
                throw validation_error("The \"event\" argument is required.");
            }
            if (handlers.empty()) {
                throw validation_error("At least one handler is required.");
            }
            for (const auto& handler : handlers) {
                if (!handler || !*handler) {
                    throw validation_error("The \"handler\" argument must be a callable.");
                }
            }
        }

        std::vector<registration> registrations_;
    };

} // namespace tidepool

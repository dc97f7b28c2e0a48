// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tidepool {

    // Named-event listener registry. Listeners are identified by the handler object they
    // were registered with, so the same handler can later be looked up or removed.
    template<typename Args>
    class event_emitter {
    public:
        using handler_t = std::function<void(const Args&)>;
        using handler_ptr = std::shared_ptr<const handler_t>;

    private:
        using registry_t = std::map<std::string, std::vector<handler_ptr>, std::less<>>;

    public:
        // Disposable handle for exactly one add_listener() call.
        class subscription {
        public:
            subscription() = default;
            subscription(std::weak_ptr<registry_t> registry, std::string event, handler_ptr handler)
                : registry_(std::move(registry))
                , event_(std::move(event))
                , handler_(std::move(handler)) {}

            void dispose() {
                if (auto registry = registry_.lock(); registry && handler_) {
                    erase_one(*registry, event_, handler_);
                }
                registry_.reset();
                handler_.reset();
            }

            bool active() const {
                auto registry = registry_.lock();
                if (!registry || !handler_) {
                    return false;
                }
                auto it = registry->find(event_);
                return it != registry->end() &&
                       std::find(it->second.begin(), it->second.end(), handler_) != it->second.end();
            }

            const std::string& event() const noexcept { return event_; }

        private:
            std::weak_ptr<registry_t> registry_;
            std::string event_;
            handler_ptr handler_;
        };

        event_emitter()
            : registry_(std::make_shared<registry_t>()) {}

        virtual ~event_emitter() = default;

        event_emitter(const event_emitter&) = delete;
        event_emitter& operator=(const event_emitter&) = delete;

        subscription add_listener(std::string event, handler_ptr handler) {
            (*registry_)[event].push_back(handler);
            return subscription(registry_, std::move(event), std::move(handler));
        }

        subscription on(std::string event, handler_t handler) {
            return add_listener(std::move(event), std::make_shared<const handler_t>(std::move(handler)));
        }

        // Removes the most recently added instance of `handler` under `event`.
        bool remove_listener(std::string_view event, const handler_ptr& handler) {
            return erase_one(*registry_, event, handler);
        }

        void remove_all_listeners() { registry_->clear(); }

        void remove_all_listeners(std::string_view event) {
            if (auto it = registry_->find(event); it != registry_->end()) {
                registry_->erase(it);
            }
        }

        std::vector<handler_ptr> listeners(std::string_view event) const {
            auto it = registry_->find(event);
            return it == registry_->end() ? std::vector<handler_ptr>{} : it->second;
        }

        std::size_t listener_count(std::string_view event) const {
            auto it = registry_->find(event);
            return it == registry_->end() ? 0 : it->second.size();
        }

        std::vector<std::string> event_names() const {
            std::vector<std::string> names;
            names.reserve(registry_->size());
            for (const auto& [name, handlers] : *registry_) {
                if (!handlers.empty()) {
                    names.push_back(name);
                }
            }
            return names;
        }

        // Handlers run in registration order against a snapshot, so a handler may
        // detach itself or others while the event is being delivered.
        bool emit(std::string_view event, const Args& args = Args{}) {
            auto snapshot = listeners(event);
            for (const auto& handler : snapshot) {
                (*handler)(args);
            }
            return !snapshot.empty();
        }

    private:
        static bool erase_one(registry_t& registry, std::string_view event, const handler_ptr& handler) {
            auto it = registry.find(event);
            if (it == registry.end()) {
                return false;
            }
            auto& handlers = it->second;
            auto found = std::find(handlers.rbegin(), handlers.rend(), handler);
            if (found == handlers.rend()) {
                return false;
            }
            handlers.erase(std::next(found).base());
            if (handlers.empty()) {
                registry.erase(it);
            }
            return true;
        }

        std::shared_ptr<registry_t> registry_;
    };

    template<typename Args, typename Callable>
    typename event_emitter<Args>::handler_ptr make_handler(Callable&& callable) {
        return std::make_shared<const typename event_emitter<Args>::handler_t>(std::forward<Callable>(callable));
    }

} // namespace tidepool

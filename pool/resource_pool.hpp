// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include "connection/connection_config.hpp"
#include "utility/async_wrapper.hpp"
#include "utility/errors.hpp"
#include "utility/logger.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <set>
#include <utility>

namespace tidepool {

    namespace asio = boost::asio;

    template<typename T>
    class resource_pool;

    // Move-only handle on a borrowed resource. Returns it to the pool on destruction
    // unless it was released or destroyed explicitly.
    template<typename T>
    class pool_lease {
    public:
        pool_lease() = default;
        pool_lease(std::shared_ptr<T> resource, std::weak_ptr<resource_pool<T>> pool)
            : resource_(std::move(resource))
            , pool_(std::move(pool)) {}

        ~pool_lease() { release(); }

        pool_lease(pool_lease&& other) noexcept
            : resource_(std::move(other.resource_))
            , pool_(std::move(other.pool_)) {}

        pool_lease& operator=(pool_lease&& other) noexcept {
            if (this != &other) {
                release();
                resource_ = std::move(other.resource_);
                pool_ = std::move(other.pool_);
            }
            return *this;
        }

        pool_lease(const pool_lease&) = delete;
        pool_lease& operator=(const pool_lease&) = delete;

        T* get() const noexcept { return resource_.get(); }
        T* operator->() const noexcept { return resource_.get(); }
        T& operator*() const noexcept { return *resource_; }
        explicit operator bool() const noexcept { return resource_ != nullptr; }

        void release() {
            if (!resource_) {
                return;
            }
            auto resource = std::move(resource_);
            resource_.reset();
            if (auto pool = pool_.lock()) {
                pool->release(std::move(resource));
            }
        }

        // Hands the resource to the pool's destroy factory instead of back to the idle set.
        void discard() {
            if (!resource_) {
                return;
            }
            auto resource = std::move(resource_);
            resource_.reset();
            if (auto pool = pool_.lock()) {
                pool->discard(std::move(resource));
            }
        }

    private:
        std::shared_ptr<T> resource_;
        std::weak_ptr<resource_pool<T>> pool_;
    };

    // Bounded asynchronous pool. Slots are counted from the moment a create starts, so
    // `max` holds even while resources are still being opened. Waiters are served FIFO.
    template<typename T>
    class resource_pool : public std::enable_shared_from_this<resource_pool<T>> {
    public:
        using resource_ptr = std::shared_ptr<T>;

        struct factory {
            std::function<asio::awaitable<resource_ptr>()> create;
            std::function<asio::awaitable<void>(resource_ptr)> destroy;
            std::function<bool(const T&)> validate;
        };

        resource_pool(asio::any_io_executor executor, pool_config config, factory hooks, log_t log = nullptr)
            : executor_(std::move(executor))
            , config_(config)
            , factory_(std::move(hooks))
            , log_(log ? std::move(log) : get_logger(logger_tag::POOL)) {
            if (config_.max == 0) {
                throw validation_error("The pool \"max\" option must be greater than zero.");
            }
            if (!factory_.create) {
                throw validation_error("The pool \"create\" factory is required.");
            }
        }

        std::size_t size() const noexcept { return size_; }
        std::size_t idle() const noexcept { return idle_.size(); }
        std::size_t borrowed() const noexcept { return borrowed_.size(); }
        std::size_t pending() const noexcept { return waiters_.size(); }
        bool closed() const noexcept { return closed_; }
        const pool_config& config() const noexcept { return config_; }

        asio::awaitable<resource_ptr> acquire() {
            if (closed_) {
                throw pool_error("The pool is closed.");
            }
            while (!idle_.empty()) {
                auto resource = idle_.front();
                idle_.pop_front();
                if (valid(*resource)) {
                    borrowed_.insert(resource);
                    co_return resource;
                }
                log_->debug("Idle resource failed validation, destroying it.");
                --size_;
                co_await destroy_resource(std::move(resource));
            }

            if (size_ < config_.max) {
                ++size_;
                std::exception_ptr failure;
                resource_ptr resource;
                try {
                    resource = co_await factory_.create();
                } catch (const std::exception& e) {
                    log_->error("Creating a pooled resource failed: {}", e.what());
                    failure = std::current_exception();
                }
                if (failure) {
                    --size_;
                    serve_waiters();
                    std::rethrow_exception(failure);
                }
                borrowed_.insert(resource);
                co_return resource;
            }

            auto waiter = create_async_wrapper<resource_ptr>(executor_);
            waiters_.push_back(waiter);
            asio::steady_timer timer(executor_, config_.acquire_timeout);
            timer.async_wait([weak = this->weak_from_this(), waiter](const boost::system::error_code& ec) {
                if (ec || waiter->ready()) {
                    return;
                }
                if (auto self = weak.lock()) {
                    self->drop_waiter(waiter);
                    self->log_->warn("Timed out acquiring a pooled resource.");
                }
                waiter->release_on_error(std::make_exception_ptr(pool_error("Timed out acquiring a pooled resource.")));
            });
            auto resource = co_await waiter->async_wait(asio::use_awaitable);
            timer.cancel();
            co_return resource;
        }

        asio::awaitable<pool_lease<T>> lease() {
            auto resource = co_await acquire();
            co_return pool_lease<T>(std::move(resource), this->weak_from_this());
        }

        void release(resource_ptr resource) {
            if (!resource || borrowed_.erase(resource) == 0) {
                return;
            }
            if (closed_) {
                discard_owned(std::move(resource));
                return;
            }
            if (!waiters_.empty()) {
                if (!valid(*resource)) {
                    discard_owned(std::move(resource));
                    return;
                }
                borrowed_.insert(resource);
                auto waiter = waiters_.front();
                waiters_.pop_front();
                waiter->release(std::move(resource));
                return;
            }
            idle_.push_back(std::move(resource));
        }

        // Borrowed resource that must not be reused; its slot is freed for a new one.
        void discard(resource_ptr resource) {
            if (!resource || borrowed_.erase(resource) == 0) {
                return;
            }
            discard_owned(std::move(resource));
        }

        asio::awaitable<void> destroy(resource_ptr resource) {
            if (!resource || borrowed_.erase(resource) == 0) {
                co_return;
            }
            --size_;
            co_await destroy_resource(std::move(resource));
            serve_waiters();
        }

        // Fails pending acquires, destroys idle resources; borrowed ones are destroyed
        // as they come back.
        asio::awaitable<void> close() {
            if (closed_) {
                co_return;
            }
            closed_ = true;
            auto waiters = std::move(waiters_);
            waiters_.clear();
            for (auto& waiter : waiters) {
                waiter->release_on_error(std::make_exception_ptr(pool_error("The pool was closed.")));
            }
            auto idle = std::move(idle_);
            idle_.clear();
            for (auto& resource : idle) {
                --size_;
                co_await destroy_resource(std::move(resource));
            }
            log_->debug("Pool closed, {} resources still borrowed.", borrowed_.size());
        }

    private:
        bool valid(const T& resource) const { return !factory_.validate || factory_.validate(resource); }

        void drop_waiter(const shared_completion<resource_ptr>& waiter) {
            waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
        }

        void discard_owned(resource_ptr resource) {
            --size_;
            asio::co_spawn(
                executor_,
                [self = this->shared_from_this(), resource = std::move(resource)]() -> asio::awaitable<void> {
                    co_await self->destroy_resource(resource);
                    self->serve_waiters();
                },
                asio::detached);
        }

        asio::awaitable<void> destroy_resource(resource_ptr resource) {
            if (!factory_.destroy) {
                co_return;
            }
            try {
                co_await factory_.destroy(std::move(resource));
            } catch (const std::exception& e) {
                log_->error("Destroying a pooled resource failed: {}", e.what());
            }
        }

        // A freed slot goes to the oldest waiter: it gets a freshly created resource.
        void serve_waiters() {
            if (closed_ || waiters_.empty() || size_ >= config_.max) {
                return;
            }
            auto waiter = waiters_.front();
            waiters_.pop_front();
            ++size_;
            asio::co_spawn(
                executor_,
                [self = this->shared_from_this(), waiter]() -> asio::awaitable<void> {
                    std::exception_ptr failure;
                    resource_ptr resource;
                    try {
                        resource = co_await self->factory_.create();
                    } catch (const std::exception& e) {
                        self->log_->error("Creating a pooled resource failed: {}", e.what());
                        failure = std::current_exception();
                    }
                    if (failure) {
                        --self->size_;
                        waiter->release_on_error(failure);
                        co_return;
                    }
                    if (!waiter->ready()) {
                        self->borrowed_.insert(resource);
                        waiter->release(std::move(resource));
                    } else {
                        // the waiter timed out meanwhile
                        self->idle_.push_back(std::move(resource));
                    }
                },
                asio::detached);
        }

        asio::any_io_executor executor_;
        pool_config config_;
        factory factory_;
        log_t log_;
        std::size_t size_{0};
        bool closed_{false};
        std::deque<resource_ptr> idle_;
        std::set<resource_ptr> borrowed_;
        std::deque<shared_completion<resource_ptr>> waiters_;
    };

} // namespace tidepool

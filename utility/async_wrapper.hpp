// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace async_wrapper {

    enum class Status : uint8_t
    {
        Ok,
        Error,
        Unknown
    };

    // One-shot completion slot bridging transport callbacks to awaiting coroutines.
    // Any number of waiters may attach before or after the slot settles; all of them
    // observe the same value or the same error. Only the first release counts.
    template<typename T>
    class async_wrapper_t : public std::enable_shared_from_this<async_wrapper_t<T>> {
    public:
        explicit async_wrapper_t(boost::asio::any_io_executor executor)
            : executor_(std::move(executor)) {}

        async_wrapper_t(const async_wrapper_t&) = delete;
        async_wrapper_t& operator=(const async_wrapper_t&) = delete;

        bool release(T value) {
            if (status_ != Status::Unknown) {
                return false;
            }
            value_.emplace(std::move(value));
            status_ = Status::Ok;
            notify();
            return true;
        }

        bool release_on_error(std::exception_ptr error) {
            if (status_ != Status::Unknown) {
                return false;
            }
            error_ = std::move(error);
            status_ = Status::Error;
            notify();
            return true;
        }

        Status status() const noexcept { return status_; }

        bool ready() const noexcept { return status_ != Status::Unknown; }

        std::size_t waiters() const noexcept { return waiters_.size(); }

        template<typename CompletionToken>
        auto async_wait(CompletionToken&& token) {
            return boost::asio::async_initiate<CompletionToken, void(std::exception_ptr, T)>(
                [self = this->shared_from_this()](auto handler) {
                    using handler_t = decltype(handler);
                    auto shared_handler = std::make_shared<handler_t>(std::move(handler));
                    auto complete = [self, shared_handler]() {
                        auto ex = boost::asio::get_associated_executor(*shared_handler, self->executor_);
                        boost::asio::post(ex, [self, shared_handler]() {
                            if (self->status_ == Status::Error) {
                                (*shared_handler)(self->error_, T{});
                            } else {
                                (*shared_handler)(std::exception_ptr{}, *self->value_);
                            }
                        });
                    };
                    if (self->ready()) {
                        complete();
                    } else {
                        self->waiters_.emplace_back(std::move(complete));
                    }
                },
                token);
        }

    private:
        void notify() {
            auto waiters = std::move(waiters_);
            waiters_.clear();
            for (auto& waiter : waiters) {
                waiter();
            }
        }

        boost::asio::any_io_executor executor_;
        Status status_{Status::Unknown};
        std::optional<T> value_;
        std::exception_ptr error_;
        std::vector<std::function<void()>> waiters_;
    };
} // namespace async_wrapper

template<typename T>
inline std::shared_ptr<async_wrapper::async_wrapper_t<T>> create_async_wrapper(boost::asio::any_io_executor executor) {
    return std::make_shared<async_wrapper::async_wrapper_t<T>>(std::move(executor));
}

template<typename T>
using shared_completion = std::shared_ptr<async_wrapper::async_wrapper_t<T>>;

// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  Tidepool

#include "query_executor.hpp"

#include "result_aggregator.hpp"
#include "utility/async_wrapper.hpp"
#include "utility/errors.hpp"
#include "utility/event_tracker.hpp"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>

#include <memory>

namespace {

    using namespace tidepool;

    struct execution {
        execution(bool use_column_names, query_mode mode, asio::any_io_executor executor)
            : aggregator(use_column_names, mode)
            , done(create_async_wrapper<query_result>(std::move(executor))) {}

        result_aggregator aggregator;
        event_tracker<event_args> tracker;
        shared_completion<query_result> done;
        std::weak_ptr<request> req;
        std::unique_ptr<asio::steady_timer> timer;
        log_t log;
    };

    void detach(execution& state) {
        if (auto req = state.req.lock()) {
            state.tracker.remove_from(*req);
        }
        state.tracker.unregister();
        if (state.timer) {
            state.timer->cancel();
        }
    }

    void fail(execution& state, std::exception_ptr error) {
        if (state.done->ready()) {
            return;
        }
        detach(state);
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            state.log->error("Request failed: {}", e.what());
        }
        state.done->release_on_error(std::move(error));
    }

    // Handlers hold the execution weakly; it lives in the awaiting coroutine frame.
    template<typename Payload, typename Step>
    handler_ptr on_payload(const std::shared_ptr<execution>& state, Step step) {
        return make_event_handler([weak = std::weak_ptr<execution>(state), step](const event_args& args) {
            auto locked = weak.lock();
            if (!locked) {
                return;
            }
            if (auto* payload = std::get_if<Payload>(&args)) {
                step(*locked, *payload);
            }
        });
    }

} // namespace

namespace tidepool {

    asio::awaitable<query_result> query_executor::execute(query q) {
        conn_.enter(connection_state::executing);
        try {
            auto outcome = co_await run(std::move(q));
            conn_.leave();
            co_return outcome;
        } catch (const std::exception&) {
            conn_.leave();
            throw;
        }
    }

    asio::awaitable<query_result> query_executor::run(query q) {
        auto& transport = conn_.transport();
        auto executor = co_await asio::this_coro::executor;
        auto state = std::make_shared<execution>(conn_.config().use_column_names, q.mode(), executor);
        state->log = conn_.log();

        std::weak_ptr<execution> weak = state;
        auto req = transport.new_request(q.statement(), [weak](std::exception_ptr error, std::size_t) {
            if (auto locked = weak.lock(); locked && error) {
                fail(*locked, std::move(error));
            }
        });
        state->req = req;

        auto timeout = q.request_timeout().value_or(conn_.config().request_timeout);
        req->set_timeout(timeout);
        for (const auto& param : q.parameters()) {
            if (param.direction == parameter_direction::out) {
                req->add_output_parameter(param);
            } else {
                req->add_parameter(param);
            }
        }

        auto on_error = make_event_handler([weak](const event_args& args) {
            if (auto locked = weak.lock()) {
                fail(*locked, to_exception(args));
            }
        });
        auto on_columns = on_payload<column_list>(state, [](execution& s, const column_list& columns) {
            s.aggregator.on_columns(columns);
        });
        auto on_row = on_payload<row_data>(state, [](execution& s, const row_data& row) { s.aggregator.on_row(row); });
        auto on_done = on_payload<done_info>(state, [](execution& s, const done_info& done) {
            s.aggregator.on_statement_complete(done);
        });
        auto on_done_in_proc = on_payload<done_info>(state, [](execution& s, const done_info& done) {
            s.aggregator.on_in_procedure_complete(done);
        });
        auto on_done_proc = on_payload<done_info>(state, [](execution& s, const done_info& done) {
            s.aggregator.on_procedure_complete(done);
        });
        auto on_return_value = on_payload<return_value_info>(state, [](execution& s, const return_value_info& value) {
            s.aggregator.on_return_value(value);
        });
        auto on_completed = make_event_handler([weak](const event_args&) {
            auto locked = weak.lock();
            if (!locked || locked->done->ready()) {
                return;
            }
            detach(*locked);
            locked->done->release(locked->aggregator.finish());
        });

        state->tracker.register_on(*req, transport_event::error, {on_error});
        state->tracker.register_on(*req, transport_event::column_metadata, {on_columns});
        state->tracker.register_on(*req, transport_event::row, {on_row});
        state->tracker.register_on(*req, transport_event::statement_complete, {on_done});
        state->tracker.register_on(*req, transport_event::in_procedure_complete, {on_done_in_proc});
        state->tracker.register_on(*req, transport_event::procedure_complete, {on_done_proc});
        state->tracker.register_on(*req, transport_event::return_value, {on_return_value});
        state->tracker.register_on(*req, transport_event::request_completed, {on_completed});

        conn_.log()->debug("[{}] {} {}", conn_.id(), to_string(q.mode()), q.statement());
        try {
            if (q.mode() == query_mode::exec) {
                transport.call_procedure(req);
            } else if (q.mode() == query_mode::batch && q.parameters().empty()) {
                transport.exec_sql_batch(req);
            } else {
                transport.exec_sql(req);
            }
        } catch (const std::exception&) {
            fail(*state, std::current_exception());
        }

        // zero disables the timeout
        if (timeout.count() > 0 && !state->done->ready()) {
            state->timer = std::make_unique<asio::steady_timer>(executor, timeout);
            state->timer->async_wait([weak, &transport, timeout](const boost::system::error_code& ec) {
                auto locked = weak.lock();
                if (ec || !locked || locked->done->ready()) {
                    return;
                }
                auto pending = locked->req.lock();
                fail(*locked,
                     std::make_exception_ptr(timeout_error(
                         fmt::format("Timeout: Request failed to complete in {}ms.", timeout.count()))));
                if (pending) {
                    transport.cancel(std::move(pending));
                }
            });
        }

        auto outcome = co_await state->done->async_wait(asio::use_awaitable);
        co_return outcome;
    }

} // namespace tidepool

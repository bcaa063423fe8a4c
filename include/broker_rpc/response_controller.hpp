/*
MIT License

Copyright (c) 2019 Vladislav Troinich
Copyright (c) 2024-2026 mrayva

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#pragma once

#include <asio/associated_executor.hpp>
#include <asio/async_result.hpp>
#include <asio/awaitable.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <variant>

#include "http_adapter.hpp"
#include "push_sequence.hpp"
#include "sse_stream.hpp"

namespace broker_rpc {

// Raised synchronously when SSE is asked to stream something that is not a sequence
class stream_input_error : public std::invalid_argument {
public:
    stream_input_error() : std::invalid_argument("You must return a push_sequence stream to use Server-Sent Events (SSE).") {}
};

// A handler's sequence failed or ended without a value
class producer_error : public std::runtime_error {
public:
    explicit producer_error(const status& s) : std::runtime_error(s.error()), m_status(s) {}

    [[nodiscard]] const status& get_status() const noexcept {
        return m_status;
    }

private:
    status m_status;
};

using deferred_result = std::function<asio::awaitable<json>()>;

// What a route handler may return: nothing, a plain value, a deferred value or a sequence
using handler_result = std::variant<std::monostate, json, deferred_result, push_sequence<json>>;

// Completion signature: void(status, T). Yields the last value once the sequence
// completes; empty_sequence if it completes without any.
template <typename T, typename CompletionToken>
auto async_last_value(push_sequence<T> seq, CompletionToken&& token) {
    return asio::async_initiate<CompletionToken, void(status, T)>(
        [seq = std::move(seq)](auto handler) {
            using handler_t = std::decay_t<decltype(handler)>;
            struct state {
                handler_t handler;
                optional<T> last;
                bool done = false;
            };
            auto st = std::make_shared<state>(std::move(handler));

            auto finish = [st](const status& s) {
                if (st->done) {
                    return;
                }
                st->done = true;
                T value = st->last.value_or(T{});
                auto ex = asio::get_associated_executor(st->handler);
                asio::post(ex, [st, s, value = std::move(value)]() mutable {
                    std::move(st->handler)(s, std::move(value));
                });
            };

            seq.subscribe(observer<T>{
                [st](const T& v) { st->last = v; },
                [finish](const status& s) { finish(s); },
                [st, finish]() {
                    if (st->last.has_value()) {
                        finish(status());
                    } else {
                        finish(status(error_code::empty_sequence, "no elements in sequence"));
                    }
                }});
        },
        token);
}

struct sse_options {
    // Applied to the source before anything is written; may throw
    std::function<push_sequence<json>(push_sequence<json>)> intercept;
    headers_t additional_headers;
};

// Turns handler results into HTTP replies through a framework adapter
class response_controller {
public:
    explicit response_controller(ihttp_adapter& adapter,
                                 std::shared_ptr<spdlog::logger> log = spdlog::default_logger())
        : m_adapter(adapter), m_log(std::move(log)) {}

    [[nodiscard]] static int status_by_method(request_method method) noexcept {
        return method == request_method::post ? 201 : 200;
    }

    // Resolves deferred values and sequences to the value they settle on
    asio::awaitable<json> transform_to_result(handler_result result) const {
        if (auto* value = std::get_if<json>(&result)) {
            co_return *value;
        }
        if (auto* deferred = std::get_if<deferred_result>(&result)) {
            co_return co_await (*deferred)();
        }
        if (auto* seq = std::get_if<push_sequence<json>>(&result)) {
            auto [s, value] = co_await async_last_value(*seq, asio::use_awaitable);
            if (s.failed()) {
                throw producer_error(s);
            }
            co_return value;
        }
        co_return json();
    }

    asio::awaitable<void> apply(handler_result result, iresponse& response, optional<int> status_code = {}) {
        auto body = co_await transform_to_result(std::move(result));
        m_adapter.reply(response, body, status_code);
    }

    asio::awaitable<void> render(handler_result result, iresponse& response, std::string view) {
        auto body = co_await transform_to_result(std::move(result));
        m_adapter.render(response, view, body);
    }

    // `statusCode` and `url` in the result override the route's redirect settings
    asio::awaitable<void> redirect(handler_result result, iresponse& response, redirect_response fallback) {
        auto body = co_await transform_to_result(std::move(result));

        int code = fallback.status_code.value_or(302);
        std::string url = fallback.url;
        if (body.is_object()) {
            if (body.contains("statusCode") && body["statusCode"].is_number_integer()) {
                code = body["statusCode"].get<int>();
            }
            if (body.contains("url") && body["url"].is_string()) {
                url = body["url"].get<std::string>();
            }
        }
        m_adapter.redirect(response, code, url);
    }

    void set_headers(iresponse& response, const headers_t& headers) {
        for (const auto& [name, value] : headers) {
            m_adapter.set_header(response, name, value);
        }
    }

    void set_status(iresponse& response, int status_code) {
        m_adapter.set_status(response, status_code);
    }

    // Streams `result` as server-sent events. Throws stream_input_error for anything but a
    // sequence, before touching the response. The returned subscription is also cancelled
    // when the request closes.
    subscription sse(const handler_result& result, iresponse_sptr response, irequest& request,
                     const sse_options& options = {}) {
        const auto* seq = std::get_if<push_sequence<json>>(&result);
        if (seq == nullptr) {
            throw stream_input_error();
        }

        auto source = options.intercept ? options.intercept(*seq) : *seq;

        m_adapter.set_status(*response, 200);
        m_adapter.set_header(*response, "Content-Type", sse::content_type);
        m_adapter.set_header(*response, "Connection", "keep-alive");
        m_adapter.set_header(*response, "Cache-Control", "no-cache");
        m_adapter.set_header(*response, "X-Accel-Buffering", "no");
        set_headers(*response, options.additional_headers);

        auto stream = std::make_shared<sse_stream>(response);
        auto log = m_log;
        auto sub = source.subscribe(observer<json>{
            [stream](const json& value) { stream->write_message(to_message_event(value)); },
            [stream, log](const status& s) {
                log->debug("sse stream failed: {}", s.error());
                stream->write_message(message_event{s.error(), std::string(sse::error_event), {}});
                stream->end();
            },
            [stream]() { stream->end(); }});

        request.on_close([sub, stream]() mutable {
            sub.unsubscribe();
            stream->abort();
        });
        return sub;
    }

private:
    ihttp_adapter& m_adapter;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace broker_rpc

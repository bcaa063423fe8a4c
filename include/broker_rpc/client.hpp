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

#include <fmt/format.h>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "connect_future.hpp"
#include "event_registry.hpp"
#include "interface.hpp"
#include "push_sequence.hpp"
#include "routing_map.hpp"
#include "serializer.hpp"
#include "status_broadcaster.hpp"
#include "subscription_ledger.hpp"

namespace broker_rpc {

constexpr string_view not_initialized_message = "Not initialized. Please call the \"connect\" method first.";

// Unique id for an in-flight request
inline std::string generate_request_id() {
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return fmt::format("{:x}.{}", now, counter++);
}

struct client_options {
    iserializer_sptr serializer = std::make_shared<json_record_serializer>();
    ideserializer_sptr deserializer = std::make_shared<incoming_response_deserializer>();
    // Broker properties sent with every message; per-message options override them
    headers_t user_properties;
    std::shared_ptr<spdlog::logger> log = spdlog::default_logger();
};

// Request/response transport over a publish/subscribe broker.
//
// Requests go to `pattern` and expect replies on `pattern + "/reply"`, correlated by id.
// One broker subscription is held per reply channel for as long as any request on it is
// live. Must be driven from the io_context thread.
class client {
public:
    client(aio& io, session_factory factory, client_options options = {})
        : m_io(io), m_factory(std::move(factory)), m_options(std::move(options)),
          m_alive(std::make_shared<int>(0)) {
        if (!m_options.serializer) {
            m_options.serializer = std::make_shared<json_record_serializer>();
        }
        if (!m_options.deserializer) {
            m_options.deserializer = std::make_shared<incoming_response_deserializer>();
        }
        if (!m_options.log) {
            m_options.log = spdlog::default_logger();
        }
    }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    ~client() {
        if (m_session) {
            m_session->end();
        }
    }

    // Creates the broker session on first use. Later calls return the same future until
    // close(); it settles with whichever of connect and close the session reports first.
    connect_future connect() {
        if (m_session) {
            return m_connect_future;
        }

        m_state = connection_state::connecting;
        m_session = m_factory(m_io);
        register_lifecycle_listeners(*m_session);
        m_pending_listeners.drain_into(*m_session);

        m_connect_future = take_first(*m_session, {
            {session_event::connect, [](const event_data&) { return status(); }},
            {session_event::close, [](const event_data& ev) {
                 return ev.error.failed() ? ev.error
                                          : status(error_code::connection_closed, "connection closed");
             }},
        });

        m_session->start();
        return m_connect_future;
    }

    // Ends the session and forgets routing, subscriptions and queued listeners. Callers
    // still waiting for a response get a terminal error.
    void close() {
        auto had_session = static_cast<bool>(m_session);
        if (m_session) {
            auto session = std::move(m_session);
            m_session.reset();
            session->end();
        }

        auto closed = status(error_code::connection_closed, "connection closed");
        auto orphans = m_routing.drain();
        m_ledger.reset(closed);
        m_pending_listeners.clear();
        m_connect_future = connect_future();
        ++m_generation;
        m_is_initial_connection = true;
        m_is_reconnecting = false;
        m_state = connection_state::closed;

        if (had_session) {
            m_status.next(connection_status::closed);
        }

        for (auto& cb : orphans) {
            cb(write_packet{json(closed.error()), std::nullopt, true});
        }
    }

    // Sends a request and routes its replies to `callback`. The returned teardown stops
    // the routing and releases the reply channel; calling it again does nothing.
    teardown_fn publish(packet p, response_cb callback) {
        try {
            if (!m_session) {
                throw std::logic_error(std::string(not_initialized_message));
            }

            p.id = generate_request_id();
            auto pattern = get_request_pattern(normalize_pattern(p.pattern));
            auto record = m_options.serializer->serialize(p);
            auto headers = merge_headers(m_options.user_properties, record.options);
            auto body = record.body.dump();

            auto req = std::make_shared<pending_request>();
            req->id = *p.id;
            req->channel = get_response_pattern(pattern);
            req->generation = m_generation;

            std::weak_ptr<void> alive = m_alive;
            auto on_ready = [this, alive, req, pattern, body, headers, callback](const status& s) {
                if (alive.expired()) {
                    return;
                }
                if (s.failed()) {
                    if (!req->torn_down) {
                        callback(write_packet{json(s.error()), std::nullopt, true});
                    }
                    return;
                }
                if (req->torn_down) {
                    release_channel(req->channel);
                    return;
                }

                req->counted = true;
                m_routing.add(req->id, callback);
                send_request(req, pattern, body, headers);
            };

            if (m_ledger.acquire(req->channel, on_ready)) {
                subscribe_channel(req->channel);
            }

            return [this, alive, req]() {
                if (alive.expired() || req->torn_down) {
                    return;
                }
                req->torn_down = true;
                // close() already dropped routing and references of earlier sessions
                if (req->generation != m_generation) {
                    return;
                }
                m_routing.remove(req->id);
                if (req->counted) {
                    release_channel(req->channel);
                }
            };
        } catch (const std::exception& e) {
            callback(write_packet{json(e.what()), std::nullopt, true});
            return []() {};
        }
    }

    // Publishes a one-way event to `pattern`; completes with the broker's verdict
    asio::awaitable<status> dispatch_event(packet p) {
        if (!m_session) {
            co_return status(error_code::not_connected, std::string(not_initialized_message));
        }

        std::string pattern;
        std::string body;
        headers_t headers;
        try {
            p.id.reset();
            pattern = get_request_pattern(normalize_pattern(p.pattern));
            auto record = m_options.serializer->serialize(p);
            headers = merge_headers(m_options.user_properties, record.options);
            body = record.body.dump();
        } catch (const std::exception& e) {
            co_return status(error_code::serialization_error, e.what());
        }

        auto session = m_session;
        co_return co_await session->publish(pattern, std::span<const char>(body.data(), body.size()), headers);
    }

    // Cold request: each subscription connects, sends one request and relays its replies
    push_sequence<json> send(json pattern, json data, optional<record_options> options = {}) {
        std::weak_ptr<void> alive = m_alive;
        return push_sequence<json>([this, alive, pattern, data, options](subscriber<json> sub) {
            auto teardown = std::make_shared<teardown_fn>();
            sub.add_teardown([teardown]() {
                if (*teardown) {
                    (*teardown)();
                }
            });

            connect().then([this, alive, pattern, data, options, sub, teardown](const status& s) {
                if (alive.expired() || sub.closed()) {
                    return;
                }
                if (s.failed()) {
                    sub.error(s);
                    return;
                }

                packet p;
                p.pattern = pattern;
                p.data = data;
                p.options = options;
                *teardown = publish(std::move(p), [sub](const write_packet& wp) {
                    if (wp.err.has_value()) {
                        sub.error(status(error_code::remote_error, error_to_string(*wp.err)));
                        return;
                    }
                    if (wp.response.has_value()) {
                        sub.next(*wp.response);
                    }
                    if (wp.is_disposed) {
                        sub.complete();
                    }
                });

                if (sub.closed()) {
                    (*teardown)();
                }
            });
        });
    }

    // Connects if needed, then dispatches a one-way event
    asio::awaitable<status> emit(json pattern, json data, optional<record_options> options = {}) {
        auto s = co_await connect().async_wait(asio::use_awaitable);
        if (s.failed()) {
            co_return s;
        }

        packet p;
        p.pattern = std::move(pattern);
        p.data = std::move(data);
        p.options = std::move(options);
        co_return co_await dispatch_event(std::move(p));
    }

    // Registers on the live session, or queues until connect() creates one
    void on(session_event event, session_listener listener) {
        if (m_session) {
            m_session->on(event, std::move(listener));
            return;
        }
        m_pending_listeners.push(event, std::move(listener));
    }

    [[nodiscard]] std::pair<ibroker_session_sptr, status> unwrap() const {
        if (!m_session) {
            return {nullptr, status(error_code::not_connected, std::string(not_initialized_message))};
        }
        return {m_session, status()};
    }

    [[nodiscard]] latest_value_broadcaster<connection_status>& status_stream() noexcept {
        return m_status;
    }

    [[nodiscard]] connection_state state() const noexcept {
        return m_state;
    }

    [[nodiscard]] bool is_reconnecting() const noexcept {
        return m_is_reconnecting;
    }

    [[nodiscard]] uint64_t unmatched_responses() const noexcept {
        return m_unmatched_responses;
    }

    [[nodiscard]] std::size_t pending_requests() const noexcept {
        return m_routing.size();
    }

    [[nodiscard]] int channel_refcount(const std::string& channel) const {
        return m_ledger.count(channel);
    }

    [[nodiscard]] static std::string get_request_pattern(const std::string& pattern) {
        return pattern;
    }

    [[nodiscard]] static std::string get_response_pattern(const std::string& pattern) {
        return pattern + "/reply";
    }

private:
    struct pending_request {
        std::string id;
        std::string channel;
        uint64_t generation = 0;
        bool counted = false;
        bool torn_down = false;
    };

    void register_lifecycle_listeners(ibroker_session& session) {
        session.on(session_event::error, [this](const event_data& ev) {
            if (ev.error.code() != error_code::connection_refused) {
                m_options.log->error("{}", ev.error.error());
            }
        });

        session.on(session_event::offline, [this](const event_data&) {
            m_state = connection_state::offline;
            m_connect_future =
                connect_future::rejected(status(error_code::offline, "Connection lost. Trying to reconnect..."));
            m_options.log->warn("Broker went offline.");
        });

        session.on(session_event::reconnect, [this](const event_data&) {
            m_is_reconnecting = true;
            m_state = connection_state::reconnecting;
            m_options.log->info("Reconnecting to broker...");
            m_status.next(connection_status::reconnecting);
        });

        session.on(session_event::connect, [this](const event_data&) {
            m_is_reconnecting = false;
            m_state = connection_state::connected;

            if (m_is_initial_connection) {
                m_is_initial_connection = false;
                m_session->on(session_event::message, [this](const event_data& msg) { handle_message(msg); });
            }

            if (!m_connect_future.ready()) {
                m_connect_future.settle(status());
            } else if (m_connect_future.result().failed()) {
                m_connect_future = connect_future::resolved();
            }

            m_options.log->info("Connected to broker");
            m_status.next(connection_status::connected);
        });

        session.on(session_event::disconnect, [this](const event_data& ev) {
            m_options.log->debug("Broker disconnected: {}", ev.error.error());
            m_status.next(connection_status::disconnected);
        });

        session.on(session_event::close, [this](const event_data& ev) {
            m_options.log->debug("Broker connection closed: {}", ev.error.error());
            m_status.next(connection_status::closed);
        });
    }

    void handle_message(const event_data& ev) {
        auto value = json::parse(ev.payload.begin(), ev.payload.end(), nullptr, false);
        if (value.is_discarded()) {
            m_options.log->debug("dropping malformed message on {}", ev.channel);
            return;
        }

        incoming_response response;
        try {
            response = m_options.deserializer->deserialize(value);
        } catch (const std::exception& e) {
            m_options.log->warn("failed to deserialize message on {}: {}", ev.channel, e.what());
            return;
        }

        if (!response.id.has_value() || !m_routing.dispatch(*response.id, response)) {
            ++m_unmatched_responses;
        }
    }

    void subscribe_channel(const std::string& channel) {
        auto session = m_session;
        std::weak_ptr<void> alive = m_alive;
        asio::co_spawn(
            m_io,
            [this, alive, session, channel]() -> asio::awaitable<void> {
                auto s = co_await session->subscribe(channel);
                if (alive.expired() || session != m_session) {
                    co_return;
                }
                if (s.failed()) {
                    m_options.log->debug("subscribe to {} failed: {}", channel, s.error());
                }
                m_ledger.settle(channel, s);
            },
            asio::detached);
    }

    void release_channel(const std::string& channel) {
        if (!m_ledger.release(channel) || !m_session) {
            return;
        }

        auto session = m_session;
        auto log = m_options.log;
        asio::co_spawn(
            m_io,
            [session, channel, log]() -> asio::awaitable<void> {
                auto s = co_await session->unsubscribe(channel);
                if (s.failed()) {
                    log->debug("unsubscribe from {} failed: {}", channel, s.error());
                }
            },
            asio::detached);
    }

    void send_request(std::shared_ptr<pending_request> req, std::string pattern, std::string body,
                      headers_t headers) {
        if (!m_session) {
            return;
        }

        auto session = m_session;
        std::weak_ptr<void> alive = m_alive;
        asio::co_spawn(
            m_io,
            [this, alive, session, req, pattern, body, headers]() -> asio::awaitable<void> {
                auto s = co_await session->publish(pattern, std::span<const char>(body.data(), body.size()),
                                                   headers);
                if (alive.expired() || !s.failed()) {
                    co_return;
                }

                incoming_response failure;
                failure.id = req->id;
                failure.err = json(s.error());
                m_routing.dispatch(req->id, failure);
            },
            asio::detached);
    }

    aio& m_io;
    session_factory m_factory;
    client_options m_options;
    std::shared_ptr<void> m_alive;

    ibroker_session_sptr m_session;
    connect_future m_connect_future;
    pending_listener_queue m_pending_listeners;
    latest_value_broadcaster<connection_status> m_status;

    subscription_ledger m_ledger;
    routing_map m_routing;

    connection_state m_state = connection_state::uninitialized;
    bool m_is_initial_connection = true;
    bool m_is_reconnecting = false;
    uint64_t m_unmatched_responses = 0;
    uint64_t m_generation = 0;
};

} // namespace broker_rpc

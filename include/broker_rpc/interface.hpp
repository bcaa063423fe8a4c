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

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <magic_enum/magic_enum.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace broker_rpc {

using std::optional;
using std::string_view;

using aio = asio::io_context;
using json = nlohmann::json;

// Message headers (name-value pairs)
using headers_t = std::vector<std::pair<std::string, std::string>>;

enum class error_code {
    ok = 0,
    not_connected,
    connection_refused,
    connection_lost,
    connection_closed,
    offline,
    max_reconnects,
    protocol_error,
    invalid_header,
    invalid_message,
    parse_error,
    message_too_large,
    subscribe_failed,
    serialization_error,
    remote_error,
    producer_error,
    empty_sequence,
    invalid_argument,
    operation_failed,
};

// Status class for error handling
class status {
public:
    status() = default;

    status(const std::string& error) : m_code(error_code::operation_failed), m_error(error) {}

    status(const char* error) : status(std::string(error)) {}

    status(error_code code) : m_code(code) {
        if (code != error_code::ok) {
            m_error = std::string(magic_enum::enum_name(code));
        }
    }

    status(error_code code, const std::string& error) : m_code(code), m_error(error) {}

    ~status() = default;

    [[nodiscard]] bool failed() const noexcept {
        return m_error.has_value();
    }

    [[nodiscard]] error_code code() const noexcept {
        return m_code;
    }

    [[nodiscard]] std::string error() const {
        if (!m_error.has_value())
            return {};

        return m_error.value();
    }

private:
    error_code m_code = error_code::ok;
    optional<std::string> m_error;
};

// Notifications raised by a broker session
enum class session_event { connect, reconnect, offline, disconnect, close, error, message };

// Payload of a session notification. Only the fields relevant to the event are set:
// error for error/close/disconnect, channel/payload/headers for message.
struct event_data {
    session_event event = session_event::message;
    status error;
    string_view channel;
    std::span<const char> payload;
    const headers_t* headers = nullptr;
};

using session_listener = std::function<void(const event_data&)>;

// Externally observable connection status
enum class connection_status { connected, disconnected, reconnecting, closed };

// Internal lifecycle of a transport
enum class connection_state { uninitialized, connecting, connected, reconnecting, offline, closed };

// Transport-only metadata carried beside the payload (broker user properties)
struct record_options {
    headers_t headers;
};

// Outbound request or event. `id` is assigned by the transport for requests and stays
// empty for events.
struct packet {
    optional<std::string> id;
    json pattern;
    json data;
    optional<record_options> options;
};

// Response handed to a request callback
struct write_packet {
    optional<json> err;
    optional<json> response;
    bool is_disposed = false;
};

using response_cb = std::function<void(const write_packet&)>;
using teardown_fn = std::function<void()>;

// Decoded inbound envelope
struct incoming_response {
    optional<std::string> id;
    optional<json> err;
    optional<json> response;
    bool is_disposed = false;
};

// Serializer output: body goes on the wire, options travel beside it
struct serialized_record {
    json body;
    optional<record_options> options;
};

struct iserializer {
    virtual ~iserializer() = default;

    [[nodiscard]] virtual serialized_record serialize(const packet& p) = 0;
};
using iserializer_sptr = std::shared_ptr<iserializer>;

struct ideserializer {
    virtual ~ideserializer() = default;

    [[nodiscard]] virtual incoming_response deserialize(const json& value) = 0;
};
using ideserializer_sptr = std::shared_ptr<ideserializer>;

struct ssl_config {
    std::string key;      // PEM-encoded private key content
    std::string cert;     // PEM-encoded certificate content
    std::string ca;       // PEM-encoded CA certificate content
    bool verify = true;
};

struct connect_config {
    std::string address = "127.0.0.1";
    uint16_t port = 4222;

    bool verbose = false;
    bool pedantic = false;
    std::string name = "broker_rpc";

    optional<std::string> user;
    optional<std::string> password;
    optional<std::string> token;

    // Exponential backoff configuration for reconnection
    uint32_t retry_initial_delay_ms = 1000;  // Initial delay in milliseconds
    uint32_t retry_max_delay_ms = 30000;     // Maximum delay cap in milliseconds
    uint32_t retry_max_attempts = 0;         // 0 = unlimited retries

    // Socket buffer tuning (0 = use system defaults)
    uint32_t send_buffer_size = 0;
    uint32_t recv_buffer_size = 0;
};

// Physical broker connection. Events are delivered on the session's executor; after
// end() no further events are delivered.
struct ibroker_session {
    virtual ~ibroker_session() = default;

    virtual void start() = 0;

    virtual void end() noexcept = 0;

    [[nodiscard]] virtual bool is_connected() const noexcept = 0;

    virtual void on(session_event event, session_listener listener) = 0;

    [[nodiscard]] virtual asio::awaitable<status> subscribe(string_view channel) = 0;

    [[nodiscard]] virtual asio::awaitable<status> unsubscribe(string_view channel) = 0;

    [[nodiscard]] virtual asio::awaitable<status> publish(string_view channel,
                                                          std::span<const char> payload,
                                                          const headers_t& headers = {}) = 0;
};
using ibroker_session_sptr = std::shared_ptr<ibroker_session>;

// Builds a fresh physical session each time a transport connects
using session_factory = std::function<ibroker_session_sptr(aio&)>;

} // namespace broker_rpc

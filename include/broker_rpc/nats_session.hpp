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

#include <algorithm>
#include <array>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/buffer.hpp>
#include <asio/co_spawn.hpp>
#include <asio/connect.hpp>
#include <asio/detached.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/ssl/context.hpp>
#include <asio/ssl/stream.hpp>
#include <asio/steady_timer.hpp>
#include <asio/streambuf.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <atomic>
#include <cctype>
#include <charconv>
#include <concepts>
#include <concurrentqueue/moodycamel/concurrentqueue.h>
#include <istream>
#include <memory>
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>
#include <stringzilla/stringzilla.hpp>
#include <unordered_map>
#include <utility>

#include "event_registry.hpp"
#include "interface.hpp"

namespace broker_rpc {

namespace ssl = asio::ssl;

namespace protocol {
    constexpr string_view crlf = "\r\n";
    constexpr string_view pub_fmt = "PUB {} {}\r\n";                // subject len
    constexpr string_view hpub_fmt = "HPUB {} {} {}\r\n";           // subject hdr_len total_len
    constexpr string_view sub_fmt = "SUB {} {}\r\n";                // subject sid
    constexpr string_view unsub_fmt = "UNSUB {}\r\n";
    constexpr string_view connect_fmt = "CONNECT {}\r\n";
    constexpr string_view ping = "PING\r\n";
    constexpr string_view pong = "PONG\r\n";
    constexpr string_view nats_hdr_line = "NATS/1.0\r\n";

    constexpr string_view op_msg = "MSG";
    constexpr string_view op_hmsg = "HMSG";
    constexpr string_view op_ping = "PING";
    constexpr string_view op_pong = "PONG";
    constexpr string_view op_ok = "+OK";
    constexpr string_view op_err = "-ERR";
    constexpr string_view op_info = "INFO";
    constexpr string_view delim = " ";
}

template<typename T>
inline bool parse_int(string_view sv, T& out) {
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// simdjson reader for the server's INFO document
class fast_json {
public:
    bool parse(string_view sv) {
        m_padded = simdjson::padded_string(sv.data(), sv.size());
        auto result = m_parser.parse(m_padded);
        if (result.error()) {
            m_error = simdjson::error_message(result.error());
            return false;
        }
        m_doc = std::move(result.value());
        m_error.clear();
        return true;
    }

    uint64_t get_uint(std::string_view key, uint64_t default_val = 0) const {
        auto result = m_doc[key].get_uint64();
        return result.error() ? default_val : result.value();
    }

    bool get_bool(std::string_view key, bool default_val = false) const {
        auto result = m_doc[key].get_bool();
        return result.error() ? default_val : result.value();
    }

    bool contains(std::string_view key) const {
        return !m_doc[key].error();
    }

    const std::string& error() const { return m_error; }

private:
    simdjson::dom::parser m_parser;
    simdjson::dom::element m_doc;
    simdjson::padded_string m_padded;
    std::string m_error;
};

// Outgoing protocol lines waiting for the writer coroutine. Everything queued between
// two flushes goes out in a single write.
class write_queue {
public:
    explicit write_queue(size_t initial_capacity = 256) : m_queue(initial_capacity), m_pending_bytes(0) {}

    bool enqueue(std::string&& data) {
        size_t size = data.size();
        if (m_queue.enqueue(std::move(data))) {
            m_pending_bytes.fetch_add(size, std::memory_order_relaxed);
            return true;
        }
        return false;
    }

    // Appends every pending line to `output`; returns how many were taken
    size_t dequeue_all(std::string& output) {
        std::string item;
        size_t count = 0;
        size_t bytes = 0;

        while (m_queue.try_dequeue(item)) {
            bytes += item.size();
            output += item;
            ++count;
        }

        if (bytes > 0) {
            m_pending_bytes.fetch_sub(bytes, std::memory_order_relaxed);
        }
        return count;
    }

    void clear() {
        std::string discarded;
        dequeue_all(discarded);
    }

    size_t pending_bytes() const noexcept {
        return m_pending_bytes.load(std::memory_order_relaxed);
    }

    bool empty() const noexcept {
        return m_pending_bytes.load(std::memory_order_relaxed) == 0;
    }

private:
    moodycamel::ConcurrentQueue<std::string> m_queue;
    std::atomic<size_t> m_pending_bytes;
};

// Serialize headers to NATS format: "NATS/1.0\r\nKey: Value\r\n...\r\n"
inline std::string serialize_headers(const headers_t& headers) {
    std::string result(protocol::nats_hdr_line);
    for (const auto& [key, value] : headers) {
        result += key;
        result += ": ";
        result += value;
        result += "\r\n";
    }
    result += "\r\n";
    return result;
}

// Parse headers from NATS format using StringZilla for SIMD-accelerated search
inline headers_t parse_headers(string_view data) {
    namespace sz = ashvardanian::stringzilla;
    headers_t headers;

    sz::string_view sz_data(data.data(), data.size());
    constexpr sz::string_view crlf("\r\n", 2);
    constexpr char colon = ':';

    // Skip "NATS/1.0\r\n" prefix
    auto pos = sz_data.find(crlf);
    if (pos == sz::string_view::npos) return headers;
    sz_data = sz_data.substr(pos + 2);

    while (!sz_data.empty() && sz_data != crlf) {
        pos = sz_data.find(crlf);
        if (pos == sz::string_view::npos) break;

        auto line = sz_data.substr(0, pos);
        sz_data = sz_data.substr(pos + 2);

        if (line.empty()) break;

        auto colon_pos = line.find(colon);
        if (colon_pos != sz::string_view::npos) {
            auto key = line.substr(0, colon_pos);
            auto value = line.substr(colon_pos + 1);
            if (!value.empty() && value[0] == ' ') {
                value = value.substr(1);
            }
            headers.emplace_back(std::string(key.data(), key.size()),
                                 std::string(value.data(), value.size()));
        }
    }
    return headers;
}

using asio::awaitable;
using asio::use_awaitable;
using asio::ip::tcp;
using raw_socket = asio::ip::tcp::socket;
using ssl_socket = asio::ssl::stream<asio::ip::tcp::socket>;

template <class Socket>
auto& get_lowest_layer(Socket& s) {
    if constexpr (requires { s.lowest_layer(); }) {
        return s.lowest_layer();
    } else {
        return s;
    }
}

template <typename T>
concept SslSocketType = std::same_as<T, ssl_socket>;

template <typename T>
concept RawSocketType = std::same_as<T, raw_socket>;

// Plain and TLS sockets behind one stream interface
template <class Socket>
struct uni_socket {
    using socket_type = Socket;
    using executor_type = typename Socket::executor_type;

    uni_socket(aio& io, ssl::context& ctx) requires SslSocketType<Socket> : m_socket(io, ctx) {}

    uni_socket(aio& io) requires RawSocketType<Socket> : m_socket(io) {}

    uni_socket(const uni_socket&) = delete;
    uni_socket& operator=(const uni_socket&) = delete;

    asio::awaitable<void> async_handshake();

    template <typename MutableBufferSequence, typename CompletionToken>
    auto async_read_some(const MutableBufferSequence& buffers, CompletionToken&& token) {
        return m_socket.async_read_some(buffers, std::forward<CompletionToken>(token));
    }

    template <typename ConstBufferSequence, typename CompletionToken>
    auto async_write_some(const ConstBufferSequence& buffers, CompletionToken&& token) {
        return m_socket.async_write_some(buffers, std::forward<CompletionToken>(token));
    }

    void close() noexcept {
        asio::error_code ec;
        lowest_layer().close(ec);
    }

    bool is_open() const {
        return lowest_layer().is_open();
    }

    auto& lowest_layer() {
        return get_lowest_layer(m_socket);
    }
    const auto& lowest_layer() const {
        return get_lowest_layer(m_socket);
    }

    executor_type get_executor() {
        return lowest_layer().get_executor();
    }

private:
    Socket m_socket;
};

template <>
inline asio::awaitable<void> uni_socket<raw_socket>::async_handshake() {
    co_return; // No-op for raw socket
}

template <>
inline asio::awaitable<void> uni_socket<ssl_socket>::async_handshake() {
    co_await m_socket.async_handshake(ssl::stream_base::client, use_awaitable);
    co_return;
}

struct parser_observer {
    virtual ~parser_observer() = default;
    virtual asio::awaitable<void> on_ping() = 0;
    virtual asio::awaitable<void> on_pong() = 0;
    virtual asio::awaitable<void> on_ok() = 0;
    virtual asio::awaitable<void> on_error(string_view err) = 0;
    virtual asio::awaitable<void> on_info(string_view info) = 0;
    virtual asio::awaitable<void> on_message(string_view subject, string_view sid,
                                             optional<string_view> reply_to, std::size_t n) = 0;
    // HMSG: message with headers
    virtual asio::awaitable<void> on_hmessage(string_view subject, string_view sid,
                                              optional<string_view> reply_to,
                                              std::size_t header_len, std::size_t total_len) = 0;
    virtual asio::awaitable<void> consumed(std::size_t n) = 0;
};

struct protocol_parser {
    static asio::awaitable<status> parse_header(std::string& header, std::istream& is,
                                                parser_observer& observer) {
        if (!std::getline(is, header)) {
            co_return status(error_code::protocol_error);
        }

        if (header.size() < 3) {
            co_return status(error_code::invalid_header);
        }

        if (header.back() != '\r') {
            co_return status(error_code::protocol_error);
        }

        header.pop_back();
        auto v = string_view(header);

        switch (v[0]) {
            case 'H': // HMSG subject sid [reply] hdr_len total_len
                if (v.starts_with(protocol::op_hmsg) && v.size() > protocol::op_hmsg.size() && v[protocol::op_hmsg.size()] == ' ') {
                    auto results = split_sv(v.substr(protocol::op_hmsg.size() + 1), protocol::delim);

                    if (results.size() < 4 || results.size() > 5) {
                        co_return status(error_code::invalid_message);
                    }

                    bool has_reply = results.size() == 5;
                    std::size_t hdr_len = 0, total_len = 0;

                    if (!parse_int(results[has_reply ? 3 : 2], hdr_len) ||
                        !parse_int(results[has_reply ? 4 : 3], total_len) || hdr_len > total_len) {
                        co_return status(error_code::parse_error);
                    }

                    optional<string_view> reply_to;
                    if (has_reply) {
                        reply_to = results[2];
                    }
                    co_await observer.on_hmessage(results[0], results[1], reply_to, hdr_len, total_len);
                    co_await observer.consumed(total_len + 2);
                    co_return status();
                }
                break;

            case 'M': // MSG subject sid [reply] len
                if (v.starts_with(protocol::op_msg) && v.size() > protocol::op_msg.size() && v[protocol::op_msg.size()] == ' ') {
                    auto results = split_sv(v.substr(protocol::op_msg.size() + 1), protocol::delim);

                    if (results.size() < 3 || results.size() > 4) {
                        co_return status(error_code::invalid_message);
                    }

                    bool has_reply = results.size() == 4;
                    std::size_t bytes_n = 0;

                    if (!parse_int(results[has_reply ? 3 : 2], bytes_n)) {
                        co_return status(error_code::parse_error);
                    }

                    optional<string_view> reply_to;
                    if (has_reply) {
                        reply_to = results[2];
                    }
                    co_await observer.on_message(results[0], results[1], reply_to, bytes_n);
                    co_await observer.consumed(bytes_n + 2);
                    co_return status();
                }
                break;

            case 'I':
                if (v.starts_with(protocol::op_info)) {
                    auto info_msg = (v.size() > protocol::op_info.size()) ? v.substr(protocol::op_info.size() + 1) : string_view{};
                    co_await observer.on_info(info_msg);
                    co_return status();
                }
                break;

            case 'P':
                if (v == protocol::op_ping) {
                    co_await observer.on_ping();
                    co_return status();
                } else if (v == protocol::op_pong) {
                    co_await observer.on_pong();
                    co_return status();
                }
                break;

            case '+':
                if (v == protocol::op_ok) {
                    co_await observer.on_ok();
                    co_return status();
                }
                break;

            case '-':
                if (v.starts_with(protocol::op_err)) {
                    auto err_msg = (v.size() > protocol::op_err.size()) ? v.substr(protocol::op_err.size() + 1) : string_view{};
                    co_await observer.on_error(err_msg);
                    co_return status();
                }
                break;
        }

        co_return status(error_code::invalid_message);
    }

    // SIMD-accelerated string splitting using StringZilla
    static std::vector<string_view> split_sv(string_view str, string_view delims = " ") {
        std::vector<string_view> output;
        output.reserve(5);

        namespace sz = ashvardanian::stringzilla;
        sz::string_view sz_str(str.data(), str.size());
        sz::string_view sz_delim(delims.data(), delims.size());

        for (auto part : sz_str.split(sz_delim)) {
            if (!part.empty()) {
                output.emplace_back(part.data(), part.size());
            }
        }

        return output;
    }
};

// Server errors after which the server drops the connection
inline bool is_fatal_server_error(string_view err) {
    static constexpr std::array<string_view, 12> fatal = {
        "unknown protocol operation",
        "attempted to connect to route port",
        "authorization violation",
        "authorization timeout",
        "invalid client protocol",
        "maximum control line exceeded",
        "parser error",
        "secure connection - tls required",
        "stale connection",
        "maximum connections exceeded",
        "slow consumer",
        "maximum payload violation",
    };

    std::string text;
    text.reserve(err.size());
    for (char c : err) {
        if (c != '\'') {
            text += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    auto trimmed = string_view(text);
    while (!trimmed.empty() && trimmed.front() == ' ') trimmed.remove_prefix(1);
    while (!trimmed.empty() && trimmed.back() == ' ') trimmed.remove_suffix(1);

    return std::any_of(fatal.begin(), fatal.end(),
                       [trimmed](string_view f) { return trimmed.starts_with(f); });
}

// Physical NATS connection. Runs a reconnecting read loop on the io_context and reports
// its lifecycle through session events:
//   connect     - handshake completed
//   error       - failed attempt, server -ERR or exhausted retries
//   close       - an attempt failed or an established connection was lost
//   offline     - follows close for a lost established connection
//   reconnect   - every attempt after a failure or loss
//   disconnect  - the server reported an error it closes the connection for
//   message     - MSG/HMSG on a subscribed channel
template <class SocketType>
class nats_session : public ibroker_session,
                     public parser_observer,
                     public std::enable_shared_from_this<nats_session<SocketType>> {
public:
    nats_session(aio& io, const connect_config& conf, const std::shared_ptr<ssl::context>& ctx)
        : m_io(io), m_conf(conf), m_ssl_ctx(ctx), m_retry_timer(io) {}

    nats_session(aio& io, const connect_config& conf) : m_io(io), m_conf(conf), m_retry_timer(io) {}

    nats_session(const nats_session&) = delete;
    nats_session& operator=(const nats_session&) = delete;

    void start() override {
        if (m_started || m_stopped) {
            return;
        }
        m_started = true;
        asio::co_spawn(
            m_io, [self = this->shared_from_this()]() -> awaitable<void> { return self->run(); },
            asio::detached);
    }

    void end() noexcept override {
        m_stopped = true;
        m_is_connected = false;
        m_listeners.clear();
        m_retry_timer.cancel();
        if (m_socket) {
            m_socket->close();
        }
    }

    [[nodiscard]] bool is_connected() const noexcept override {
        return m_is_connected;
    }

    void on(session_event event, session_listener listener) override {
        if (m_stopped) {
            return;
        }
        m_listeners.add(event, std::move(listener));
    }

    [[nodiscard]] asio::awaitable<status> subscribe(string_view channel) override {
        if (!m_is_connected) {
            co_return status(error_code::not_connected);
        }

        auto key = std::string(channel);
        if (m_channels.contains(key)) {
            co_return status();
        }

        auto sid = m_next_sid++;
        m_channels.emplace(key, sid);
        m_sids.emplace(sid, key);
        co_return enqueue(fmt::format(fmt::runtime(protocol::sub_fmt), channel, sid));
    }

    [[nodiscard]] asio::awaitable<status> unsubscribe(string_view channel) override {
        auto it = m_channels.find(std::string(channel));
        if (it == m_channels.end()) {
            co_return status(error_code::invalid_argument, fmt::format("not subscribed to {}", channel));
        }

        auto sid = it->second;
        m_sids.erase(sid);
        m_channels.erase(it);

        if (!m_is_connected) {
            co_return status();
        }
        co_return enqueue(fmt::format(fmt::runtime(protocol::unsub_fmt), sid));
    }

    [[nodiscard]] asio::awaitable<status> publish(string_view channel, std::span<const char> payload,
                                                  const headers_t& headers = {}) override {
        if (!m_is_connected) {
            co_return status(error_code::not_connected);
        }

        std::string msg;
        if (headers.empty()) {
            if (m_max_payload > 0 && payload.size() > m_max_payload) {
                co_return status(error_code::message_too_large);
            }
            msg = fmt::format(fmt::runtime(protocol::pub_fmt), channel, payload.size());
        } else {
            if (!m_server_headers) {
                co_return status(error_code::invalid_argument, "server does not support headers");
            }
            auto hdr_data = serialize_headers(headers);
            std::size_t total_len = hdr_data.size() + payload.size();
            if (m_max_payload > 0 && total_len > m_max_payload) {
                co_return status(error_code::message_too_large);
            }
            msg = fmt::format(fmt::runtime(protocol::hpub_fmt), channel, hdr_data.size(), total_len);
            msg += hdr_data;
        }
        msg.append(payload.data(), payload.size());
        msg += protocol::crlf;

        co_return enqueue(std::move(msg));
    }

    [[nodiscard]] std::size_t channel_count() const noexcept {
        return m_channels.size();
    }

private:
    awaitable<void> on_ping() override {
        auto s = enqueue(std::string(protocol::pong));
        if (s.failed()) {
            notify(session_event::error, s);
        }
        co_return;
    }

    awaitable<void> on_pong() override {
        m_awaiting_pong = false;
        co_return;
    }

    awaitable<void> on_ok() override {
        co_return;
    }

    awaitable<void> on_error(string_view err) override {
        auto s = status(error_code::remote_error, std::string(err));
        if (m_handshaking) {
            m_handshake_error = s;
            co_return;
        }

        notify(session_event::error, s);
        if (is_fatal_server_error(err)) {
            notify(session_event::disconnect, s);
        }
        co_return;
    }

    awaitable<void> on_info(string_view info) override {
        fast_json parser;
        if (parser.parse(info)) {
            if (parser.contains("max_payload")) {
                m_max_payload = parser.get_uint("max_payload", m_max_payload);
            }
            m_server_headers = parser.get_bool("headers", m_server_headers);
        } else {
            co_await on_error(fmt::format("failed to parse INFO from server: {}", parser.error()));
        }
        co_return;
    }

    awaitable<void> on_message(string_view subject, string_view sid_str,
                               optional<string_view>, std::size_t n) override {
        co_await fill_buffer(n + 2);
        auto b = m_buf.data();
        deliver(subject, sid_str, std::span<const char>(static_cast<const char*>(b.data()), n), nullptr);
        co_return;
    }

    awaitable<void> on_hmessage(string_view subject, string_view sid_str,
                                optional<string_view>,
                                std::size_t header_len, std::size_t total_len) override {
        co_await fill_buffer(total_len + 2);

        auto b = m_buf.data();
        const char* data_ptr = static_cast<const char*>(b.data());
        auto headers = parse_headers(string_view(data_ptr, header_len));
        deliver(subject, sid_str, std::span<const char>(data_ptr + header_len, total_len - header_len), &headers);
        co_return;
    }

    awaitable<void> consumed(std::size_t n) override {
        m_buf.consume(n);
        co_return;
    }

    // Reads until the buffer holds at least `n` bytes
    awaitable<void> fill_buffer(std::size_t n) {
        auto bytes_to_transfer = static_cast<std::ptrdiff_t>(n) - static_cast<std::ptrdiff_t>(m_buf.size());
        if (bytes_to_transfer > 0) {
            co_await asio::async_read(*m_socket, m_buf,
                                      asio::transfer_at_least(static_cast<std::size_t>(bytes_to_transfer)),
                                      use_awaitable);
        }
    }

    void deliver(string_view subject, string_view sid_str, std::span<const char> payload,
                 const headers_t* headers) {
        uint64_t sid = 0;
        if (!parse_int(sid_str, sid) || !m_sids.contains(sid)) {
            return;
        }

        event_data ev;
        ev.event = session_event::message;
        ev.channel = subject;
        ev.payload = payload;
        ev.headers = headers;
        if (!m_stopped) {
            m_listeners.emit(ev);
        }
    }

    void notify(session_event event, const status& s = {}) {
        if (m_stopped) {
            return;
        }
        event_data ev;
        ev.event = event;
        ev.error = s;
        m_listeners.emit(ev);
    }

    status enqueue(std::string&& line) {
        if (!m_write_queue.enqueue(std::move(line))) {
            return status(error_code::operation_failed, "write queue full");
        }
        schedule_flush();
        return status();
    }

    void schedule_flush() {
        if (m_flush_running || !m_is_connected) {
            return;
        }
        m_flush_running = true;
        asio::co_spawn(
            m_io, [self = this->shared_from_this()]() -> awaitable<void> { return self->flush_loop(); },
            asio::detached);
    }

    // Single writer: drains the queue in batches until it is empty
    awaitable<void> flush_loop() {
        auto socket = m_socket;
        std::string batch;

        while (m_is_connected && socket == m_socket && !m_write_queue.empty()) {
            batch.clear();
            m_write_queue.dequeue_all(batch);

            auto [ec, n] = co_await asio::async_write(*socket, asio::buffer(batch),
                                                      asio::as_tuple(use_awaitable));
            if (ec) {
                // the read loop notices the closed socket and reconnects
                socket->close();
                break;
            }
        }

        m_flush_running = false;
        if (m_is_connected && !m_write_queue.empty()) {
            schedule_flush();
        }
        co_return;
    }

    void reset_socket() {
        if constexpr (SslSocketType<SocketType>) {
            m_socket = std::make_shared<uni_socket<SocketType>>(m_io, *m_ssl_ctx);
        } else {
            m_socket = std::make_shared<uni_socket<SocketType>>(m_io);
        }
        m_buf.consume(m_buf.size());
    }

    awaitable<status> do_connect() {
        reset_socket();
        m_handshaking = true;
        m_handshake_error.reset();
        m_awaiting_pong = true;

        try {
            tcp::resolver res(m_io);
            auto results =
                co_await res.async_resolve(m_conf.address, std::to_string(m_conf.port), use_awaitable);

            co_await asio::async_connect(m_socket->lowest_layer(), results, use_awaitable);

            m_socket->lowest_layer().set_option(asio::ip::tcp::no_delay(true));

            if (m_conf.send_buffer_size > 0) {
                m_socket->lowest_layer().set_option(
                    asio::socket_base::send_buffer_size(m_conf.send_buffer_size));
            }
            if (m_conf.recv_buffer_size > 0) {
                m_socket->lowest_layer().set_option(
                    asio::socket_base::receive_buffer_size(m_conf.recv_buffer_size));
            }

            std::string header;
            co_await asio::async_read_until(*m_socket, m_buf, std::string(protocol::crlf), use_awaitable);
            {
                std::istream is(&m_buf);
                auto s = co_await protocol_parser::parse_header(header, is, *this);
                if (s.failed()) {
                    m_handshaking = false;
                    co_return s;
                }
            }

            co_await m_socket->async_handshake();

            auto connect_line = prepare_info();
            connect_line += protocol::ping;
            co_await asio::async_write(*m_socket, asio::buffer(connect_line), use_awaitable);

            // The server answers the PING once CONNECT is accepted
            while (m_awaiting_pong && !m_handshake_error.has_value()) {
                co_await asio::async_read_until(*m_socket, m_buf, std::string(protocol::crlf), use_awaitable);
                std::istream is(&m_buf);
                auto s = co_await protocol_parser::parse_header(header, is, *this);
                if (s.failed()) {
                    m_handshaking = false;
                    co_return s;
                }
            }

            m_handshaking = false;
            if (m_handshake_error.has_value()) {
                co_return *m_handshake_error;
            }
            co_return status{};
        } catch (const std::system_error& e) {
            m_handshaking = false;
            m_socket->close();
            if (e.code() == asio::error::connection_refused) {
                co_return status(error_code::connection_refused, e.what());
            }
            co_return status(e.what());
        }
    }

    void resubscribe() {
        for (const auto& [channel, sid] : m_channels) {
            auto s = enqueue(fmt::format(fmt::runtime(protocol::sub_fmt), channel, sid));
            if (s.failed()) {
                notify(session_event::error, s);
            }
        }
    }

    asio::awaitable<void> run() {
        std::string header;
        uint32_t retry_delay_ms = m_conf.retry_initial_delay_ms;
        uint32_t retry_count = 0;
        bool retrying = false;

        for (;;) {
            if (m_stopped) {
                co_return;
            }

            if (!m_is_connected) {
                if (retrying) {
                    notify(session_event::reconnect);
                }

                auto s = co_await do_connect();
                if (m_stopped) {
                    co_return;
                }

                if (s.failed()) {
                    notify(session_event::error, s);
                    notify(session_event::close, s);
                    retrying = true;

                    // Check max attempts (0 = unlimited)
                    if (m_conf.retry_max_attempts > 0 && retry_count >= m_conf.retry_max_attempts) {
                        notify(session_event::error,
                               status(error_code::max_reconnects, "max reconnection attempts reached"));
                        co_return;
                    }

                    m_retry_timer.expires_after(std::chrono::milliseconds(retry_delay_ms));
                    auto [ec] = co_await m_retry_timer.async_wait(asio::as_tuple(use_awaitable));
                    if (ec || m_stopped) {
                        co_return;
                    }

                    // Exponential backoff: double delay, cap at max
                    retry_delay_ms = std::min(retry_delay_ms * 2, m_conf.retry_max_delay_ms);
                    retry_count++;
                    continue;
                }

                // Reset backoff on successful connection
                retry_delay_ms = m_conf.retry_initial_delay_ms;
                retry_count = 0;
                retrying = false;

                m_is_connected = true;
                resubscribe();
                notify(session_event::connect);
                continue;
            }

            bool should_disconnect = false;
            try {
                co_await asio::async_read_until(*m_socket, m_buf, std::string(protocol::crlf), use_awaitable);

                std::istream is(&m_buf);
                auto s = co_await protocol_parser::parse_header(header, is, *this);
                if (s.failed()) {
                    continue;
                }
            } catch (const std::system_error&) {
                should_disconnect = true;
            }

            if (should_disconnect) {
                m_is_connected = false;
                m_socket->close();
                m_write_queue.clear();

                if (m_stopped) {
                    co_return;
                }
                notify(session_event::close, status(error_code::connection_lost, "connection lost"));
                notify(session_event::offline);
                retrying = true;
            }
        }
        co_return;
    }

    std::string prepare_info() const {
        constexpr auto lang = "cpp";
        constexpr auto version = "0.1.0";
        json j = {
            {"verbose", m_conf.verbose}, {"pedantic", m_conf.pedantic}, {"name", m_conf.name},
            {"lang", lang},              {"version", version},          {"headers", true},
        };

        if (m_conf.user.has_value()) {
            j["user"] = m_conf.user.value();
        }

        if (m_conf.password.has_value()) {
            j["pass"] = m_conf.password.value();
        }

        if (m_conf.token.has_value()) {
            j["auth_token"] = m_conf.token.value();
        }

        return fmt::format(fmt::runtime(protocol::connect_fmt), j.dump());
    }

    aio& m_io;
    connect_config m_conf;
    std::shared_ptr<ssl::context> m_ssl_ctx;
    std::shared_ptr<uni_socket<SocketType>> m_socket;
    asio::steady_timer m_retry_timer;
    asio::streambuf m_buf;

    listener_registry m_listeners;
    std::unordered_map<std::string, uint64_t> m_channels;
    std::unordered_map<uint64_t, std::string> m_sids;
    uint64_t m_next_sid = 1;

    std::size_t m_max_payload = 0;
    bool m_server_headers = false;
    bool m_started = false;
    bool m_stopped = false;
    bool m_is_connected = false;
    bool m_handshaking = false;
    bool m_awaiting_pong = false;
    optional<status> m_handshake_error;

    write_queue m_write_queue;
    bool m_flush_running = false;
};

inline std::shared_ptr<ssl::context> make_ssl_context(const ssl_config& conf) {
    auto ctx = std::make_shared<ssl::context>(ssl::context::tlsv12_client);
    ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);
    ctx->set_verify_mode(conf.verify ? ssl::verify_peer : ssl::verify_none);

    if (!conf.cert.empty()) {
        ctx->use_certificate(asio::buffer(conf.cert.data(), conf.cert.size()),
                             ssl::context::file_format::pem);
    }

    if (!conf.ca.empty()) {
        ctx->add_certificate_authority(asio::buffer(conf.ca.data(), conf.ca.size()));
    }

    if (!conf.key.empty()) {
        ctx->use_private_key(asio::buffer(conf.key.data(), conf.key.size()),
                             ssl::context::file_format::pem);
    }
    return ctx;
}

inline ibroker_session_sptr create_session(aio& io, const connect_config& conf,
                                           optional<ssl_config> ssl_conf = {}) {
    if (ssl_conf.has_value()) {
        return std::make_shared<nats_session<ssl_socket>>(io, conf, make_ssl_context(ssl_conf.value()));
    }
    return std::make_shared<nats_session<raw_socket>>(io, conf);
}

// Factory for the client: a fresh NATS session on every connect
inline session_factory nats_session_factory(connect_config conf, optional<ssl_config> ssl_conf = {}) {
    return [conf = std::move(conf), ssl_conf = std::move(ssl_conf)](aio& io) {
        return create_session(io, conf, ssl_conf);
    };
}

} // namespace broker_rpc

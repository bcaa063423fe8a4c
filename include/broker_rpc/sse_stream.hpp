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

#include <algorithm>
#include <cstdint>
#include <deque>
#include <fmt/format.h>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "http_adapter.hpp"

namespace broker_rpc {

// One server-sent event before framing
struct message_event {
    std::string data;
    optional<std::string> type;
    optional<uint32_t> retry;
};

namespace sse {
    constexpr string_view content_type = "text/event-stream";
    constexpr string_view error_event = "error";
}

inline std::string to_event_data(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

// Objects carrying `data` keep their event fields; anything else is the data itself
inline message_event to_message_event(const json& value) {
    message_event ev;
    if (value.is_object() && value.contains("data")) {
        ev.data = to_event_data(value["data"]);
        if (value.contains("type") && value["type"].is_string()) {
            ev.type = value["type"].get<std::string>();
        }
        // negative values are dropped, values past uint32 saturate
        if (value.contains("retry") && value["retry"].is_number_integer()) {
            const auto& retry = value["retry"];
            if (retry.is_number_unsigned() || retry.get<int64_t>() >= 0) {
                ev.retry = static_cast<uint32_t>(
                    std::min<uint64_t>(retry.get<uint64_t>(), std::numeric_limits<uint32_t>::max()));
            }
        }
        return ev;
    }
    ev.data = to_event_data(value);
    return ev;
}

// Frames `ev` as "event:"? "id:" "retry:"? then one "data:" line per line of data,
// terminated by a blank line.
inline std::string format_event(const message_event& ev, uint64_t id) {
    std::string out;
    if (ev.type.has_value()) {
        out += fmt::format("event: {}\n", *ev.type);
    }
    out += fmt::format("id: {}\n", id);
    if (ev.retry.has_value()) {
        out += fmt::format("retry: {}\n", *ev.retry);
    }

    string_view rest(ev.data);
    for (;;) {
        auto pos = rest.find_first_of("\r\n");
        out += "data: ";
        out.append(rest.substr(0, pos));
        out += '\n';
        if (pos == string_view::npos) {
            break;
        }
        auto skip = (rest[pos] == '\r' && pos + 1 < rest.size() && rest[pos + 1] == '\n') ? 2 : 1;
        rest.remove_prefix(pos + skip);
    }
    out += '\n';
    return out;
}

// Writes framed events to a response, one at a time. When the response pushes back,
// frames wait in a queue behind a single drain registration.
class sse_stream : public std::enable_shared_from_this<sse_stream> {
public:
    explicit sse_stream(iresponse_sptr response) : m_response(std::move(response)) {}

    sse_stream(const sse_stream&) = delete;
    sse_stream& operator=(const sse_stream&) = delete;

    // Returns the id given to the frame, 0 once the stream is closing
    uint64_t write_message(const message_event& ev) {
        if (m_end_requested) {
            return 0;
        }
        auto id = m_next_event_id++;
        m_queue.push_back(format_event(ev, id));
        flush();
        return id;
    }

    // Ends the response once queued frames are written
    void end() {
        m_end_requested = true;
        flush();
    }

    // Consumer went away: drop pending frames and the drain registration
    void abort() {
        m_end_requested = true;
        m_queue.clear();
        if (m_drain_listener.has_value()) {
            m_response->remove_drain_listener(*m_drain_listener);
            m_drain_listener.reset();
        }
        finish();
    }

    [[nodiscard]] uint64_t next_event_id() const noexcept {
        return m_next_event_id;
    }

    [[nodiscard]] std::size_t queued() const noexcept {
        return m_queue.size();
    }

    [[nodiscard]] bool waiting_for_drain() const noexcept {
        return m_drain_listener.has_value();
    }

private:
    void flush() {
        while (!m_drain_listener.has_value() && !m_queue.empty()) {
            auto frame = std::move(m_queue.front());
            m_queue.pop_front();

            if (!m_response->write(frame)) {
                std::weak_ptr<sse_stream> weak = weak_from_this();
                m_drain_listener = m_response->once_drain([weak]() {
                    if (auto self = weak.lock()) {
                        self->m_drain_listener.reset();
                        self->flush();
                    }
                });
            }
        }

        if (m_end_requested && m_queue.empty() && !m_drain_listener.has_value()) {
            finish();
        }
    }

    void finish() {
        if (m_finished) {
            return;
        }
        m_finished = true;
        if (!m_response->ended()) {
            m_response->end();
        }
    }

    iresponse_sptr m_response;
    uint64_t m_next_event_id = 1;
    std::deque<std::string> m_queue;
    optional<uint64_t> m_drain_listener;
    bool m_end_requested = false;
    bool m_finished = false;
};

} // namespace broker_rpc

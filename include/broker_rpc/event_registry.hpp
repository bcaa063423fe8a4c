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

#include <array>
#include <magic_enum/magic_enum.hpp>
#include <utility>
#include <vector>

#include "interface.hpp"

namespace broker_rpc {

// Listener table keyed by the closed set of session events
class listener_registry {
public:
    void add(session_event event, session_listener listener) {
        slot(event).push_back(std::move(listener));
    }

    // Listeners added while emitting are not called for the current event
    void emit(const event_data& ev) const {
        auto snapshot = m_listeners[index(ev.event)];
        for (auto& listener : snapshot) {
            listener(ev);
        }
    }

    [[nodiscard]] std::size_t count(session_event event) const noexcept {
        return m_listeners[index(event)].size();
    }

    void clear() {
        for (auto& list : m_listeners) {
            list.clear();
        }
    }

private:
    static constexpr std::size_t index(session_event event) noexcept {
        return *magic_enum::enum_index(event);
    }

    std::vector<session_listener>& slot(session_event event) {
        return m_listeners[index(event)];
    }

    std::array<std::vector<session_listener>, magic_enum::enum_count<session_event>()> m_listeners;
};

// Listeners registered before a physical session exists. Drained once, in
// registration order, right after the session is created.
class pending_listener_queue {
public:
    void push(session_event event, session_listener listener) {
        m_pending.emplace_back(event, std::move(listener));
    }

    void drain_into(ibroker_session& session) {
        auto pending = std::move(m_pending);
        m_pending.clear();
        for (auto& [event, listener] : pending) {
            session.on(event, std::move(listener));
        }
    }

    [[nodiscard]] bool empty() const noexcept {
        return m_pending.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_pending.size();
    }

    void clear() {
        m_pending.clear();
    }

private:
    std::vector<std::pair<session_event, session_listener>> m_pending;
};

} // namespace broker_rpc

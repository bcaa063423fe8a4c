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
#include <asio/post.hpp>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "interface.hpp"

namespace broker_rpc {

// Shared, settle-once outcome of a connect attempt. Copies refer to the same state, so
// two handles compare equal when they observe the same attempt. A rejected future keeps
// its error until someone asks for it; nothing is raised on its own.
class connect_future {
public:
    using continuation = std::function<void(const status&)>;

    connect_future() : m_state(std::make_shared<state>()) {}

    static connect_future resolved() {
        connect_future f;
        f.settle(status());
        return f;
    }

    static connect_future rejected(const status& s) {
        connect_future f;
        f.settle(s);
        return f;
    }

    // First settlement wins; returns false if the future was already settled
    bool settle(const status& s) {
        if (m_state->settled) {
            return false;
        }
        m_state->settled = true;
        m_state->result = s;

        auto waiters = std::move(m_state->waiters);
        m_state->waiters.clear();
        for (auto& w : waiters) {
            w(s);
        }
        return true;
    }

    [[nodiscard]] bool ready() const noexcept {
        return m_state->settled;
    }

    // Outcome of a settled future; not_connected while still pending
    [[nodiscard]] status result() const {
        if (!m_state->settled) {
            return status(error_code::not_connected, "connection attempt still pending");
        }
        return m_state->result;
    }

    // Runs `cb` once settled, immediately if that already happened
    void then(continuation cb) const {
        if (m_state->settled) {
            cb(m_state->result);
            return;
        }
        m_state->waiters.push_back(std::move(cb));
    }

    // Completion signature: void(status)
    template <typename CompletionToken>
    auto async_wait(CompletionToken&& token) const {
        return asio::async_initiate<CompletionToken, void(status)>(
            [state = m_state](auto handler) {
                using handler_t = std::decay_t<decltype(handler)>;
                auto h = std::make_shared<handler_t>(std::move(handler));
                auto complete = [h](const status& s) {
                    auto ex = asio::get_associated_executor(*h);
                    asio::post(ex, [h, s]() { std::move(*h)(s); });
                };

                if (state->settled) {
                    complete(state->result);
                } else {
                    state->waiters.push_back(std::move(complete));
                }
            },
            token);
    }

    [[nodiscard]] bool operator==(const connect_future& other) const noexcept {
        return m_state == other.m_state;
    }

private:
    struct state {
        bool settled = false;
        status result;
        std::vector<continuation> waiters;
    };

    std::shared_ptr<state> m_state;
};

// One notification source taking part in a race
struct race_source {
    session_event event;
    std::function<status(const event_data&)> outcome;
};

// Merges several session notifications and settles the returned future with the
// outcome of whichever fires first. Later notifications from any source are ignored.
inline connect_future take_first(ibroker_session& session, std::vector<race_source> sources) {
    connect_future winner;
    for (auto& src : sources) {
        session.on(src.event, [winner, outcome = std::move(src.outcome)](const event_data& ev) mutable {
            if (!winner.ready()) {
                winner.settle(outcome(ev));
            }
        });
    }
    return winner;
}

} // namespace broker_rpc

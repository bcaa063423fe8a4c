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

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "interface.hpp"

namespace broker_rpc {

// Callbacks of a push-sequence consumer. Any of them may be empty.
template <typename T>
struct observer {
    std::function<void(const T&)> on_next;
    std::function<void(const status&)> on_error;
    std::function<void()> on_complete;
};

namespace detail {

struct subscription_core {
    virtual ~subscription_core() = default;

    // Marks the subscription closed; false if it already was
    bool close() noexcept {
        if (closed) {
            return false;
        }
        closed = true;
        return true;
    }

    // Runs teardowns once and lets go of the observer
    void finalize() {
        auto pending = std::move(teardowns);
        teardowns.clear();
        for (auto& fn : pending) {
            fn();
        }
        release();
    }

    bool closed = false;
    std::vector<teardown_fn> teardowns;

protected:
    virtual void release() {}
};

template <typename T>
struct subscriber_state : subscription_core {
    observer<T> obs;

protected:
    void release() override {
        obs = {};
    }
};

} // namespace detail

// Consumer-side handle of a running push-sequence
class subscription {
public:
    subscription() = default;

    explicit subscription(std::shared_ptr<detail::subscription_core> core) : m_core(std::move(core)) {}

    // Idempotent; safe after the sequence completed or failed
    void unsubscribe() {
        if (m_core && m_core->close()) {
            m_core->finalize();
        }
    }

    [[nodiscard]] bool closed() const noexcept {
        return !m_core || m_core->closed;
    }

private:
    std::shared_ptr<detail::subscription_core> m_core;
};

// Producer-side handle. Emissions after completion, failure or unsubscribe are dropped.
template <typename T>
class subscriber {
public:
    explicit subscriber(std::shared_ptr<detail::subscriber_state<T>> state) : m_state(std::move(state)) {}

    void next(const T& value) const {
        if (m_state->closed) {
            return;
        }
        auto cb = m_state->obs.on_next;
        if (cb) {
            cb(value);
        }
    }

    void error(const status& s) const {
        if (!m_state->close()) {
            return;
        }
        auto cb = m_state->obs.on_error;
        if (cb) {
            cb(s);
        }
        m_state->finalize();
    }

    void complete() const {
        if (!m_state->close()) {
            return;
        }
        auto cb = m_state->obs.on_complete;
        if (cb) {
            cb();
        }
        m_state->finalize();
    }

    [[nodiscard]] bool closed() const noexcept {
        return m_state->closed;
    }

    // Cleanup for when the subscription ends; runs at once if it already has
    void add_teardown(teardown_fn fn) const {
        if (m_state->closed) {
            fn();
            return;
        }
        m_state->teardowns.push_back(std::move(fn));
    }

private:
    std::shared_ptr<detail::subscriber_state<T>> m_state;
};

// Cold sequence of values over time. The producer runs once per subscribe() and may
// emit synchronously or later; it ends with complete() or error().
template <typename T>
class push_sequence {
public:
    using value_type = T;
    using producer_fn = std::function<void(subscriber<T>)>;

    explicit push_sequence(producer_fn producer) : m_producer(std::move(producer)) {}

    subscription subscribe(observer<T> obs) const {
        auto state = std::make_shared<detail::subscriber_state<T>>();
        state->obs = std::move(obs);
        subscriber<T> sub(state);

        try {
            m_producer(sub);
        } catch (const std::exception& e) {
            sub.error(status(error_code::producer_error, e.what()));
        }
        return subscription(state);
    }

    template <typename F>
    auto map(F f) const {
        using U = std::decay_t<std::invoke_result_t<F&, const T&>>;
        auto source = *this;
        return push_sequence<U>([source, f](subscriber<U> out) {
            auto inner = source.subscribe(observer<T>{
                [out, f](const T& v) {
                    try {
                        out.next(f(v));
                    } catch (const std::exception& e) {
                        out.error(status(error_code::producer_error, e.what()));
                    }
                },
                [out](const status& s) { out.error(s); },
                [out]() { out.complete(); }});
            out.add_teardown([inner]() mutable { inner.unsubscribe(); });
        });
    }

    static push_sequence of(std::vector<T> values) {
        return push_sequence([values = std::move(values)](subscriber<T> sub) {
            for (const auto& v : values) {
                if (sub.closed()) {
                    return;
                }
                sub.next(v);
            }
            sub.complete();
        });
    }

    static push_sequence fail(status s) {
        return push_sequence([s](subscriber<T> sub) { sub.error(s); });
    }

private:
    producer_fn m_producer;
};

// Hot multicast source: values pushed through next() reach the current subscribers
template <typename T>
class sequence_subject {
public:
    sequence_subject() : m_state(std::make_shared<state>()) {}

    [[nodiscard]] push_sequence<T> sequence() const {
        auto st = m_state;
        return push_sequence<T>([st](subscriber<T> sub) {
            if (st->done) {
                if (st->failure.has_value()) {
                    sub.error(*st->failure);
                } else {
                    sub.complete();
                }
                return;
            }

            auto id = st->next_id++;
            st->subscribers.emplace(id, sub);
            std::weak_ptr<state> weak = st;
            sub.add_teardown([weak, id]() {
                if (auto s = weak.lock()) {
                    s->subscribers.erase(id);
                }
            });
        });
    }

    void next(const T& value) {
        for (auto& sub : snapshot()) {
            sub.next(value);
        }
    }

    void error(const status& s) {
        if (m_state->done) {
            return;
        }
        m_state->done = true;
        m_state->failure = s;
        for (auto& sub : snapshot()) {
            sub.error(s);
        }
    }

    void complete() {
        if (m_state->done) {
            return;
        }
        m_state->done = true;
        for (auto& sub : snapshot()) {
            sub.complete();
        }
    }

    [[nodiscard]] std::size_t observer_count() const noexcept {
        return m_state->subscribers.size();
    }

private:
    struct state {
        bool done = false;
        std::optional<status> failure;
        uint64_t next_id = 0;
        std::map<uint64_t, subscriber<T>> subscribers;
    };

    std::vector<subscriber<T>> snapshot() const {
        std::vector<subscriber<T>> out;
        out.reserve(m_state->subscribers.size());
        for (const auto& [id, sub] : m_state->subscribers) {
            out.push_back(sub);
        }
        return out;
    }

    std::shared_ptr<state> m_state;
};

} // namespace broker_rpc

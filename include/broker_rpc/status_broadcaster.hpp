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
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace broker_rpc {

// Multi-subscriber broadcaster that remembers the latest value. A new subscriber is
// handed the current value (if any) right away, so late observers never miss it.
template <typename T>
class latest_value_broadcaster {
public:
    using listener = std::function<void(const T&)>;
    using token = uint64_t;

    latest_value_broadcaster() = default;

    explicit latest_value_broadcaster(T initial) : m_value(std::move(initial)) {}

    token subscribe(listener cb) {
        auto id = m_next_token++;
        m_listeners.emplace(id, cb);
        if (m_value.has_value()) {
            cb(*m_value);
        }
        return id;
    }

    void unsubscribe(token id) {
        m_listeners.erase(id);
    }

    void next(const T& value) {
        m_value = value;

        // listeners may subscribe or unsubscribe while being notified
        std::vector<listener> snapshot;
        snapshot.reserve(m_listeners.size());
        for (const auto& [id, cb] : m_listeners) {
            snapshot.push_back(cb);
        }
        for (auto& cb : snapshot) {
            cb(value);
        }
    }

    [[nodiscard]] std::optional<T> current() const {
        return m_value;
    }

    [[nodiscard]] std::size_t subscriber_count() const noexcept {
        return m_listeners.size();
    }

private:
    std::optional<T> m_value;
    std::map<token, listener> m_listeners;
    token m_next_token = 1;
};

} // namespace broker_rpc

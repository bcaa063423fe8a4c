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

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "interface.hpp"

namespace broker_rpc {

// Reference counts of live reply-channel subscriptions.
//
// A channel is subscribed on its 0 -> 1 transition and unsubscribed on 1 -> 0. While
// the broker has not yet acknowledged the subscribe, further acquirers queue behind it
// instead of issuing a second subscribe, so each channel has at most one broker
// subscription. Counts never go below zero.
class subscription_ledger {
public:
    using ready_cb = std::function<void(const status&)>;

    // Registers interest in `channel`. `on_ready` runs once the channel is usable (or
    // the subscribe failed); on success the acquirer holds one reference.
    // Returns true when the caller must issue the broker subscribe and report the
    // outcome through settle().
    [[nodiscard]] bool acquire(const std::string& channel, ready_cb on_ready) {
        auto& e = m_entries[channel];

        if (e.subscribing) {
            e.waiters.push_back(std::move(on_ready));
            return false;
        }

        if (e.refcount > 0) {
            ++e.refcount;
            on_ready(status());
            return false;
        }

        e.subscribing = true;
        e.waiters.push_back(std::move(on_ready));
        return true;
    }

    // Completes an in-flight subscribe for `channel`
    void settle(const std::string& channel, const status& s) {
        auto it = m_entries.find(channel);
        if (it == m_entries.end() || !it->second.subscribing) {
            return;
        }

        auto waiters = std::move(it->second.waiters);
        it->second.waiters.clear();
        it->second.subscribing = false;

        if (s.failed()) {
            if (it->second.refcount <= 0) {
                m_entries.erase(it);
            }
        } else {
            it->second.refcount += static_cast<int>(waiters.size());
        }

        for (auto& w : waiters) {
            w(s);
        }
    }

    // Drops one reference. Returns true when the caller must issue the broker
    // unsubscribe (the count returned to zero).
    [[nodiscard]] bool release(const std::string& channel) {
        auto it = m_entries.find(channel);
        if (it == m_entries.end() || it->second.refcount <= 0) {
            return false;
        }

        if (--it->second.refcount > 0) {
            return false;
        }

        if (it->second.waiters.empty() && !it->second.subscribing) {
            m_entries.erase(it);
        }
        return true;
    }

    [[nodiscard]] int count(const std::string& channel) const {
        auto it = m_entries.find(channel);
        return it == m_entries.end() ? 0 : it->second.refcount;
    }

    [[nodiscard]] bool subscribing(const std::string& channel) const {
        auto it = m_entries.find(channel);
        return it != m_entries.end() && it->second.subscribing;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_entries.size();
    }

    // Fails every in-flight subscribe with `s` and forgets all channels
    void reset(const status& s) {
        auto entries = std::move(m_entries);
        m_entries.clear();
        for (auto& [channel, e] : entries) {
            for (auto& w : e.waiters) {
                w(s);
            }
        }
    }

private:
    struct entry {
        int refcount = 0;
        bool subscribing = false;
        std::vector<ready_cb> waiters;
    };

    std::unordered_map<std::string, entry> m_entries;
};

} // namespace broker_rpc

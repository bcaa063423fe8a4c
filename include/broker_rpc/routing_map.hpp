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

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "interface.hpp"

namespace broker_rpc {

// Request id -> pending caller. An entry lives until the caller's teardown removes it;
// once a terminal response was delivered the entry stays but receives nothing more.
class routing_map {
public:
    void add(const std::string& id, response_cb cb) {
        m_entries.insert_or_assign(id, entry{std::move(cb), false});
    }

    bool remove(const std::string& id) {
        return m_entries.erase(id) > 0;
    }

    [[nodiscard]] bool contains(const std::string& id) const {
        return m_entries.find(id) != m_entries.end();
    }

    // Delivers `response` to the caller registered under `id`. Returns false for an
    // unknown id or one that already got its terminal response.
    bool dispatch(const std::string& id, const incoming_response& response) {
        auto it = m_entries.find(id);
        if (it == m_entries.end() || it->second.disposed) {
            return false;
        }

        write_packet out;
        out.err = response.err;
        out.response = response.response;
        if (response.is_disposed || response.err.has_value()) {
            out.is_disposed = true;
            it->second.disposed = true;
        }

        // the callback may tear the entry down while running
        auto cb = it->second.cb;
        cb(out);
        return true;
    }

    // Removes every entry and hands back their callbacks
    std::vector<response_cb> drain() {
        std::vector<response_cb> out;
        out.reserve(m_entries.size());
        for (auto& [id, e] : m_entries) {
            if (!e.disposed) {
                out.push_back(std::move(e.cb));
            }
        }
        m_entries.clear();
        return out;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_entries.size();
    }

private:
    struct entry {
        response_cb cb;
        bool disposed = false;
    };

    std::unordered_map<std::string, entry> m_entries;
};

} // namespace broker_rpc

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

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <broker_rpc/http_adapter.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <spdlog/spdlog.h>

namespace rpc_tool {

// Response body goes to stdout. Reports back-pressure after `high_water` bytes and
// signals drain on the next loop iteration.
class stdout_response : public broker_rpc::iresponse {
public:
    stdout_response(asio::io_context& ioc, std::size_t high_water = 16 * 1024)
        : m_ioc(ioc), m_high_water(high_water) {}

    bool write(broker_rpc::string_view chunk) override {
        std::cout.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::cout.flush();
        m_buffered += chunk.size();
        if (m_buffered < m_high_water) {
            return true;
        }

        if (!m_drain_scheduled) {
            m_drain_scheduled = true;
            asio::post(m_ioc, [this]() { drain(); });
        }
        return false;
    }

    void end() override {
        if (m_ended) {
            return;
        }
        m_ended = true;
        if (m_on_end) {
            m_on_end();
        }
    }

    // Runs once when the response ends
    void on_end(std::function<void()> cb) {
        m_on_end = std::move(cb);
    }

    [[nodiscard]] bool ended() const noexcept override {
        return m_ended;
    }

    uint64_t once_drain(std::function<void()> cb) override {
        auto id = m_next_id++;
        m_drain_listeners.emplace(id, std::move(cb));
        return id;
    }

    void remove_drain_listener(uint64_t id) override {
        m_drain_listeners.erase(id);
    }

private:
    void drain() {
        m_drain_scheduled = false;
        m_buffered = 0;
        auto listeners = std::move(m_drain_listeners);
        m_drain_listeners.clear();
        for (auto& [id, cb] : listeners) {
            cb();
        }
    }

    asio::io_context& m_ioc;
    std::size_t m_high_water;
    std::size_t m_buffered = 0;
    bool m_drain_scheduled = false;
    bool m_ended = false;
    uint64_t m_next_id = 1;
    std::map<uint64_t, std::function<void()>> m_drain_listeners;
    std::function<void()> m_on_end;
};

// The terminal session standing in for the HTTP client
class terminal_request : public broker_rpc::irequest {
public:
    void on_close(std::function<void()> cb) override {
        m_close_listeners.push_back(std::move(cb));
    }

    void close() {
        auto listeners = std::move(m_close_listeners);
        m_close_listeners.clear();
        for (auto& cb : listeners) {
            cb();
        }
    }

private:
    std::vector<std::function<void()>> m_close_listeners;
};

// Status line and headers are logged; bodies are written to stdout
class console_adapter : public broker_rpc::ihttp_adapter {
public:
    explicit console_adapter(std::shared_ptr<spdlog::logger> log) : m_log(std::move(log)) {}

    void reply(broker_rpc::iresponse& response, const broker_rpc::json& body,
               broker_rpc::optional<int> status_code) override {
        if (status_code.has_value()) {
            set_status(response, *status_code);
        }
        auto text = body.dump();
        (void)response.write(text);
        response.end();
    }

    void set_status(broker_rpc::iresponse&, int status_code) override {
        m_log->debug("status {}", status_code);
    }

    void set_header(broker_rpc::iresponse&, broker_rpc::string_view name, broker_rpc::string_view value) override {
        m_log->debug("{}: {}", name, value);
    }

    void redirect(broker_rpc::iresponse& response, int status_code, broker_rpc::string_view url) override {
        m_log->info("redirect {} {}", status_code, url);
        response.end();
    }

    void render(broker_rpc::iresponse& response, broker_rpc::string_view view, const broker_rpc::json& options) override {
        m_log->info("render {} with {}", view, options.dump());
        response.end();
    }

private:
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace rpc_tool

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

#include "../include/console_http.hpp"
#include "../include/worker.hpp"
#include <asio/signal_set.hpp>
#include <broker_rpc/broker_rpc.hpp>
#include <csignal>
#include <optional>
#include <string>

namespace rpc_tool {

// Sends one request and streams the responses to stdout as server-sent events
class sse_printer : public worker {
public:
    sse_printer(asio::io_context& ioc, std::shared_ptr<spdlog::logger>& console,
                broker_rpc::client& transport, const std::string& pattern, const broker_rpc::json& data,
                std::optional<broker_rpc::record_options> options)
        : worker(ioc, console, transport), m_pattern(pattern), m_data(data), m_options(std::move(options)),
          m_adapter(console), m_controller(m_adapter, console), m_response(std::make_shared<stdout_response>(ioc)),
          m_signals(ioc, SIGINT, SIGTERM) {}

    void start() override {
        // stop waiting for a signal once the stream is over
        m_response->on_end([this]() { m_signals.cancel(); });

        m_signals.async_wait([this](const asio::error_code& ec, int) {
            if (!ec) {
                m_request.close();
            }
            finish();
        });

        broker_rpc::handler_result result = m_client.send(m_pattern, m_data, m_options);
        m_sub = m_controller.sse(result, m_response, m_request);
    }

private:
    std::string m_pattern;
    broker_rpc::json m_data;
    std::optional<broker_rpc::record_options> m_options;
    console_adapter m_adapter;
    broker_rpc::response_controller m_controller;
    std::shared_ptr<stdout_response> m_response;
    terminal_request m_request;
    asio::signal_set m_signals;
    broker_rpc::subscription m_sub;
};

} // namespace rpc_tool

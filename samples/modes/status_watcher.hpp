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

#include "../include/worker.hpp"
#include <broker_rpc/broker_rpc.hpp>
#include <magic_enum/magic_enum.hpp>

namespace rpc_tool {

// Prints connection status transitions until interrupted
class status_watcher : public worker {
public:
    status_watcher(asio::io_context& ioc, std::shared_ptr<spdlog::logger>& console,
                   broker_rpc::client& transport)
        : worker(ioc, console, transport) {}

    ~status_watcher() override {
        m_client.status_stream().unsubscribe(m_token);
    }

    void start() override {
        m_token = m_client.status_stream().subscribe([this](broker_rpc::connection_status s) {
            m_counter++;
            m_log->info("status: {}", magic_enum::enum_name(s));
        });

        m_client.connect().then([this](const broker_rpc::status& s) {
            if (s.failed()) {
                m_log->warn("initial connect failed: {}", s.error());
            }
        });
    }

private:
    broker_rpc::latest_value_broadcaster<broker_rpc::connection_status>::token m_token = 0;
};

} // namespace rpc_tool

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
#include <iostream>
#include <optional>
#include <string>

namespace rpc_tool {

// Sends one request and prints every response until the last one
class requester : public worker {
public:
    requester(asio::io_context& ioc, std::shared_ptr<spdlog::logger>& console,
              broker_rpc::client& transport, const std::string& pattern, const broker_rpc::json& data,
              std::optional<broker_rpc::record_options> options)
        : worker(ioc, console, transport), m_pattern(pattern), m_data(data), m_options(std::move(options)) {}

    void start() override {
        m_sub = m_client.send(m_pattern, m_data, m_options)
                    .subscribe(broker_rpc::observer<broker_rpc::json>{
                        [this](const broker_rpc::json& response) {
                            m_counter++;
                            std::cout << response.dump() << std::endl;
                        },
                        [this](const broker_rpc::status& s) {
                            m_log->error("request failed: {}", s.error());
                            finish();
                        },
                        [this]() {
                            m_log->info("Requester finished, {} responses received", m_counter);
                            finish();
                        }});
    }

private:
    std::string m_pattern;
    broker_rpc::json m_data;
    std::optional<broker_rpc::record_options> m_options;
    broker_rpc::subscription m_sub;
};

} // namespace rpc_tool

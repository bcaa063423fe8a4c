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

#include "interface.hpp"

namespace broker_rpc {

// Outgoing side of an HTTP exchange, as seen by the response controller
struct iresponse {
    virtual ~iresponse() = default;

    // Queues `chunk`. Returns false when the buffer is full; the writer should hold off
    // until a drain notification.
    [[nodiscard]] virtual bool write(string_view chunk) = 0;

    virtual void end() = 0;

    [[nodiscard]] virtual bool ended() const noexcept = 0;

    // One-shot drain notification; the returned id cancels it
    virtual uint64_t once_drain(std::function<void()> cb) = 0;

    virtual void remove_drain_listener(uint64_t id) = 0;
};
using iresponse_sptr = std::shared_ptr<iresponse>;

// Incoming side of an HTTP exchange
struct irequest {
    virtual ~irequest() = default;

    // Called once the client connection goes away
    virtual void on_close(std::function<void()> cb) = 0;
};

enum class request_method { get, post, put, del, patch, all, options, head, search };

struct redirect_response {
    optional<int> status_code;
    std::string url;
};

// Framework-specific reply primitives
struct ihttp_adapter {
    virtual ~ihttp_adapter() = default;

    virtual void reply(iresponse& response, const json& body, optional<int> status_code) = 0;

    virtual void set_status(iresponse& response, int status_code) = 0;

    virtual void set_header(iresponse& response, string_view name, string_view value) = 0;

    virtual void redirect(iresponse& response, int status_code, string_view url) = 0;

    virtual void render(iresponse& response, string_view view, const json& options) = 0;
};

} // namespace broker_rpc

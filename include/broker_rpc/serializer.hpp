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

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "interface.hpp"

namespace broker_rpc {

class serialization_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// String patterns route as is; structured patterns route by their compact dump, whose
// object keys come out sorted.
inline std::string normalize_pattern(const json& pattern) {
    if (pattern.is_string()) {
        return pattern.get<std::string>();
    }
    return pattern.dump();
}

// Human readable form of a remote `err` field
inline std::string error_to_string(const json& err) {
    if (err.is_string()) {
        return err.get<std::string>();
    }
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
    }
    return err.dump();
}

// Client-wide properties first, request headers override entries with the same name
inline headers_t merge_headers(const headers_t& defaults, const optional<record_options>& options) {
    headers_t merged = defaults;
    if (!options.has_value()) {
        return merged;
    }

    for (const auto& [key, value] : options->headers) {
        auto it = std::find_if(merged.begin(), merged.end(),
                               [&key](const auto& h) { return h.first == key; });
        if (it != merged.end()) {
            it->second = value;
        } else {
            merged.emplace_back(key, value);
        }
    }
    return merged;
}

// Default wire format: {"id"?, "pattern", "data"} with record options split off
class json_record_serializer : public iserializer {
public:
    [[nodiscard]] serialized_record serialize(const packet& p) override {
        if (p.data.is_discarded() || p.pattern.is_discarded()) {
            throw serialization_error("packet holds a discarded JSON value");
        }

        serialized_record out;
        out.body = json::object();
        if (p.id.has_value()) {
            out.body["id"] = *p.id;
        }
        out.body["pattern"] = p.pattern;
        out.body["data"] = p.data;
        out.options = p.options;
        return out;
    }
};

// Accepts both correlated envelopes ({"id", "err"?, "response"?, "isDisposed"?}) and
// bare values from external producers, which are treated as a single terminal response.
class incoming_response_deserializer : public ideserializer {
public:
    [[nodiscard]] incoming_response deserialize(const json& value) override {
        if (is_external(value)) {
            return map_to_schema(value);
        }

        incoming_response r;
        r.id = read_id(value);
        if (value.contains("err") && !value["err"].is_null()) {
            r.err = value["err"];
        }
        if (value.contains("response")) {
            r.response = value["response"];
        }
        if (value.contains("isDisposed")) {
            const auto& d = value["isDisposed"];
            r.is_disposed = d.is_boolean() ? d.get<bool>() : !d.is_null();
        }
        return r;
    }

private:
    static bool is_external(const json& value) {
        if (!value.is_object()) {
            return true;
        }
        return !(value.contains("err") || value.contains("response") || value.contains("isDisposed"));
    }

    static incoming_response map_to_schema(const json& value) {
        incoming_response r;
        r.id = read_id(value);
        r.response = value;
        r.is_disposed = true;
        return r;
    }

    static optional<std::string> read_id(const json& value) {
        if (value.is_object() && value.contains("id") && value["id"].is_string()) {
            return value["id"].get<std::string>();
        }
        return std::nullopt;
    }
};

// Fluent helper for packets that carry broker properties
class record_builder {
public:
    record_builder() = default;

    explicit record_builder(json data) : m_data(std::move(data)) {}

    record_builder& set_data(json data) {
        m_data = std::move(data);
        return *this;
    }

    record_builder& set_headers(headers_t headers) {
        m_options.headers = std::move(headers);
        return *this;
    }

    record_builder& add_header(std::string name, std::string value) {
        m_options.headers.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    [[nodiscard]] packet build(json pattern) const {
        packet p;
        p.pattern = std::move(pattern);
        p.data = m_data;
        if (!m_options.headers.empty()) {
            p.options = m_options;
        }
        return p;
    }

private:
    json m_data;
    record_options m_options;
};

} // namespace broker_rpc

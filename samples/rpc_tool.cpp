#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <asio/io_context.hpp>
#include <broker_rpc/broker_rpc.hpp>
#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "include/worker.hpp"
#include "modes/emitter.hpp"
#include "modes/requester.hpp"
#include "modes/sse_printer.hpp"
#include "modes/status_watcher.hpp"

using rpc_tool::emitter;
using rpc_tool::requester;
using rpc_tool::sse_printer;
using rpc_tool::status_watcher;
using rpc_tool::worker;

const std::string req_mode("req");
const std::string emit_mode("emit");
const std::string watch_mode("watch");
const std::string sse_mode("sse");

std::string read_file(const std::shared_ptr<spdlog::logger>& console, const std::string& path) {
    try {
        if (path.empty()) {
            return {};
        }

        std::ifstream t(path);
        std::string str((std::istreambuf_iterator<char>(t)), std::istreambuf_iterator<char>());
        return str;
    } catch (const std::exception& e) {
        console->error("failed to read file {}, with error: {}", path, e.what());
    }

    return {};
}

// Patterns and data are taken as JSON when they parse, as plain strings otherwise
broker_rpc::json parse_json_arg(const std::string& arg) {
    auto j = broker_rpc::json::parse(arg, nullptr, false);
    if (j.is_discarded()) {
        return broker_rpc::json(arg);
    }
    return j;
}

std::optional<broker_rpc::record_options> parse_header_args(const std::shared_ptr<spdlog::logger>& console,
                                                            const std::vector<std::string>& args) {
    if (args.empty()) {
        return std::nullopt;
    }

    broker_rpc::record_options options;
    for (const auto& arg : args) {
        auto pos = arg.find(':');
        if (pos == std::string::npos || pos == 0) {
            console->warn("ignoring malformed header '{}', expected Key:Value", arg);
            continue;
        }
        auto value = arg.substr(pos + 1);
        if (!value.empty() && value.front() == ' ') {
            value.erase(0, 1);
        }
        options.headers.emplace_back(arg.substr(0, pos), value);
    }
    return options;
}

int main(int argc, char* argv[]) {
    try {
        cxxopts::Options options(argv[0], " - request/response over NATS");
        broker_rpc::connect_config conf;
        broker_rpc::ssl_config ssl_conf;
        ssl_conf.verify = true;
        std::string username;
        std::string password;
        std::string token;
        std::string mode;
        std::string pattern;
        std::string data = "null";
        std::string ssl_key_file;
        std::string ssl_cert_file;
        std::string ssl_ca_file;
        /* clang-format off */
        options.add_options()
        ("h,help", "Print help")
        ("d,debug", "Enable debugging")
        ("address", "Address of NATS server", cxxopts::value<std::string>(conf.address))
        ("port", "Port of NATS server", cxxopts::value<uint16_t>(conf.port))
        ("user", "Username", cxxopts::value<std::string>(username))
        ("pass", "Password", cxxopts::value<std::string>(password))
        ("token", "Auth token", cxxopts::value<std::string>(token))
        ("mode", "mode: req, emit, watch, sse", cxxopts::value<std::string>(mode))
        ("pattern", "Message pattern (string or JSON)", cxxopts::value<std::string>(pattern))
        ("data", "Payload data (JSON or plain string)", cxxopts::value<std::string>(data))
        ("H,header", "Add header to message (format: Key:Value, repeatable)", cxxopts::value<std::vector<std::string>>())
        ("ssl", "Enable ssl")
        ("ssl_key", "ssl_key", cxxopts::value<std::string>(ssl_key_file))
        ("ssl_cert", "ssl_cert", cxxopts::value<std::string>(ssl_cert_file))
        ("ssl_ca", "ssl_ca", cxxopts::value<std::string>(ssl_ca_file))
        ;
        /* clang-format on */
        options.parse_positional({"mode"});
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        auto console = spdlog::stdout_color_mt("console");

        if (result.count("debug")) {
            console->set_level(spdlog::level::debug);
        }

        if (result.count("mode") == 0) {
            console->error("Please specify mode");
            return 1;
        }

        if (mode != req_mode && mode != emit_mode && mode != watch_mode && mode != sse_mode) {
            console->error("Invalid mode. Use --help to see available modes");
            return 1;
        }

        if (mode != watch_mode && pattern.empty()) {
            console->error("Please specify --pattern");
            return 1;
        }

        if (!username.empty()) {
            conf.user = username;
        }
        if (!password.empty()) {
            conf.password = password;
        }
        if (!token.empty()) {
            conf.token = token;
        }

        std::optional<broker_rpc::ssl_config> opt_ssl_conf;
        if (result.count("ssl")) {
            ssl_conf.cert = read_file(console, ssl_cert_file);
            ssl_conf.ca = read_file(console, ssl_ca_file);
            ssl_conf.key = read_file(console, ssl_key_file);
            opt_ssl_conf = ssl_conf;
        }

        std::vector<std::string> header_args;
        if (result.count("header")) {
            header_args = result["header"].as<std::vector<std::string>>();
        }
        auto record_opts = parse_header_args(console, header_args);

        asio::io_context ioc;
        broker_rpc::client_options client_opts;
        client_opts.log = console;
        broker_rpc::client transport(ioc, broker_rpc::nats_session_factory(conf, opt_ssl_conf), client_opts);

        auto pattern_json = parse_json_arg(pattern);
        auto data_json = parse_json_arg(data);
        auto route = broker_rpc::normalize_pattern(pattern_json);

        std::unique_ptr<worker> w;
        if (mode == req_mode) {
            w = std::make_unique<requester>(ioc, console, transport, route,
                                            data_json, record_opts);
        } else if (mode == emit_mode) {
            w = std::make_unique<emitter>(ioc, console, transport, route,
                                          data_json, record_opts);
        } else if (mode == watch_mode) {
            w = std::make_unique<status_watcher>(ioc, console, transport);
        } else {
            w = std::make_unique<sse_printer>(ioc, console, transport, route,
                                              data_json, record_opts);
        }

        w->start();
        ioc.run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
}

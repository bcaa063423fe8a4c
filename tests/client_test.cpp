#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <broker_rpc/client.hpp>

#include "fake_session.hpp"

using namespace broker_rpc;
using broker_rpc::test::fake_factory;
using broker_rpc::test::run_ready;

namespace {

client_options quiet_options() {
    client_options o;
    o.log = broker_rpc::test::quiet_logger();
    return o;
}

packet make_packet(json pattern, json data) {
    packet p;
    p.pattern = std::move(pattern);
    p.data = std::move(data);
    return p;
}

struct client_fixture : public ::testing::Test {
    void connect_now() {
        auto f = transport.connect();
        factory.last().fire(session_event::connect);
        ASSERT_TRUE(f.ready());
        ASSERT_FALSE(f.result().failed());
    }

    fake_factory factory;
    asio::io_context io;
    client transport{io, factory.make(), quiet_options()};
};

} // namespace

TEST_F(client_fixture, connect_twice_returns_the_same_future) {
    auto f1 = transport.connect();
    auto f2 = transport.connect();

    EXPECT_TRUE(f1 == f2);
    EXPECT_FALSE(f1.ready());
    EXPECT_EQ(1u, factory.created());
    EXPECT_EQ(1, factory.last().starts);
    EXPECT_EQ(connection_state::connecting, transport.state());

    factory.last().fire(session_event::connect);
    auto f3 = transport.connect();
    EXPECT_TRUE(f1 == f3);
    EXPECT_TRUE(f3.ready());
    EXPECT_FALSE(f3.result().failed());
}

TEST_F(client_fixture, close_before_connect_rejects) {
    auto f = transport.connect();
    factory.last().fire(session_event::close, status(error_code::connection_refused, "refused"));

    ASSERT_TRUE(f.ready());
    EXPECT_EQ(error_code::connection_refused, f.result().code());

    // a later connect does not reopen the settled attempt
    factory.last().fire(session_event::connect);
    EXPECT_TRUE(f.result().failed());

    auto next = transport.connect();
    EXPECT_TRUE(next.ready());
    EXPECT_FALSE(next.result().failed());
}

TEST_F(client_fixture, close_after_connect_keeps_it_resolved) {
    auto f = transport.connect();
    factory.last().fire(session_event::connect);
    factory.last().fire(session_event::close, status(error_code::connection_lost, "lost"));

    ASSERT_TRUE(f.ready());
    EXPECT_FALSE(f.result().failed());
    EXPECT_EQ(connection_status::closed, transport.status_stream().current());
}

TEST_F(client_fixture, offline_replaces_future_with_rejected_one) {
    connect_now();
    factory.last().fire(session_event::offline);

    auto f = transport.connect();
    ASSERT_TRUE(f.ready());
    EXPECT_EQ(error_code::offline, f.result().code());
    EXPECT_EQ("Connection lost. Trying to reconnect...", f.result().error());
    EXPECT_EQ(connection_state::offline, transport.state());
    EXPECT_EQ(connection_status::connected, transport.status_stream().current());

    factory.last().fire(session_event::connect);
    auto recovered = transport.connect();
    EXPECT_TRUE(recovered.ready());
    EXPECT_FALSE(recovered.result().failed());
}

TEST_F(client_fixture, rejected_future_reports_once_awaited) {
    connect_now();
    factory.last().fire(session_event::offline);

    status seen;
    asio::co_spawn(
        io,
        [&]() -> asio::awaitable<void> {
            seen = co_await transport.connect().async_wait(asio::use_awaitable);
        },
        asio::detached);
    run_ready(io);

    EXPECT_EQ(error_code::offline, seen.code());
}

TEST_F(client_fixture, status_follows_lifecycle_events) {
    std::vector<connection_status> seen;
    transport.status_stream().subscribe([&](const connection_status& s) { seen.push_back(s); });

    connect_now();
    factory.last().fire(session_event::reconnect);
    EXPECT_TRUE(transport.is_reconnecting());
    EXPECT_EQ(connection_state::reconnecting, transport.state());
    factory.last().fire(session_event::connect);
    EXPECT_FALSE(transport.is_reconnecting());
    factory.last().fire(session_event::disconnect, status(error_code::remote_error, "Stale Connection"));

    std::vector<connection_status> expected{connection_status::connected, connection_status::reconnecting,
                                            connection_status::connected, connection_status::disconnected};
    EXPECT_EQ(expected, seen);
}

TEST_F(client_fixture, late_status_subscriber_gets_current_value) {
    connect_now();

    optional<connection_status> seen;
    transport.status_stream().subscribe([&](const connection_status& s) { seen = s; });
    EXPECT_EQ(connection_status::connected, seen);
}

TEST_F(client_fixture, message_handler_registered_once_across_reconnects) {
    connect_now();
    auto& session = factory.last();
    EXPECT_EQ(1u, session.listener_count(session_event::message));

    session.fire(session_event::offline);
    session.fire(session_event::reconnect);
    session.fire(session_event::connect);
    session.fire(session_event::reconnect);
    session.fire(session_event::connect);
    EXPECT_EQ(1u, session.listener_count(session_event::message));
}

TEST_F(client_fixture, subscribes_reply_channel_on_first_use_only) {
    connect_now();
    auto& session = factory.last();

    auto t1 = transport.publish(make_packet("sum", 1), [](const write_packet&) {});
    run_ready(io);
    auto t2 = transport.publish(make_packet("sum", 2), [](const write_packet&) {});
    run_ready(io);

    EXPECT_EQ(std::vector<std::string>{"sum/reply"}, session.subscribes);
    EXPECT_EQ(2, transport.channel_refcount("sum/reply"));
    ASSERT_EQ(2u, session.published.size());
    EXPECT_EQ("sum", session.published[0].channel);

    t1();
    run_ready(io);
    EXPECT_TRUE(session.unsubscribes.empty());
    EXPECT_EQ(1, transport.channel_refcount("sum/reply"));

    t1();
    run_ready(io);
    EXPECT_EQ(1, transport.channel_refcount("sum/reply"));

    t2();
    run_ready(io);
    EXPECT_EQ(std::vector<std::string>{"sum/reply"}, session.unsubscribes);
    EXPECT_EQ(0, transport.channel_refcount("sum/reply"));

    t2();
    run_ready(io);
    EXPECT_EQ(1u, session.unsubscribes.size());
}

TEST_F(client_fixture, requests_racing_the_subscribe_share_it) {
    connect_now();
    auto& session = factory.last();
    session.gate_subscribe = true;

    auto t1 = transport.publish(make_packet("sum", 1), [](const write_packet&) {});
    auto t2 = transport.publish(make_packet("sum", 2), [](const write_packet&) {});
    run_ready(io);

    EXPECT_EQ(1u, session.subscribes.size());
    EXPECT_TRUE(session.published.empty());

    session.open_gates();
    run_ready(io);

    EXPECT_EQ(1u, session.subscribes.size());
    EXPECT_EQ(2u, session.published.size());
    EXPECT_EQ(2, transport.channel_refcount("sum/reply"));
}

TEST_F(client_fixture, teardown_before_subscribe_ack_gives_the_channel_back) {
    connect_now();
    auto& session = factory.last();
    session.gate_subscribe = true;

    auto teardown = transport.publish(make_packet("sum", 1), [](const write_packet&) {});
    run_ready(io);
    teardown();

    session.open_gates();
    run_ready(io);

    EXPECT_TRUE(session.published.empty());
    EXPECT_EQ(std::vector<std::string>{"sum/reply"}, session.unsubscribes);
    EXPECT_EQ(0, transport.channel_refcount("sum/reply"));
}

TEST_F(client_fixture, failed_subscribe_reports_to_caller) {
    connect_now();
    auto& session = factory.last();
    session.subscribe_result = status(error_code::not_connected);

    std::vector<write_packet> seen;
    transport.publish(make_packet("sum", 1), [&](const write_packet& wp) { seen.push_back(wp); });
    run_ready(io);

    ASSERT_EQ(1u, seen.size());
    EXPECT_TRUE(seen[0].err.has_value());
    EXPECT_TRUE(seen[0].is_disposed);
    EXPECT_TRUE(session.published.empty());
    EXPECT_EQ(0, transport.channel_refcount("sum/reply"));
}

TEST_F(client_fixture, serialization_failure_is_reported_synchronously) {
    connect_now();
    auto& session = factory.last();

    std::vector<write_packet> seen;
    auto teardown = transport.publish(make_packet("sum", std::string("\xff\xfe")),
                                      [&](const write_packet& wp) { seen.push_back(wp); });

    ASSERT_EQ(1u, seen.size());
    EXPECT_TRUE(seen[0].err.has_value());

    run_ready(io);
    EXPECT_TRUE(session.subscribes.empty());
    EXPECT_TRUE(session.published.empty());
    EXPECT_EQ(0u, transport.pending_requests());

    teardown();
    teardown();
}

TEST_F(client_fixture, publish_without_session_fails) {
    std::vector<write_packet> seen;
    transport.publish(make_packet("sum", 1), [&](const write_packet& wp) { seen.push_back(wp); });

    ASSERT_EQ(1u, seen.size());
    ASSERT_TRUE(seen[0].err.has_value());
    EXPECT_EQ(std::string(not_initialized_message), seen[0].err->get<std::string>());
}

TEST_F(client_fixture, delivers_exactly_one_terminal_response) {
    connect_now();
    auto& session = factory.last();

    std::vector<write_packet> seen;
    auto teardown = transport.publish(make_packet("sum", json::array({1, 2})),
                                      [&](const write_packet& wp) { seen.push_back(wp); });
    run_ready(io);
    ASSERT_EQ(1u, session.published.size());

    auto body = session.published[0].body();
    auto id = body["id"].get<std::string>();
    EXPECT_EQ("sum", body["pattern"]);
    EXPECT_EQ(json::array({1, 2}), body["data"]);

    session.deliver("sum/reply", json{{"id", id}, {"response", 1}});
    session.deliver("sum/reply", json{{"id", id}, {"response", 3}, {"isDisposed", true}});
    session.deliver("sum/reply", json{{"id", id}, {"response", 4}, {"isDisposed", true}});
    session.deliver("sum/reply", json{{"id", id}, {"response", 5}});

    ASSERT_EQ(2u, seen.size());
    EXPECT_EQ(1, *seen[0].response);
    EXPECT_FALSE(seen[0].is_disposed);
    EXPECT_EQ(3, *seen[1].response);
    EXPECT_TRUE(seen[1].is_disposed);

    // the entry stays until the caller tears it down
    EXPECT_EQ(1u, transport.pending_requests());
    teardown();
    EXPECT_EQ(0u, transport.pending_requests());
}

TEST_F(client_fixture, remote_error_is_terminal) {
    connect_now();
    auto& session = factory.last();

    std::vector<write_packet> seen;
    transport.publish(make_packet("sum", 1), [&](const write_packet& wp) { seen.push_back(wp); });
    run_ready(io);
    auto id = session.published[0].body()["id"].get<std::string>();

    session.deliver("sum/reply", json{{"id", id}, {"err", "bad input"}});
    session.deliver("sum/reply", json{{"id", id}, {"response", 1}});

    ASSERT_EQ(1u, seen.size());
    EXPECT_EQ("bad input", *seen[0].err);
    EXPECT_TRUE(seen[0].is_disposed);
}

TEST_F(client_fixture, external_reply_is_mapped_to_terminal_response) {
    connect_now();
    auto& session = factory.last();

    std::vector<write_packet> seen;
    transport.publish(make_packet("sum", 1), [&](const write_packet& wp) { seen.push_back(wp); });
    run_ready(io);
    auto id = session.published[0].body()["id"].get<std::string>();

    session.deliver("sum/reply", json{{"id", id}, {"total", 3}});

    ASSERT_EQ(1u, seen.size());
    EXPECT_TRUE(seen[0].is_disposed);
    EXPECT_EQ(3, (*seen[0].response)["total"]);
}

TEST_F(client_fixture, unknown_ids_are_dropped_and_counted) {
    connect_now();
    auto& session = factory.last();

    int calls = 0;
    transport.publish(make_packet("sum", 1), [&](const write_packet&) { ++calls; });
    run_ready(io);

    session.deliver("sum/reply", json{{"id", "nobody"}, {"response", 1}});
    session.deliver("sum/reply", std::string("not json"));

    EXPECT_EQ(0, calls);
    EXPECT_EQ(1u, transport.unmatched_responses());
}

TEST_F(client_fixture, merges_user_properties_under_request_headers) {
    client_options o = quiet_options();
    o.user_properties = {{"x-app", "tool"}, {"x-trace", "1"}};
    client c(io, factory.make(), o);
    c.connect();
    factory.last().fire(session_event::connect);

    auto p = record_builder(json{{"a", 1}}).add_header("x-trace", "2").build("sum");
    c.publish(p, [](const write_packet&) {});
    run_ready(io);

    ASSERT_EQ(1u, factory.last().published.size());
    headers_t expected{{"x-app", "tool"}, {"x-trace", "2"}};
    EXPECT_EQ(expected, factory.last().published[0].headers);
    EXPECT_FALSE(factory.last().published[0].body().contains("options"));
}

TEST_F(client_fixture, structured_patterns_use_sorted_compact_form) {
    connect_now();
    auto& session = factory.last();

    transport.publish(make_packet(json{{"role", "math"}, {"cmd", "sum"}}, 1), [](const write_packet&) {});
    run_ready(io);

    EXPECT_EQ(std::vector<std::string>{R"({"cmd":"sum","role":"math"}/reply)"}, session.subscribes);
    ASSERT_EQ(1u, session.published.size());
    EXPECT_EQ(R"({"cmd":"sum","role":"math"})", session.published[0].channel);
}

TEST_F(client_fixture, pending_listeners_drain_in_order) {
    std::vector<int> order;
    transport.on(session_event::error, [&](const event_data&) { order.push_back(1); });
    transport.on(session_event::error, [&](const event_data&) { order.push_back(2); });
    EXPECT_TRUE(order.empty());

    transport.connect();
    factory.last().fire(session_event::error, status("boom"));
    EXPECT_EQ((std::vector<int>{1, 2}), order);

    transport.on(session_event::error, [&](const event_data&) { order.push_back(3); });
    factory.last().fire(session_event::error, status("boom"));
    EXPECT_EQ((std::vector<int>{1, 2, 1, 2, 3}), order);
}

TEST_F(client_fixture, unwrap_requires_connect) {
    auto [none, s] = transport.unwrap();
    EXPECT_EQ(nullptr, none);
    ASSERT_TRUE(s.failed());
    EXPECT_EQ("Not initialized. Please call the \"connect\" method first.", s.error());

    transport.connect();
    auto [session, s2] = transport.unwrap();
    EXPECT_FALSE(s2.failed());
    EXPECT_EQ(factory.sessions->back(), session);
}

TEST_F(client_fixture, dispatch_event_publishes_without_id) {
    connect_now();
    auto& session = factory.last();

    status result(error_code::operation_failed);
    asio::co_spawn(
        io,
        [&]() -> asio::awaitable<void> {
            result = co_await transport.dispatch_event(make_packet("user.created", json{{"name", "x"}}));
        },
        asio::detached);
    run_ready(io);

    EXPECT_FALSE(result.failed());
    EXPECT_TRUE(session.subscribes.empty());
    ASSERT_EQ(1u, session.published.size());
    EXPECT_EQ("user.created", session.published[0].channel);
    EXPECT_FALSE(session.published[0].body().contains("id"));
    EXPECT_EQ(0u, transport.pending_requests());
}

TEST_F(client_fixture, dispatch_event_reports_broker_failure) {
    connect_now();
    factory.last().publish_result = status(error_code::message_too_large);

    status result;
    asio::co_spawn(
        io,
        [&]() -> asio::awaitable<void> { result = co_await transport.dispatch_event(make_packet("big", 1)); },
        asio::detached);
    run_ready(io);

    EXPECT_EQ(error_code::message_too_large, result.code());
}

TEST_F(client_fixture, emit_waits_for_connection) {
    status result(error_code::operation_failed);
    bool done = false;
    asio::co_spawn(
        io,
        [&]() -> asio::awaitable<void> {
            result = co_await transport.emit("user.created", 1);
            done = true;
        },
        asio::detached);
    run_ready(io);
    EXPECT_FALSE(done);

    factory.last().fire(session_event::connect);
    run_ready(io);

    EXPECT_TRUE(done);
    EXPECT_FALSE(result.failed());
    EXPECT_EQ(1u, factory.last().published.size());
}

TEST_F(client_fixture, send_streams_responses_and_releases_channel) {
    std::vector<json> values;
    bool completed = false;
    auto sub = transport.send("sum", json::array({1, 2}))
                   .subscribe(observer<json>{[&](const json& v) { values.push_back(v); },
                                             [](const status&) { FAIL(); },
                                             [&]() { completed = true; }});

    ASSERT_EQ(1u, factory.created());
    auto& session = factory.last();
    session.fire(session_event::connect);
    run_ready(io);

    ASSERT_EQ(1u, session.published.size());
    auto id = session.published[0].body()["id"].get<std::string>();

    session.deliver("sum/reply", json{{"id", id}, {"response", 1}});
    session.deliver("sum/reply", json{{"id", id}, {"response", 2}, {"isDisposed", true}});
    run_ready(io);

    EXPECT_EQ((std::vector<json>{1, 2}), values);
    EXPECT_TRUE(completed);
    EXPECT_EQ(std::vector<std::string>{"sum/reply"}, session.unsubscribes);
    EXPECT_EQ(0u, transport.pending_requests());
}

TEST_F(client_fixture, send_surfaces_remote_error) {
    optional<status> failure;
    auto sub = transport.send("sum", 1).subscribe(
        observer<json>{nullptr, [&](const status& s) { failure = s; }, nullptr});

    auto& session = factory.last();
    session.fire(session_event::connect);
    run_ready(io);
    auto id = session.published[0].body()["id"].get<std::string>();
    session.deliver("sum/reply", json{{"id", id}, {"err", {{"message", "division by zero"}}}});

    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(error_code::remote_error, failure->code());
    EXPECT_EQ("division by zero", failure->error());
}

TEST_F(client_fixture, unsubscribing_send_tears_request_down) {
    auto sub = transport.send("sum", 1).subscribe(observer<json>{});
    auto& session = factory.last();
    session.fire(session_event::connect);
    run_ready(io);
    EXPECT_EQ(1u, transport.pending_requests());

    sub.unsubscribe();
    run_ready(io);
    EXPECT_EQ(0u, transport.pending_requests());
    EXPECT_EQ(std::vector<std::string>{"sum/reply"}, session.unsubscribes);

    sub.unsubscribe();
}

TEST_F(client_fixture, close_resets_everything) {
    connect_now();
    auto& first = factory.last();

    std::vector<write_packet> seen;
    transport.publish(make_packet("sum", 1), [&](const write_packet& wp) { seen.push_back(wp); });
    run_ready(io);
    transport.on(session_event::error, [](const event_data&) {});

    transport.close();

    EXPECT_TRUE(first.ended);
    ASSERT_EQ(1u, seen.size());
    EXPECT_TRUE(seen[0].is_disposed);
    EXPECT_TRUE(seen[0].err.has_value());
    EXPECT_EQ(0u, transport.pending_requests());
    EXPECT_EQ(0, transport.channel_refcount("sum/reply"));
    EXPECT_EQ(connection_state::closed, transport.state());
    EXPECT_EQ(connection_status::closed, transport.status_stream().current());
    EXPECT_TRUE(transport.unwrap().second.failed());

    auto f = transport.connect();
    EXPECT_EQ(2u, factory.created());
    EXPECT_FALSE(f.ready());

    // the new session gets its own message handler
    factory.last().fire(session_event::connect);
    EXPECT_EQ(1u, factory.last().listener_count(session_event::message));
}

TEST_F(client_fixture, close_fails_requests_waiting_for_subscribe) {
    connect_now();
    factory.last().gate_subscribe = true;

    std::vector<write_packet> seen;
    transport.publish(make_packet("sum", 1), [&](const write_packet& wp) { seen.push_back(wp); });
    run_ready(io);

    transport.close();
    ASSERT_EQ(1u, seen.size());
    EXPECT_TRUE(seen[0].err.has_value());

    factory.sessions->front()->open_gates();
    run_ready(io);
    EXPECT_EQ(1u, seen.size());
}

TEST_F(client_fixture, lost_connection_reports_closed_then_reconnecting) {
    connect_now();
    std::vector<connection_status> seen;
    transport.status_stream().subscribe([&](const connection_status& s) { seen.push_back(s); });

    auto& session = factory.last();
    session.fire(session_event::close, status(error_code::connection_lost, "connection lost"));
    session.fire(session_event::offline);
    session.fire(session_event::reconnect);
    session.fire(session_event::connect);

    std::vector<connection_status> expected{connection_status::connected, connection_status::closed,
                                            connection_status::reconnecting, connection_status::connected};
    EXPECT_EQ(expected, seen);
}

TEST_F(client_fixture, teardown_from_closed_session_leaves_new_requests_alone) {
    connect_now();
    auto old_teardown = transport.publish(make_packet("sum", 1), [](const write_packet&) {});
    run_ready(io);
    EXPECT_EQ(1, transport.channel_refcount("sum/reply"));

    transport.close();
    connect_now();
    auto& second = factory.last();

    std::vector<write_packet> seen;
    auto teardown = transport.publish(make_packet("sum", 2), [&](const write_packet& wp) { seen.push_back(wp); });
    run_ready(io);
    ASSERT_EQ(1u, second.published.size());
    EXPECT_EQ(1, transport.channel_refcount("sum/reply"));

    old_teardown();
    run_ready(io);
    EXPECT_EQ(1, transport.channel_refcount("sum/reply"));
    EXPECT_TRUE(second.unsubscribes.empty());
    EXPECT_EQ(1u, transport.pending_requests());

    auto id = second.published[0].body()["id"].get<std::string>();
    second.deliver("sum/reply", json{{"id", id}, {"response", 3}, {"isDisposed", true}});
    ASSERT_EQ(1u, seen.size());
    EXPECT_EQ(json(3), *seen[0].response);

    teardown();
    run_ready(io);
    EXPECT_EQ(std::vector<std::string>{"sum/reply"}, second.unsubscribes);
}

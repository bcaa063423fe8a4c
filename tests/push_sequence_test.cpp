#include <gtest/gtest.h>

#include <broker_rpc/push_sequence.hpp>
#include <stdexcept>

using namespace broker_rpc;

TEST(push_sequence, of_emits_then_completes) {
    std::vector<int> values;
    bool completed = false;
    auto sub = push_sequence<int>::of({1, 2, 3}).subscribe(
        observer<int>{[&](const int& v) { values.push_back(v); }, nullptr, [&]() { completed = true; }});

    EXPECT_EQ((std::vector<int>{1, 2, 3}), values);
    EXPECT_TRUE(completed);
    EXPECT_TRUE(sub.closed());
    sub.unsubscribe();
}

TEST(push_sequence, producer_runs_per_subscription) {
    int runs = 0;
    push_sequence<int> seq([&](subscriber<int> sub) {
        ++runs;
        sub.complete();
    });
    EXPECT_EQ(0, runs);

    seq.subscribe(observer<int>{});
    seq.subscribe(observer<int>{});
    EXPECT_EQ(2, runs);
}

TEST(push_sequence, producer_exception_becomes_error) {
    optional<status> failure;
    push_sequence<int>([](subscriber<int>) { throw std::runtime_error("kaput"); })
        .subscribe(observer<int>{nullptr, [&](const status& s) { failure = s; }, nullptr});

    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(error_code::producer_error, failure->code());
    EXPECT_EQ("kaput", failure->error());
}

TEST(push_sequence, nothing_after_terminal_event) {
    std::vector<int> values;
    int errors = 0;
    int completions = 0;
    push_sequence<int>([](subscriber<int> sub) {
        sub.next(1);
        sub.error(status("boom"));
        sub.next(2);
        sub.complete();
    }).subscribe(observer<int>{[&](const int& v) { values.push_back(v); },
                               [&](const status&) { ++errors; },
                               [&]() { ++completions; }});

    EXPECT_EQ(std::vector<int>{1}, values);
    EXPECT_EQ(1, errors);
    EXPECT_EQ(0, completions);
}

TEST(push_sequence, unsubscribe_runs_teardown_once) {
    int teardowns = 0;
    optional<subscriber<int>> producer;
    auto sub = push_sequence<int>([&](subscriber<int> s) {
        producer = s;
        s.add_teardown([&]() { ++teardowns; });
    }).subscribe(observer<int>{});

    sub.unsubscribe();
    sub.unsubscribe();
    EXPECT_EQ(1, teardowns);

    ASSERT_TRUE(producer.has_value());
    EXPECT_TRUE(producer->closed());
    producer->next(5);

    // registered after the end: runs at once
    producer->add_teardown([&]() { ++teardowns; });
    EXPECT_EQ(2, teardowns);
}

TEST(push_sequence, map_transforms_values) {
    std::vector<std::string> values;
    push_sequence<int>::of({1, 2}).map([](const int& v) { return std::to_string(v * 10); })
        .subscribe(observer<std::string>{[&](const std::string& v) { values.push_back(v); }, nullptr, nullptr});

    EXPECT_EQ((std::vector<std::string>{"10", "20"}), values);
}

TEST(push_sequence, unsubscribing_mapped_sequence_reaches_source) {
    bool source_torn_down = false;
    push_sequence<int> source([&](subscriber<int> s) { s.add_teardown([&]() { source_torn_down = true; }); });

    auto sub = source.map([](const int& v) { return v + 1; }).subscribe(observer<int>{});
    EXPECT_FALSE(source_torn_down);
    sub.unsubscribe();
    EXPECT_TRUE(source_torn_down);
}

TEST(push_sequence, fail_errors_immediately) {
    optional<status> failure;
    push_sequence<int>::fail(status(error_code::remote_error, "nope"))
        .subscribe(observer<int>{nullptr, [&](const status& s) { failure = s; }, nullptr});
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ("nope", failure->error());
}

TEST(sequence_subject, multicasts_to_current_subscribers) {
    sequence_subject<int> subject;
    std::vector<int> a;
    std::vector<int> b;

    auto sa = subject.sequence().subscribe(observer<int>{[&](const int& v) { a.push_back(v); }, nullptr, nullptr});
    subject.next(1);
    auto sb = subject.sequence().subscribe(observer<int>{[&](const int& v) { b.push_back(v); }, nullptr, nullptr});
    subject.next(2);
    EXPECT_EQ(2u, subject.observer_count());

    sa.unsubscribe();
    EXPECT_EQ(1u, subject.observer_count());
    subject.next(3);

    EXPECT_EQ((std::vector<int>{1, 2}), a);
    EXPECT_EQ((std::vector<int>{2, 3}), b);
}

TEST(sequence_subject, late_subscriber_sees_terminal_state) {
    sequence_subject<int> subject;
    subject.error(status("gone"));

    optional<status> failure;
    subject.sequence().subscribe(observer<int>{nullptr, [&](const status& s) { failure = s; }, nullptr});
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ("gone", failure->error());
}

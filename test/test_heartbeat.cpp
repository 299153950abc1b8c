#include <gate.pb.h>
#include <gatecore/error.h>
#include <gatecore/heartbeat/heartbeat_monitor.h>
#include <gatecore/metrics/metrics.h>
#include <gtest/gtest.h>

#include <asio/io_context.hpp>
#include <future>

#include "fake_connection.h"

using namespace gatecore;
using namespace std::chrono_literals;

static heartbeat_options short_options() {
    heartbeat_options options;
    options.interval = 1000ms;
    options.timeout = 500ms;
    options.max_missed = 3;
    return options;
}

TEST(heartbeat, evict_after_max_missed) {
    message_codec codec;
    auto metrics = std::make_shared<metrics_registry>();
    heartbeat_monitor monitor(codec, short_options(), {}, metrics);

    std::vector<connection_id> evicted;
    monitor.set_disconnect_handle([&](const connection_ptr& conn, const heartbeat_status& status) {
        EXPECT_EQ(status.missed_count, 3U);
        EXPECT_FALSE(status.is_alive);
        evicted.emplace_back(conn->id());
    });

    auto conn = std::make_shared<fake_connection>(1);
    const auto start = steady_clock::now();
    monitor.track(conn, start);
    EXPECT_EQ(monitor.tracked_count(), 1U);

    EXPECT_EQ(monitor.tick(start + 1s), 0U);
    auto status = monitor.status(1);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->missed_count, 1U);
    EXPECT_FALSE(status->is_alive);

    EXPECT_EQ(monitor.tick(start + 2s), 0U);
    EXPECT_EQ(monitor.status(1)->missed_count, 2U);
    EXPECT_TRUE(conn->is_active());

    EXPECT_EQ(monitor.tick(start + 3s), 1U);
    EXPECT_FALSE(monitor.status(1).has_value());
    EXPECT_EQ(monitor.tracked_count(), 0U);
    EXPECT_FALSE(conn->is_active());
    EXPECT_EQ(conn->close_reason(), net_errors::heartbeat_timeout);
    ASSERT_EQ(evicted.size(), 1U);
    EXPECT_EQ(evicted[0], 1U);
    EXPECT_EQ(metrics->counter("heartbeat.evicted"), 1);
}

TEST(heartbeat, ping_sent_each_tick) {
    message_codec codec;
    heartbeat_monitor monitor(codec, short_options());
    auto conn = std::make_shared<fake_connection>(1);
    const auto start = steady_clock::now();
    monitor.track(conn, start);

    EXPECT_EQ(monitor.tick(start + 100ms), 0U);
    EXPECT_EQ(monitor.tick(start + 200ms), 0U);
    ASSERT_EQ(conn->frame_count(), 2U);

    const auto first = conn->frame(0, codec);
    const auto second = conn->frame(1, codec);
    EXPECT_EQ(first.header.message_type, message_types::ping);
    EXPECT_TRUE(first.header.has_flag(message_flags::request));
    EXPECT_EQ(first.header.message_id, first.header.sequence);
    EXPECT_LT(first.header.sequence, second.header.sequence);

    gate::ping_req req;
    ASSERT_TRUE(req.ParseFromString(first.payload));
    EXPECT_EQ(req.server_time(), first.header.timestamp);
    EXPECT_EQ(monitor.status(1)->missed_count, 0U);
}

TEST(heartbeat, heartbeat_resets_missed) {
    message_codec codec;
    heartbeat_monitor monitor(codec, short_options());
    auto conn = std::make_shared<fake_connection>(1);
    const auto start = steady_clock::now();
    monitor.track(conn, start);

    monitor.tick(start + 1s);
    monitor.tick(start + 2s);
    EXPECT_EQ(monitor.status(1)->missed_count, 2U);

    EXPECT_TRUE(monitor.record_heartbeat(1, start + 2100ms));
    auto status = monitor.status(1);
    EXPECT_EQ(status->missed_count, 0U);
    EXPECT_TRUE(status->is_alive);

    EXPECT_EQ(monitor.tick(start + 2200ms), 0U);
    EXPECT_TRUE(conn->is_active());
    EXPECT_FALSE(monitor.record_heartbeat(2, start));
}

TEST(heartbeat, pong_rtt) {
    message_codec codec;
    auto metrics = std::make_shared<metrics_registry>();
    heartbeat_monitor monitor(codec, short_options(), {}, metrics);
    auto conn = std::make_shared<fake_connection>(1);
    const auto start = steady_clock::now();
    monitor.track(conn, start);

    monitor.tick(start + 100ms);
    EXPECT_TRUE(monitor.on_pong(1, start + 130ms));
    EXPECT_EQ(monitor.status(1)->rtt, 30ms);
    EXPECT_EQ(metrics->snapshot().durations["heartbeat.rtt"].count, 1);

    // 已经不再跟踪的连接回复 pong 不做任何事
    monitor.untrack(1);
    EXPECT_FALSE(monitor.on_pong(1, start + 200ms));
    EXPECT_FALSE(monitor.status(1).has_value());
}

TEST(heartbeat, reconfigure) {
    message_codec codec;
    heartbeat_monitor monitor(codec);
    EXPECT_EQ(monitor.options().interval, 30000ms);
    EXPECT_EQ(monitor.options().timeout, 10000ms);

    auto options = short_options();
    options.max_missed = 1;
    monitor.reconfigure(options);
    EXPECT_EQ(monitor.options().max_missed, 1U);

    auto conn = std::make_shared<fake_connection>(1);
    const auto start = steady_clock::now();
    monitor.track(conn, start);
    EXPECT_EQ(monitor.tick(start + 1s), 1U);
    EXPECT_FALSE(conn->is_active());
}

TEST(heartbeat, default_options_evict_within_three_intervals) {
    message_codec codec;
    const heartbeat_options defaults;
    ASSERT_LT(defaults.timeout, defaults.interval);
    heartbeat_monitor monitor(codec);

    auto silent = std::make_shared<fake_connection>(1);
    auto replying = std::make_shared<fake_connection>(2);
    const auto start = steady_clock::now();
    monitor.track(silent, start);
    monitor.track(replying, start);

    size_t evicted = 0;
    auto now = start;
    for (uint32_t i = 1; i <= defaults.max_missed; ++i) {
        now = start + defaults.interval * i;
        if (i == defaults.max_missed) {
            EXPECT_FALSE(monitor.status(1)->is_alive);
        }
        evicted += monitor.tick(now);
        // 正常的客户端在下一次 tick 之前回应 pong
        EXPECT_TRUE(monitor.on_pong(2, now + 50ms));
    }

    EXPECT_EQ(evicted, 1U);
    EXPECT_LE(now - start, defaults.interval * 3);
    EXPECT_FALSE(silent->is_active());
    EXPECT_FALSE(monitor.status(1).has_value());

    for (int i = 0; i < 10; ++i) {
        now += defaults.interval;
        EXPECT_EQ(monitor.tick(now), 0U);
        EXPECT_TRUE(monitor.on_pong(2, now + 50ms));
    }
    EXPECT_TRUE(replying->is_active());
    EXPECT_EQ(monitor.status(2)->missed_count, 0U);
}

TEST(heartbeat, stop_ends_background_tick) {
    message_codec codec;
    asio::io_context context;
    heartbeat_monitor monitor(codec);
    monitor.start(context.get_executor());

    auto runner = std::async(std::launch::async, [&context]() { context.run(); });
    for (int i = 0; i < 100; ++i) {
        monitor.reconfigure(monitor.options());
    }
    monitor.stop();

    // 定时器间隔是 30s，能及时返回说明等待被取消
    const auto status = runner.wait_for(2s);
    if (status != std::future_status::ready) {
        context.stop();
    }
    runner.get();
    EXPECT_EQ(status, std::future_status::ready);
}

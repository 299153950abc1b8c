#include <gate.pb.h>
#include <gatecore/error.h>
#include <gatecore/metrics/metrics.h>
#include <gatecore/router/router.h>
#include <gatecore/session/session_manager.h>
#include <gtest/gtest.h>

#include "fake_connection.h"

using namespace gatecore;

namespace {

message make_request(uint32_t type, uint32_t id = 1, std::string payload = {}) {
    message msg;
    msg.header.message_id = id;
    msg.header.message_type = type;
    msg.header.flags = message_flags::request;
    msg.header.timestamp = get_system_clock_millis();
    msg.header.sequence = id;
    msg.payload = std::move(payload);
    msg.header.length = static_cast<uint32_t>(msg.payload.size());
    return msg;
}

class echo_handler final : public message_handler {
  public:
    std::error_code handle(const session_context& ctx, const message& msg) override {
        ++calls;
        return ctx.reply(msg.header, msg.header.message_type + 1, msg.payload);
    }

    int calls{0};
};

class router_test : public testing::Test {
  protected:
    void SetUp() override {
        conn = std::make_shared<fake_connection>(1);
        ctx = session_context{sessions.create_session(1, conn->id()), conn, &codec};
    }

    message_codec codec;
    std::shared_ptr<metrics_registry> metrics = std::make_shared<metrics_registry>();
    session_manager sessions;
    router message_router{codec, &sessions, {}, metrics};
    std::shared_ptr<fake_connection> conn;
    session_context ctx;
};

}  // namespace

TEST_F(router_test, dispatch_to_handler) {
    auto handler = std::make_shared<echo_handler>();
    message_router.register_handler(0x0101, handler);
    EXPECT_TRUE(message_router.has_handler(0x0101));

    EXPECT_FALSE(message_router.route_message(ctx, make_request(0x0101, 5, "ping")));
    EXPECT_EQ(handler->calls, 1);
    ASSERT_EQ(conn->frame_count(), 1U);

    const auto reply = conn->last_frame(codec);
    EXPECT_EQ(reply.header.message_type, 0x0102U);
    EXPECT_EQ(reply.header.message_id, 5U);
    EXPECT_EQ(reply.header.sequence, 5U);
    EXPECT_TRUE(reply.header.has_flag(message_flags::response));
    EXPECT_EQ(reply.payload, "ping");
    EXPECT_EQ(metrics->counter("router.dispatched"), 1);
    EXPECT_EQ(metrics->snapshot().durations["router.handle"].count, 1);
}

TEST_F(router_test, unhandled_type_replies_error) {
    EXPECT_FALSE(message_router.route_message(ctx, make_request(42, 42)));
    ASSERT_EQ(conn->frame_count(), 1U);

    const auto reply = conn->last_frame(codec);
    EXPECT_EQ(reply.header.message_type, message_types::error);
    EXPECT_EQ(reply.header.message_id, 42U);
    EXPECT_TRUE(reply.header.has_flag(message_flags::error));

    gate::error_ack ack;
    ASSERT_TRUE(ack.ParseFromString(reply.payload));
    EXPECT_EQ(ack.code(), wire_errors::unhandled_message);
    EXPECT_EQ(ack.error_type(), "UNHANDLED_MESSAGE");
    EXPECT_EQ(metrics->counter("router.unhandled"), 1);
}

TEST_F(router_test, invalid_message_rejected) {
    bool called = false;
    message_router.register_handler(0x0101, [&](const session_context&, const message&) {
        called = true;
        return std::error_code{};
    });

    auto msg = make_request(0x0101, 0);
    EXPECT_EQ(message_router.route_message(ctx, msg), router_errors::invalid_message);

    msg = make_request(0x0101, 3);
    msg.header.timestamp = 0;
    EXPECT_EQ(message_router.route_message(ctx, msg), router_errors::invalid_message);

    msg = make_request(0, 3);
    EXPECT_EQ(message_router.route_message(ctx, msg), router_errors::invalid_message);

    EXPECT_FALSE(called);
    ASSERT_EQ(conn->frame_count(), 3U);
    gate::error_ack ack;
    ASSERT_TRUE(ack.ParseFromString(conn->last_frame(codec).payload));
    EXPECT_EQ(ack.code(), wire_errors::invalid_message);
    EXPECT_EQ(metrics->counter("router.invalid"), 3);
}

TEST_F(router_test, last_registration_wins) {
    int which = 0;
    message_router.register_handler(0x0201, [&](const session_context&, const message&) {
        which = 1;
        return std::error_code{};
    });
    message_router.register_handler(0x0201, [&](const session_context&, const message&) {
        which = 2;
        return std::error_code{};
    });

    EXPECT_EQ(message_router.handler_count(), 1U);
    EXPECT_FALSE(message_router.route_message(ctx, make_request(0x0201)));
    EXPECT_EQ(which, 2);
}

TEST_F(router_test, handler_error_and_exception) {
    message_router.register_handler(0x0301, [](const session_context&, const message&) {
        return std::error_code(session_errors::not_authenticated);
    });
    message_router.register_handler(0x0302, [](const session_context&, const message&) -> std::error_code {
        throw std::runtime_error("boom");
    });

    EXPECT_EQ(message_router.route_message(ctx, make_request(0x0301)), session_errors::not_authenticated);
    EXPECT_EQ(message_router.route_message(ctx, make_request(0x0302)), router_errors::handler_failed);
    EXPECT_EQ(metrics->counter("router.handler_error"), 2);
}

TEST_F(router_test, registered_types_sorted) {
    const auto noop = [](const session_context&, const message&) { return std::error_code{}; };
    message_router.register_handler(0x0305, noop);
    message_router.register_handler(0x0101, noop);
    message_router.register_handler(0x0203, noop);

    EXPECT_EQ(message_router.registered_types(), (std::vector<uint32_t>{0x0101, 0x0203, 0x0305}));
    EXPECT_TRUE(message_router.unregister_handler(0x0203));
    EXPECT_FALSE(message_router.unregister_handler(0x0203));
    EXPECT_EQ(message_router.handler_count(), 2U);
}

TEST_F(router_test, closed_connection) {
    message_router.register_handler(0x0101, std::make_shared<echo_handler>());
    conn->close(net_errors::heartbeat_timeout);

    EXPECT_EQ(message_router.route_message(ctx, make_request(0x0101)), net_errors::connection_gone);
    EXPECT_EQ(message_router.route_message(connection_ptr(conn), make_request(0x0101)), net_errors::connection_gone);
    EXPECT_EQ(conn->frame_count(), 0U);
}

TEST_F(router_test, route_by_connection) {
    auto handler = std::make_shared<echo_handler>();
    message_router.register_handler(0x0101, handler);
    EXPECT_FALSE(message_router.route_message(connection_ptr(conn), make_request(0x0101)));
    EXPECT_EQ(handler->calls, 1);

    // 没有 session 的连接
    auto orphan = std::make_shared<fake_connection>(2);
    EXPECT_EQ(message_router.route_message(connection_ptr(orphan), make_request(0x0101)), net_errors::connection_gone);
    EXPECT_EQ(handler->calls, 1);
}

#include <gate.pb.h>
#include <gatecore/error.h>
#include <gatecore/metrics/metrics.h>
#include <gatecore/server/authenticator.h>
#include <gatecore/server/gate_server.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <thread>

using namespace gatecore;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = steady_clock::now() + timeout;
    while (!pred()) {
        if (steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

// 阻塞式的测试客户端
class test_client {
  public:
    explicit test_client(uint16_t port) : socket_(context_) {
        socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void send(uint32_t type, const google::protobuf::MessageLite& payload, uint16_t flags = message_flags::request) {
        message_header header;
        header.message_id = ++next_id_;
        header.sequence = next_id_;
        header.message_type = type;
        header.flags = flags;
        header.timestamp = get_system_clock_millis();

        std::error_code ec;
        const auto frame = codec_.encode(header, payload, ec);
        ASSERT_FALSE(ec);
        asio::write(socket_, asio::buffer(frame->begin_read(), frame->readable()));
    }

    void send_raw(const void* data, size_t size) { asio::write(socket_, asio::buffer(data, size)); }

    std::error_code receive(message& msg) {
        uint8_t head[message_header_size];
        std::error_code ec;
        asio::read(socket_, asio::buffer(head), ec);
        if (ec) {
            return ec;
        }

        read_buffer buf(head, sizeof(head));
        if (ec = codec_.decode_header(buf, msg.header); ec) {
            return ec;
        }

        msg.payload.resize(msg.header.length);
        if (msg.header.length > 0) {
            asio::read(socket_, asio::buffer(msg.payload), ec);
        }
        return ec;
    }

    message receive() {
        message msg;
        const auto ec = receive(msg);
        if (ec) {
            throw std::system_error(ec);
        }
        return msg;
    }

    [[nodiscard]] uint32_t last_id() const { return next_id_; }

  private:
    asio::io_context context_;
    asio::ip::tcp::socket socket_;
    message_codec codec_;
    uint32_t next_id_{0};
};

server_config make_config() {
    server_config config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.io_threads = 2;
    config.auth_tokens = {{"p1", 1}, {"p2", 2}};
    return config;
}

std::unique_ptr<gate_server> make_server(const server_config& config, metrics_sink_ptr metrics = {}) {
    auto auth = std::make_shared<static_token_authenticator>(config.auth_tokens);
    auto server = std::make_unique<gate_server>(config, std::move(auth), logger_ptr{}, std::move(metrics));
    server->start();
    return server;
}

gate::auth_ack login(test_client& client, const std::string& token) {
    gate::auth_req req;
    req.set_token(token);
    client.send(message_types::auth, req);

    const auto reply = client.receive();
    EXPECT_EQ(reply.header.message_type, message_types::auth);
    EXPECT_EQ(reply.header.message_id, client.last_id());
    EXPECT_TRUE(reply.header.has_flag(message_flags::response));

    gate::auth_ack ack;
    EXPECT_TRUE(ack.ParseFromString(reply.payload));
    return ack;
}

}  // namespace

TEST(gate_server, handshake_and_heartbeat) {
    auto server = make_server(make_config());
    ASSERT_NE(server->port(), 0);

    test_client client(server->port());
    gate::handshake_req hello;
    hello.set_client_version("1.0.0");
    client.send(message_types::handshake, hello);

    auto reply = client.receive();
    EXPECT_EQ(reply.header.message_type, message_types::handshake);
    gate::handshake_ack ack;
    ASSERT_TRUE(ack.ParseFromString(reply.payload));
    EXPECT_GT(ack.session_id(), 0U);
    EXPECT_EQ(ack.heartbeat_interval_ms(), 30000);

    const auto session = server->sessions().get_session(ack.session_id());
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->state(), session_state::connected);

    gate::heartbeat_req beat;
    beat.set_client_time(12345);
    client.send(message_types::heartbeat, beat);
    reply = client.receive();
    EXPECT_EQ(reply.header.message_type, message_types::heartbeat);
    EXPECT_EQ(reply.header.sequence, client.last_id());
    gate::heartbeat_ack beat_ack;
    ASSERT_TRUE(beat_ack.ParseFromString(reply.payload));
    EXPECT_EQ(beat_ack.client_time(), 12345);
    EXPECT_GT(beat_ack.server_time(), 0);
}

TEST(gate_server, business_message_requires_auth) {
    auto server = make_server(make_config());
    test_client client(server->port());

    gate::heartbeat_req payload;
    client.send(0x0101, payload);
    const auto reply = client.receive();
    EXPECT_EQ(reply.header.message_type, message_types::error);
    EXPECT_EQ(reply.header.message_id, client.last_id());
    EXPECT_TRUE(reply.header.has_flag(message_flags::error));

    gate::error_ack err;
    ASSERT_TRUE(err.ParseFromString(reply.payload));
    EXPECT_EQ(err.code(), wire_errors::unauthorized);
    EXPECT_EQ(err.error_type(), "UNAUTHORIZED");
}

TEST(gate_server, auth_failure) {
    auto server = make_server(make_config());
    test_client client(server->port());

    gate::auth_req req;
    req.set_token("nobody");
    client.send(message_types::auth, req);
    const auto reply = client.receive();
    EXPECT_EQ(reply.header.message_type, message_types::error);

    gate::error_ack err;
    ASSERT_TRUE(err.ParseFromString(reply.payload));
    EXPECT_EQ(err.code(), wire_errors::unauthorized);
    EXPECT_EQ(server->sessions().get_session_by_player(1), nullptr);
}

TEST(gate_server, authenticated_unknown_type) {
    auto server = make_server(make_config());
    test_client client(server->port());
    EXPECT_EQ(login(client, "p2").player_id(), 2U);

    gate::heartbeat_req payload;
    client.send(0x0142, payload);
    const auto reply = client.receive();
    EXPECT_EQ(reply.header.message_type, message_types::error);
    EXPECT_EQ(reply.header.message_id, client.last_id());

    gate::error_ack err;
    ASSERT_TRUE(err.ParseFromString(reply.payload));
    EXPECT_EQ(err.code(), wire_errors::unhandled_message);

    // 已经认证过的 session 再次认证
    gate::auth_req again;
    again.set_token("p2");
    client.send(message_types::auth, again);
    const auto second = client.receive();
    ASSERT_TRUE(err.ParseFromString(second.payload));
    EXPECT_EQ(err.code(), wire_errors::already_authenticated);
}

TEST(gate_server, takeover) {
    auto metrics = std::make_shared<metrics_registry>();
    auto server = make_server(make_config(), metrics);

    test_client first(server->port());
    const auto first_ack = login(first, "p1");
    EXPECT_EQ(first_ack.player_id(), 1U);
    EXPECT_FALSE(first_ack.takeover());

    const auto first_session = server->sessions().get_session_by_player(1);
    ASSERT_NE(first_session, nullptr);
    EXPECT_EQ(first_session->state(), session_state::authenticated);
    const auto first_conn = server->connections().get(first_session->connection_id());
    ASSERT_NE(first_conn, nullptr);

    test_client second(server->port());
    const auto second_ack = login(second, "p1");
    EXPECT_EQ(second_ack.player_id(), 1U);
    EXPECT_TRUE(second_ack.takeover());
    EXPECT_NE(second_ack.session_id(), first_ack.session_id());

    // 旧连接先收到通知再被断开
    const auto notice = first.receive();
    EXPECT_EQ(notice.header.message_type, message_types::disconnect);
    EXPECT_TRUE(notice.header.has_flag(message_flags::async));
    gate::disconnect_brd brd;
    ASSERT_TRUE(brd.ParseFromString(notice.payload));
    EXPECT_EQ(brd.reason(), "takeover");

    message msg;
    EXPECT_TRUE(first.receive(msg));

    ASSERT_TRUE(wait_until([&]() { return server->sessions().get_session(first_ack.session_id()) == nullptr; }));
    EXPECT_EQ(first_session->state(), session_state::disconnected);
    EXPECT_EQ(first_conn->close_reason(), net_errors::takeover);
    EXPECT_EQ(server->sessions().get_session_by_player(1)->id(), second_ack.session_id());
    EXPECT_EQ(metrics->counter("session.takeover"), 1);

    // 旧连接上迟到的 pong 不影响任何状态
    EXPECT_FALSE(server->heartbeat().on_pong(first_conn->id()));
    message pong;
    pong.header.message_id = 100;
    pong.header.message_type = message_types::pong;
    pong.header.timestamp = get_system_clock_millis();
    EXPECT_EQ(server->message_router().route_message(first_conn, pong), net_errors::connection_gone);
    EXPECT_EQ(server->sessions().get_session_by_player(1)->id(), second_ack.session_id());
}

TEST(gate_server, client_disconnect) {
    auto server = make_server(make_config());
    {
        test_client client(server->port());
        login(client, "p1");
        ASSERT_EQ(server->connections().size(), 1U);

        gate::disconnect_brd bye;
        bye.set_reason("logout");
        client.send(message_types::disconnect, bye);

        message msg;
        EXPECT_TRUE(client.receive(msg));
    }

    ASSERT_TRUE(wait_until([&]() { return server->connections().size() == 0 && server->sessions().session_count() == 0; }));
    EXPECT_EQ(server->heartbeat().tracked_count(), 0U);
}

TEST(gate_server, send_queue_overflow_closes) {
    auto metrics = std::make_shared<metrics_registry>();
    auto config = make_config();
    config.send_queue_limit = 1;
    auto server = make_server(config, metrics);

    // 客户端登录后不再读取
    test_client client(server->port());
    login(client, "p1");
    const auto session = server->sessions().get_session_by_player(1);
    ASSERT_NE(session, nullptr);
    const auto conn = server->connections().get(session->connection_id());
    ASSERT_NE(conn, nullptr);

    message_codec codec;
    message_header header;
    header.message_type = 0x0101;
    header.flags = message_flags::async;
    const std::string payload(64 * 1024, 'x');

    std::error_code send_ec;
    for (int i = 0; i < 10000 && !send_ec; ++i) {
        std::error_code ec;
        const auto frame = codec.encode(header, payload, ec);
        ASSERT_FALSE(ec);
        send_ec = conn->send(frame);
    }

    EXPECT_EQ(send_ec, net_errors::send_queue_full);
    EXPECT_EQ(conn->close_reason(), net_errors::send_queue_full);
    EXPECT_FALSE(conn->is_active());
    std::error_code late_ec;
    EXPECT_EQ(conn->send(codec.encode(header, "late", late_ec)), net_errors::connection_gone);

    ASSERT_TRUE(wait_until([&]() { return server->connections().size() == 0 && server->sessions().session_count() == 0; }));
    EXPECT_EQ(server->heartbeat().tracked_count(), 0U);

    // 断开时没写出的帧被丢弃，计数归零
    const auto tcp = std::dynamic_pointer_cast<tcp_connection>(conn);
    ASSERT_NE(tcp, nullptr);
    EXPECT_TRUE(wait_until([&]() { return tcp->queued_frames() == 0; }));
}

TEST(gate_server, garbage_header_closes_without_reply) {
    auto metrics = std::make_shared<metrics_registry>();
    auto server = make_server(make_config(), metrics);

    test_client client(server->port());
    ASSERT_TRUE(wait_until([&]() { return server->connections().size() == 1; }));

    uint8_t garbage[message_header_size];
    std::fill(std::begin(garbage), std::end(garbage), uint8_t{0xAB});
    client.send_raw(garbage, sizeof(garbage));

    // 帧错误不回应答，直接断开
    message msg;
    EXPECT_TRUE(client.receive(msg));
    ASSERT_TRUE(wait_until([&]() { return server->connections().size() == 0; }));
    EXPECT_EQ(server->sessions().session_count(), 0U);
    EXPECT_EQ(metrics->counter("codec.frame_error"), 1);
}

#pragma once
#include <gatecore/heartbeat/heartbeat_monitor.h>
#include <gatecore/net/connection_registry.h>
#include <gatecore/net/tcp_connection.h>
#include <gatecore/router/router.h>
#include <gatecore/server/authenticator.h>
#include <gatecore/server/server_config.h>
#include <gatecore/session/session_manager.h>

#include <asio/io_context.hpp>
#include <thread>
#include <vector>

namespace gatecore {

/*
 * 网关服务: 监听端口，把连接、session、心跳和路由组装在一起
 * 连接断开的原因不论是什么，都会从心跳、连接表和 session 表中清理掉
 */
class gate_server {
  public:
    using asio_token = asio::as_tuple_t<asio::use_awaitable_t<>>;
    using tcp = asio::ip::tcp;
    using tcp_acceptor = asio_token::as_default_on_t<tcp::acceptor>;

    GATECORE_API gate_server(server_config config, authenticator_ptr auth, logger_ptr log = {},
                             metrics_sink_ptr metrics = {});

    GATECORE_API ~gate_server() noexcept;

    GATECORE_NON_COPYABLE(gate_server)

    // 绑定端口失败时抛出 std::system_error
    GATECORE_API void start();

    GATECORE_API void stop();

    GATECORE_API void join();

    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] const server_config& config() const noexcept { return config_; }

    [[nodiscard]] asio::io_context& context() noexcept { return context_; }

    [[nodiscard]] const message_codec& codec() const noexcept { return codec_; }

    [[nodiscard]] router& message_router() noexcept { return router_; }

    [[nodiscard]] session_manager& sessions() noexcept { return sessions_; }

    [[nodiscard]] connection_registry& connections() noexcept { return registry_; }

    [[nodiscard]] heartbeat_monitor& heartbeat() noexcept { return heartbeat_; }

  private:
    asio::awaitable<void> co_accept();

    void on_accept(tcp::socket socket);

    void on_message(const connection_ptr& conn, message&& msg);

    void on_connection_removed(const connection_ptr& conn, std::error_code reason);

    // 通知被顶号的连接并断开
    void evict_session(const session_ptr& evicted);

    void reply_error(const session_context& ctx, const message_header& request, int32_t code, std::string_view text);

    void register_system_handlers();

    std::error_code handle_handshake(const session_context& ctx, const message& msg);

    std::error_code handle_auth(const session_context& ctx, const message& msg);

    std::error_code handle_heartbeat(const session_context& ctx, const message& msg);

    std::error_code handle_ping(const session_context& ctx, const message& msg);

    std::error_code handle_pong(const session_context& ctx, const message& msg);

    std::error_code handle_disconnect(const session_context& ctx, const message& msg);

    // 最先构造，最后析构
    asio::io_context context_;

    server_config config_;
    authenticator_ptr authenticator_;
    logger_ptr logger_;
    metrics_sink_ptr metrics_;

    message_codec codec_;
    connection_registry registry_;
    session_manager sessions_;
    heartbeat_monitor heartbeat_;
    router router_;

    tcp_acceptor acceptor_;
    uint16_t port_{0};
    std::atomic<connection_id> conn_id_allocator_{0};
    std::atomic_bool running_{false};
    std::vector<std::thread> threads_;
};

}  // namespace gatecore

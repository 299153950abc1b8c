#pragma once
#include <gatecore/log/types.h>
#include <gatecore/metrics/metrics.h>
#include <gatecore/net/connection.h>

#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>
#include <deque>
#include <functional>

namespace gatecore {

struct tcp_connection_options {
    // 发送队列最多缓存的帧数
    size_t send_queue_limit{1024};
    // 一次 gather 写出的最大帧数
    size_t max_buffers{64};
    bool no_delay{true};
};

/*
 * 每个连接一个 strand，读协程和写协程都运行在这个 strand 上
 * 读协程按顺序解帧并回调 message_handle，同一连接的消息不会乱序
 */
class tcp_connection final : public connection {
  public:
    using asio_token = asio::as_tuple_t<asio::use_awaitable_t<>>;
    using tcp = asio::ip::tcp;
    using strand_type = asio::strand<asio::any_io_executor>;
    using tcp_socket = asio_token::as_default_on_t<tcp::socket>;
    using asio_timer = asio_token::as_default_on_t<asio::steady_timer>;

    using message_handle = std::function<void(const connection_ptr&, message&&)>;
    using close_handle = std::function<void(const connection_ptr&, std::error_code)>;

    GATECORE_API tcp_connection(connection_id id, tcp::socket socket, const message_codec& codec,
                                tcp_connection_options options, logger_ptr log = {}, metrics_sink_ptr metrics = {});

    ~tcp_connection() noexcept override = default;

    GATECORE_NON_COPYABLE(tcp_connection)

    GATECORE_API void register_message_handle(message_handle handle);

    GATECORE_API void register_close_handle(close_handle handle);

    // 启动读写协程，需要先注册回调
    GATECORE_API void start();

    // 与 close 并发时，晚于写协程退出才入队的帧会被丢弃
    GATECORE_API std::error_code send(byte_buffer_ptr frame) override;

    // 已接受但还没写出的帧数
    [[nodiscard]] size_t queued_frames() const noexcept { return pending_.load(std::memory_order::relaxed); }

    // 已在队列中的帧会先发送完再关闭 socket，send_queue_full 时立即关闭
    GATECORE_API void close(std::error_code reason) override;

  private:
    asio::awaitable<void> co_read();

    asio::awaitable<void> co_write();

    void on_closed(std::error_code reason);

    void close_socket();

    strand_type strand_;
    tcp_socket socket_;
    asio_timer write_blocker_;
    const message_codec& codec_;
    tcp_connection_options options_;
    logger_ptr logger_;
    metrics_sink_ptr metrics_;
    message_handle message_handle_;
    close_handle close_handle_;
    std::atomic_size_t pending_{0};
    // 以下只在 strand 上访问
    std::deque<byte_buffer_ptr> write_deque_;
    bool closing_{false};
    bool close_notified_{false};
    bool write_stopped_{false};
};

using tcp_connection_ptr = std::shared_ptr<tcp_connection>;

// 格式化 ip:port，ipv6 带方括号
GATECORE_API std::string to_string(const asio::ip::tcp::endpoint& endpoint);

}  // namespace gatecore

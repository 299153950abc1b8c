#pragma once
#include <gatecore/log/types.h>
#include <gatecore/metrics/metrics.h>
#include <gatecore/net/connection.h>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace gatecore {

// timeout 需要小于 interval，对端在下一次 tick 之前回应即视为存活
// 一直不回应的连接在 max_missed * interval 时被断开
struct heartbeat_options {
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds timeout{10000};
    uint32_t max_missed{3};
};

struct heartbeat_status {
    steady_point last_sent;
    steady_point last_received;
    uint32_t missed_count{0};
    // 最近一次探测的往返时间
    steady_clock::duration rtt{0};
    bool is_alive{true};
};

/*
 * 单个定时器轮询所有连接，不为每个连接创建定时器
 * 每次 tick: 超时的连接 missed_count 加一，达到 max_missed 时断开，否则发送 ping 探测
 */
class heartbeat_monitor {
  public:
    using disconnect_handle = std::function<void(const connection_ptr&, const heartbeat_status&)>;

    GATECORE_API heartbeat_monitor(const message_codec& codec, heartbeat_options options = {}, logger_ptr log = {},
                                   metrics_sink_ptr metrics = {});

    GATECORE_API ~heartbeat_monitor() noexcept;

    GATECORE_NON_COPYABLE(heartbeat_monitor)

    GATECORE_API void set_disconnect_handle(disconnect_handle handle);

    GATECORE_API void track(const connection_ptr& conn, steady_point now = steady_clock::now());

    GATECORE_API void untrack(connection_id id);

    // 客户端主动发来的心跳，不计算 rtt
    GATECORE_API bool record_heartbeat(connection_id id, steady_point now = steady_clock::now());

    // 对探测的回应，未跟踪的连接直接忽略
    GATECORE_API bool on_pong(connection_id id, steady_point now = steady_clock::now());

    [[nodiscard]] GATECORE_API std::optional<heartbeat_status> status(connection_id id) const;

    [[nodiscard]] GATECORE_API size_t tracked_count() const;

    [[nodiscard]] GATECORE_API heartbeat_options options() const;

    // 运行中修改也是安全的，下一次 tick 生效
    // timeout 不小于 interval 时仍然生效，但会打印警告
    GATECORE_API void reconfigure(heartbeat_options options);

    // 返回本次断开的连接数量
    GATECORE_API size_t tick(steady_point now = steady_clock::now());

    GATECORE_API void start(const asio::any_io_executor& executor);

    GATECORE_API void stop();

  private:
    struct tracked {
        connection_ptr conn;
        heartbeat_status status;
    };

    asio::awaitable<void> co_tick();

    // 在 strand 上取消定时器
    void cancel_timer();

    void send_ping(const connection_ptr& conn);

    const message_codec& codec_;
    logger_ptr logger_;
    metrics_sink_ptr metrics_;

    mutable std::mutex mtx_;
    heartbeat_options options_;
    disconnect_handle disconnect_handle_;
    std::unordered_map<connection_id, tracked> tracked_;

    // timer_ 只在 strand_ 上等待和取消
    std::mutex timer_mtx_;
    std::optional<asio::strand<asio::any_io_executor>> strand_;
    std::optional<asio::steady_timer> timer_;
    std::atomic_bool stopped_{false};
};

}  // namespace gatecore

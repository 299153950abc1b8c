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
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gatecore {

/*
 * 持有所有存活的连接，支持广播、分组广播和不活跃连接的清理
 * 连接被移除时回调 remove_handle（锁外调用，每个连接只回调一次）
 */
class connection_registry {
  public:
    using remove_handle = std::function<void(const connection_ptr&, std::error_code)>;

    // max_connections 为 0 表示不限制
    GATECORE_API explicit connection_registry(size_t max_connections = 0, logger_ptr log = {},
                                              metrics_sink_ptr metrics = {});

    GATECORE_API ~connection_registry() noexcept;

    GATECORE_NON_COPYABLE(connection_registry)

    GATECORE_API void set_remove_handle(remove_handle handle);

    // 达到上限时返回 net_errors::connection_limit
    GATECORE_API std::error_code add(const connection_ptr& conn);

    // 幂等，移除的连接会被关闭
    GATECORE_API void remove(connection_id id, std::error_code reason = {});

    [[nodiscard]] GATECORE_API connection_ptr get(connection_id id) const;

    [[nodiscard]] GATECORE_API size_t size() const;

    [[nodiscard]] GATECORE_API std::vector<connection_ptr> connections() const;

    GATECORE_API bool join_group(connection_id id, const std::string& group);

    GATECORE_API void leave_group(connection_id id, const std::string& group);

    [[nodiscard]] GATECORE_API size_t group_size(const std::string& group) const;

    // 单个连接发送失败不影响其他连接，返回成功投递的数量
    GATECORE_API size_t broadcast(const byte_buffer_ptr& frame);

    GATECORE_API size_t broadcast_to_group(const std::string& group, const byte_buffer_ptr& frame);

    // 移除并关闭 last_activity 早于 now - timeout 的连接，返回移除数量
    GATECORE_API size_t cleanup_inactive(std::chrono::steady_clock::duration timeout, steady_point now = steady_clock::now());

    GATECORE_API void close_all(std::error_code reason);

    // 后台定期清理
    GATECORE_API void start(const asio::any_io_executor& executor, std::chrono::steady_clock::duration interval,
                            std::chrono::steady_clock::duration timeout);

    GATECORE_API void stop();

  private:
    asio::awaitable<void> co_cleanup(std::chrono::steady_clock::duration interval, std::chrono::steady_clock::duration timeout);

    size_t deliver(const std::vector<connection_ptr>& targets, const byte_buffer_ptr& frame);

    // 需要持有写锁
    connection_ptr erase_unlock(connection_id id);

    size_t max_connections_;
    logger_ptr logger_;
    metrics_sink_ptr metrics_;
    remove_handle remove_handle_;

    mutable std::shared_mutex mtx_;
    std::unordered_map<connection_id, connection_ptr> connections_;
    std::unordered_map<std::string, std::unordered_set<connection_id>> groups_;
    std::unordered_map<connection_id, std::unordered_set<std::string>> memberships_;

    // timer_ 只在 strand_ 上等待和取消
    std::mutex timer_mtx_;
    std::optional<asio::strand<asio::any_io_executor>> strand_;
    std::optional<asio::steady_timer> timer_;
    std::atomic_bool stopped_{false};
};

}  // namespace gatecore

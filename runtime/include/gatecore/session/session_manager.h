#pragma once
#include <gatecore/log/types.h>
#include <gatecore/metrics/metrics.h>
#include <gatecore/session/session.h>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <atomic>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace gatecore {

struct session_manager_options {
    std::chrono::seconds idle_timeout{1800};
    // 超过 idle_timeout + idle_grace 才会被移除
    std::chrono::seconds idle_grace{0};
};

struct bind_result {
    std::error_code ec;
    // 被顶掉的旧 session，已经进入 disconnecting
    session_ptr evicted;
};

struct session_stats {
    size_t total{0};
    size_t active{0};
    size_t idle{0};
    size_t authenticated{0};
    size_t bound{0};
};

/*
 * session 主表、玩家索引和连接索引由同一把读写锁保护
 * 一个玩家同时最多绑定一个 session，后登录的顶掉先登录的
 */
class session_manager {
  public:
    using remove_handle = std::function<void(const session_ptr&, std::error_code)>;

    GATECORE_API explicit session_manager(session_manager_options options = {}, logger_ptr log = {},
                                          metrics_sink_ptr metrics = {});

    GATECORE_API ~session_manager() noexcept;

    GATECORE_NON_COPYABLE(session_manager)

    // 移除时回调，锁外调用
    GATECORE_API void set_remove_handle(remove_handle handle);

    GATECORE_API session_id next_session_id() noexcept;

    // id 已存在时旧的 session 会先被移除
    GATECORE_API session_ptr create_session(session_id id, connection_id conn);

    [[nodiscard]] GATECORE_API session_ptr get_session(session_id id) const;

    [[nodiscard]] GATECORE_API session_ptr get_session_by_player(player_id player) const;

    [[nodiscard]] GATECORE_API session_ptr get_session_by_connection(connection_id conn) const;

    GATECORE_API bind_result bind_player_to_session(session_id id, player_id player);

    GATECORE_API void unbind_player(player_id player);

    // 幂等
    GATECORE_API void remove_session(session_id id, std::error_code reason = {});

    GATECORE_API void remove_session_by_connection(connection_id conn, std::error_code reason = {});

    [[nodiscard]] GATECORE_API std::vector<session_ptr> get_all_sessions() const;

    [[nodiscard]] GATECORE_API std::vector<session_ptr> get_active_sessions() const;

    [[nodiscard]] GATECORE_API size_t session_count() const;

    [[nodiscard]] GATECORE_API session_stats stats() const;

    // 空闲超时的进入 idle，超过宽限期或已经 disconnected 的移除，返回移除数量
    GATECORE_API size_t sweep_idle(steady_point now = steady_clock::now());

    GATECORE_API void start(const asio::any_io_executor& executor, std::chrono::steady_clock::duration interval);

    GATECORE_API void stop();

  private:
    asio::awaitable<void> co_sweep(std::chrono::steady_clock::duration interval);

    // 需要持有写锁
    session_ptr erase_unlock(session_id id);

    session_manager_options options_;
    logger_ptr logger_;
    metrics_sink_ptr metrics_;
    remove_handle remove_handle_;
    std::atomic<session_id> id_allocator_{0};

    mutable std::shared_mutex mtx_;
    std::unordered_map<session_id, session_ptr> sessions_;
    std::unordered_map<player_id, session_id> players_;
    std::unordered_map<connection_id, session_id> connections_;

    // timer_ 只在 strand_ 上等待和取消
    std::mutex timer_mtx_;
    std::optional<asio::strand<asio::any_io_executor>> strand_;
    std::optional<asio::steady_timer> timer_;
    std::atomic_bool stopped_{false};
};

}  // namespace gatecore

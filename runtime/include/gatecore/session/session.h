#pragma once
#include <gatecore/config.h>
#include <gatecore/net/connection.h>
#include <gatecore/utils/time.h>

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace gatecore {

using session_id = uint64_t;

// 0 表示未绑定玩家
using player_id = uint64_t;

/*
 * created -> connected -> authenticated -> active <-> idle -> disconnecting -> disconnected
 * created 可以直接进入 authenticated，disconnected 之后 session 不能再使用
 */
enum class session_state : uint8_t {
    created = 0,
    connected,
    authenticated,
    active,
    idle,
    disconnecting,
    disconnected,
};

GATECORE_API std::string_view to_string_view(session_state state) noexcept;

[[nodiscard]] GATECORE_API bool is_valid_transition(session_state from, session_state to) noexcept;

class session_manager;

class session {
  public:
    GATECORE_API session(session_id id, gatecore::connection_id conn, std::chrono::seconds idle_timeout);

    ~session() noexcept = default;

    GATECORE_NON_COPYABLE(session)

    [[nodiscard]] session_id id() const noexcept { return id_; }

    [[nodiscard]] gatecore::connection_id connection_id() const noexcept { return connection_id_; }

    [[nodiscard]] steady_point created_at() const noexcept { return created_at_; }

    [[nodiscard]] std::chrono::seconds idle_timeout() const noexcept { return idle_timeout_; }

    [[nodiscard]] GATECORE_API gatecore::player_id player_id() const;

    [[nodiscard]] GATECORE_API session_state state() const;

    [[nodiscard]] GATECORE_API steady_point last_activity() const;

    // 认证成功时的系统时间，未认证时为空
    [[nodiscard]] GATECORE_API std::optional<std::chrono::system_clock::time_point> auth_time() const;

    [[nodiscard]] GATECORE_API bool is_authenticated() const;

    // 校验状态机，不允许的切换返回 session_errors::invalid_transition
    GATECORE_API std::error_code transition(session_state next);

    // 只能从 created 或 connected 进入
    GATECORE_API std::error_code authenticate();

    // 收到消息时调用，authenticated/idle 会回到 active
    GATECORE_API void update_activity(steady_point now = steady_clock::now());

    GATECORE_API void set_data(const std::string& key, std::string value);

    [[nodiscard]] GATECORE_API std::optional<std::string> get_data(const std::string& key) const;

    GATECORE_API bool remove_data(const std::string& key);

  private:
    friend class session_manager;

    void set_player(gatecore::player_id player);

    // 强制进入 disconnecting，已经是 disconnecting/disconnected 时返回 false
    bool begin_disconnect();

    void mark_disconnected();

    // 超时则进入 idle，返回空闲时长
    steady_clock::duration check_idle(steady_point now);

    const session_id id_;
    const gatecore::connection_id connection_id_;
    const steady_point created_at_;
    const std::chrono::seconds idle_timeout_;

    mutable std::mutex mtx_;
    gatecore::player_id player_id_{0};
    session_state state_{session_state::created};
    steady_point last_activity_;
    std::optional<std::chrono::system_clock::time_point> auth_time_;
    std::unordered_map<std::string, std::string> data_;
};

using session_ptr = std::shared_ptr<session>;

}  // namespace gatecore

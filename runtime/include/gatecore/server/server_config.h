#pragma once
#include <gatecore/heartbeat/heartbeat_monitor.h>
#include <gatecore/session/session_manager.h>
#include <gatecore/utils/toml_types.hpp>

#include <string>
#include <unordered_map>

namespace gatecore {

struct server_config {
    // 空字符串表示监听所有地址（ipv6 双栈）
    std::string host;
    // 0 表示由系统分配端口
    uint16_t port{9090};
    size_t io_threads{1};
    size_t max_connections{10000};
    uint32_t max_frame_size{default_max_frame_size};
    size_t send_queue_limit{1024};
    bool require_auth{true};
    std::string log_config;

    heartbeat_options heartbeat;

    session_manager_options session;
    std::chrono::seconds sweep_interval{300};

    std::chrono::seconds inactive_timeout{300};
    std::chrono::seconds cleanup_interval{30};

    // token -> player_id，给 static_token_authenticator 使用
    std::unordered_map<std::string, uint64_t> auth_tokens;
};

// 所有字段都可选，类型错误或取值越界时抛出 std::logic_error
GATECORE_API server_config parse_server_config(const toml_table_t& root);

GATECORE_API server_config load_server_config(const std::string& path);

}  // namespace gatecore

#pragma once
#include <gatecore/config.h>

#include <system_error>

namespace gatecore {

enum class codec_errors {
    // 数据不足一个完整的消息头或消息体
    short_buffer = 1,
    // 魔数不匹配
    bad_magic,
    // 声明的消息体长度超过上限
    bad_length,
    // 编码时消息体超过上限
    payload_too_large,
    // protobuf 序列化失败，一般是缺少 required 字段
    serialize_failed,
};

enum class session_errors {
    session_not_found = 1,
    // 状态机不允许的切换
    invalid_transition,
    already_authenticated,
    not_authenticated,
    // 玩家 id 为 0
    invalid_player,
};

enum class router_errors {
    // 消息头字段校验失败
    invalid_message = 1,
    unhandled_message,
    handler_failed,
    // protobuf 消息体解析失败
    bad_payload,
};

enum class net_errors {
    // 连接已经被移除
    connection_gone = 1,
    // 发送队列已满
    send_queue_full,
    connection_limit,
    // 主动断开
    initiative_disconnect,
    heartbeat_timeout,
    idle_timeout,
    // 同一玩家在新连接上登录
    takeover,
    frame_error,
    server_shutdown,
};

enum class auth_errors {
    invalid_credential = 1,
    empty_credential,
};

GATECORE_API const std::error_category& get_codec_category();

GATECORE_API const std::error_category& get_session_category();

GATECORE_API const std::error_category& get_router_category();

GATECORE_API const std::error_category& get_net_category();

GATECORE_API const std::error_category& get_auth_category();

}  // namespace gatecore

template <>
struct std::is_error_code_enum<gatecore::codec_errors> {
    static constexpr bool value = true;
};

template <>
struct std::is_error_code_enum<gatecore::session_errors> {
    static constexpr bool value = true;
};

template <>
struct std::is_error_code_enum<gatecore::router_errors> {
    static constexpr bool value = true;
};

template <>
struct std::is_error_code_enum<gatecore::net_errors> {
    static constexpr bool value = true;
};

template <>
struct std::is_error_code_enum<gatecore::auth_errors> {
    static constexpr bool value = true;
};

namespace gatecore {

inline std::error_code make_error_code(codec_errors e) { return {static_cast<int>(e), get_codec_category()}; }

inline std::error_code make_error_code(session_errors e) { return {static_cast<int>(e), get_session_category()}; }

inline std::error_code make_error_code(router_errors e) { return {static_cast<int>(e), get_router_category()}; }

inline std::error_code make_error_code(net_errors e) { return {static_cast<int>(e), get_net_category()}; }

inline std::error_code make_error_code(auth_errors e) { return {static_cast<int>(e), get_auth_category()}; }

}  // namespace gatecore

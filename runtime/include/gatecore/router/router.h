#pragma once
#include <gatecore/log/types.h>
#include <gatecore/metrics/metrics.h>
#include <gatecore/net/connection.h>
#include <gatecore/session/session.h>

#include <functional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace gatecore {

class session_manager;

// 处理消息时的上下文
struct session_context {
    session_ptr session;
    connection_ptr connection;
    const message_codec* codec{nullptr};

    // 回复与请求关联的消息: message_id 和 sequence 与请求相同
    GATECORE_API std::error_code reply(const message_header& request, uint32_t message_type,
                                       const google::protobuf::MessageLite& payload) const;

    GATECORE_API std::error_code reply(const message_header& request, uint32_t message_type, std::string_view payload) const;

    // 回复错误，code 取值见 wire_errors
    GATECORE_API std::error_code reply_error(const message_header& request, int32_t code, std::string_view text) const;
};

class message_handler {
  public:
    message_handler() = default;

    virtual ~message_handler() noexcept = default;

    GATECORE_NON_COPYABLE(message_handler)

    virtual std::error_code handle(const session_context& ctx, const message& msg) = 0;
};

using message_handler_ptr = std::shared_ptr<message_handler>;

using handler_func = std::function<std::error_code(const session_context&, const message&)>;

class router {
  public:
    GATECORE_API explicit router(const message_codec& codec, session_manager* sessions = nullptr, logger_ptr log = {},
                                 metrics_sink_ptr metrics = {});

    GATECORE_NON_COPYABLE(router)

    ~router() noexcept = default;

    // 同一类型重复注册时后注册的生效
    GATECORE_API void register_handler(uint32_t message_type, handler_func handler);

    GATECORE_API void register_handler(uint32_t message_type, message_handler_ptr handler);

    GATECORE_API bool unregister_handler(uint32_t message_type);

    [[nodiscard]] GATECORE_API bool has_handler(uint32_t message_type) const;

    [[nodiscard]] GATECORE_API size_t handler_count() const;

    [[nodiscard]] GATECORE_API std::vector<uint32_t> registered_types() const;

    // magic 正确，message_type、message_id 非零，timestamp 为正
    [[nodiscard]] GATECORE_API static std::error_code validate_message(const message& msg);

    /**
     * \brief 分发一条消息
     * \return 校验失败为 router_errors::invalid_message；未注册的类型回复 UNHANDLED_MESSAGE 后返回成功；
     *         handler 的错误原样返回；连接已关闭为 net_errors::connection_gone
     */
    GATECORE_API std::error_code route_message(const session_context& ctx, const message& msg);

    // 通过 session_manager 找到连接对应的 session 再分发
    GATECORE_API std::error_code route_message(const connection_ptr& conn, const message& msg);

  private:
    const message_codec& codec_;
    session_manager* sessions_;
    logger_ptr logger_;
    metrics_sink_ptr metrics_;

    mutable std::shared_mutex mtx_;
    std::unordered_map<uint32_t, handler_func> handlers_;
};

}  // namespace gatecore

#include <gatecore/error.h>
#include <gatecore/log/log.h>
#include <gatecore/router/router.h>
#include <gatecore/session/session_manager.h>

#include <algorithm>

namespace gatecore {

std::error_code session_context::reply(const message_header& request, uint32_t message_type,
                                       const google::protobuf::MessageLite& payload) const {
    if (!connection || codec == nullptr) {
        return net_errors::connection_gone;
    }
    return connection->send_message(*codec, make_response_header(request, message_type), payload);
}

std::error_code session_context::reply(const message_header& request, uint32_t message_type,
                                       std::string_view payload) const {
    if (!connection || codec == nullptr) {
        return net_errors::connection_gone;
    }
    return connection->send_message(*codec, make_response_header(request, message_type), payload);
}

std::error_code session_context::reply_error(const message_header& request, int32_t code, std::string_view text) const {
    if (!connection || codec == nullptr) {
        return net_errors::connection_gone;
    }
    return connection->send_message(*codec, make_error_response(request, code, text));
}

router::router(const message_codec& codec, session_manager* sessions, logger_ptr log, metrics_sink_ptr metrics)
    : codec_(codec), sessions_(sessions), logger_(std::move(log)), metrics_(metrics_or_null(std::move(metrics))) {}

void router::register_handler(uint32_t message_type, handler_func handler) {
    bool replaced = false;
    {
        std::unique_lock lock(mtx_);
        replaced = handlers_.contains(message_type);
        handlers_.insert_or_assign(message_type, std::move(handler));
    }

    if (replaced) {
        warn(logger_, "message type:{:#06x} handler replaced", message_type);
    }
}

void router::register_handler(uint32_t message_type, message_handler_ptr handler) {
    register_handler(message_type, [handler = std::move(handler)](const session_context& ctx, const message& msg) {
        return handler->handle(ctx, msg);
    });
}

bool router::unregister_handler(uint32_t message_type) {
    std::unique_lock lock(mtx_);
    return handlers_.erase(message_type) > 0;
}

bool router::has_handler(uint32_t message_type) const {
    std::shared_lock lock(mtx_);
    return handlers_.contains(message_type);
}

size_t router::handler_count() const {
    std::shared_lock lock(mtx_);
    return handlers_.size();
}

std::vector<uint32_t> router::registered_types() const {
    std::vector<uint32_t> result;
    {
        std::shared_lock lock(mtx_);
        result.reserve(handlers_.size());
        for (const auto& [type, _] : handlers_) {
            result.emplace_back(type);
        }
    }
    std::ranges::sort(result);
    return result;
}

std::error_code router::validate_message(const message& msg) {
    const auto& header = msg.header;
    if (header.magic != protocol_magic || header.message_type == 0 || header.message_id == 0 || header.timestamp <= 0) {
        return router_errors::invalid_message;
    }
    return {};
}

std::error_code router::route_message(const session_context& ctx, const message& msg) {
    if (!ctx.connection || !ctx.connection->is_active()) {
        return net_errors::connection_gone;
    }

    // 处理过程中的日志都带上连接、会话和玩家
    const log_scope scope({ctx.connection->id(), ctx.session ? ctx.session->id() : 0,
                           ctx.session ? ctx.session->player_id() : 0});

    const auto& header = msg.header;
    if (const auto ec = validate_message(msg)) {
        metrics_->inc_counter("router.invalid", 1);
        warn(logger_, "invalid message, type:{:#06x} id:{} timestamp:{}", header.message_type, header.message_id,
             header.timestamp);
        if (const auto send_ec = ctx.reply_error(header, wire_errors::invalid_message, "invalid message header")) {
            debug(logger_, "reply invalid message fail, {}", send_ec.message());
        }
        return ec;
    }

    handler_func handler;
    {
        std::shared_lock lock(mtx_);
        if (const auto it = handlers_.find(header.message_type); it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        metrics_->inc_counter("router.unhandled", 1);
        warn(logger_, "unhandled message type:{:#06x} id:{}", header.message_type, header.message_id);
        const auto text = fmt::format("message type {:#06x} is not handled", header.message_type);
        if (const auto send_ec = ctx.reply_error(header, wire_errors::unhandled_message, text)) {
            debug(logger_, "reply unhandled message fail, {}", send_ec.message());
        }
        return {};
    }

    std::error_code ec;
    const auto start = steady_clock::now();
    try {
        ec = handler(ctx, msg);
    } catch (const std::exception& e) {
        error(logger_, "message type:{:#06x} id:{} handler throw, {}", header.message_type, header.message_id, e.what());
        ec = router_errors::handler_failed;
    }
    metrics_->observe_duration("router.handle", steady_clock::now() - start);
    metrics_->inc_counter("router.dispatched", 1);

    if (ec) {
        metrics_->inc_counter("router.handler_error", 1);
        error(logger_, "message type:{:#06x} id:{} handle fail, {}", header.message_type, header.message_id,
              ec.message());
    }
    return ec;
}

std::error_code router::route_message(const connection_ptr& conn, const message& msg) {
    if (!conn || !conn->is_active()) {
        return net_errors::connection_gone;
    }

    session_context ctx{nullptr, conn, &codec_};
    if (sessions_ != nullptr) {
        ctx.session = sessions_->get_session_by_connection(conn->id());
        if (!ctx.session) {
            return net_errors::connection_gone;
        }
    }

    return route_message(ctx, msg);
}

}  // namespace gatecore

#include <gatecore/error.h>

#include <string>

namespace gatecore {

class codec_category final : public std::error_category {
  public:
    [[nodiscard]] const char* name() const noexcept override { return "gatecore.codec"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<codec_errors>(value)) {
            case codec_errors::short_buffer:
                return "short buffer";
            case codec_errors::bad_magic:
                return "bad magic";
            case codec_errors::bad_length:
                return "declared payload length exceeds max frame size";
            case codec_errors::payload_too_large:
                return "payload exceeds max frame size";
            case codec_errors::serialize_failed:
                return "payload serialize failed";
            default:  // NOLINT(clang-diagnostic-covered-switch-default)
                return "gatecore.codec error";
        }
    }
};

const std::error_category& get_codec_category() {
    static codec_category category;
    return category;
}

class session_category final : public std::error_category {
  public:
    [[nodiscard]] const char* name() const noexcept override { return "gatecore.session"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<session_errors>(value)) {
            case session_errors::session_not_found:
                return "session not found";
            case session_errors::invalid_transition:
                return "invalid session state transition";
            case session_errors::already_authenticated:
                return "session already authenticated";
            case session_errors::not_authenticated:
                return "session not authenticated";
            case session_errors::invalid_player:
                return "invalid player id";
            default:  // NOLINT(clang-diagnostic-covered-switch-default)
                return "gatecore.session error";
        }
    }
};

const std::error_category& get_session_category() {
    static session_category category;
    return category;
}

class router_category final : public std::error_category {
  public:
    [[nodiscard]] const char* name() const noexcept override { return "gatecore.router"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<router_errors>(value)) {
            case router_errors::invalid_message:
                return "invalid message";
            case router_errors::unhandled_message:
                return "unhandled message";
            case router_errors::handler_failed:
                return "handler failed";
            case router_errors::bad_payload:
                return "bad payload";
            default:  // NOLINT(clang-diagnostic-covered-switch-default)
                return "gatecore.router error";
        }
    }
};

const std::error_category& get_router_category() {
    static router_category category;
    return category;
}

class net_category final : public std::error_category {
  public:
    [[nodiscard]] const char* name() const noexcept override { return "gatecore.net"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<net_errors>(value)) {
            case net_errors::connection_gone:
                return "connection gone";
            case net_errors::send_queue_full:
                return "send queue full";
            case net_errors::connection_limit:
                return "connection limit reached";
            case net_errors::initiative_disconnect:
                return "application initiative to disconnect";
            case net_errors::heartbeat_timeout:
                return "heartbeat timeout";
            case net_errors::idle_timeout:
                return "idle timeout";
            case net_errors::takeover:
                return "player logged in on another connection";
            case net_errors::frame_error:
                return "frame error";
            case net_errors::server_shutdown:
                return "server shutdown";
            default:  // NOLINT(clang-diagnostic-covered-switch-default)
                return "gatecore.net error";
        }
    }
};

const std::error_category& get_net_category() {
    static net_category category;
    return category;
}

class auth_category final : public std::error_category {
  public:
    [[nodiscard]] const char* name() const noexcept override { return "gatecore.auth"; }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<auth_errors>(value)) {
            case auth_errors::invalid_credential:
                return "invalid credential";
            case auth_errors::empty_credential:
                return "empty credential";
            default:  // NOLINT(clang-diagnostic-covered-switch-default)
                return "gatecore.auth error";
        }
    }
};

const std::error_category& get_auth_category() {
    static auth_category category;
    return category;
}

}  // namespace gatecore

#include <gatecore/protocol/message.h>

namespace gatecore {

std::string_view to_string_view(message_category category) noexcept {
    using namespace std::string_view_literals;
    switch (category) {
        case message_category::system:
            return "system"sv;
        case message_category::player:
            return "player"sv;
        case message_category::battle:
            return "battle"sv;
        case message_category::pet:
            return "pet"sv;
        case message_category::building:
            return "building"sv;
        case message_category::social:
            return "social"sv;
        case message_category::item:
            return "item"sv;
        case message_category::quest:
            return "quest"sv;
        case message_category::query:
            return "query"sv;
        case message_category::unknown:
            break;
    }

    return "unknown"sv;
}

std::string_view wire_errors::type_name(int32_t code) noexcept {
    using namespace std::string_view_literals;
    switch (code) {
        case internal_error:
            return "INTERNAL_ERROR"sv;
        case invalid_message:
            return "INVALID_MESSAGE"sv;
        case invalid_parameter:
            return "INVALID_PARAMETER"sv;
        case unhandled_message:
            return "UNHANDLED_MESSAGE"sv;
        case unauthorized:
            return "UNAUTHORIZED"sv;
        case already_authenticated:
            return "ALREADY_AUTHENTICATED"sv;
        default:
            return "UNKNOWN_ERROR"sv;
    }
}

}  // namespace gatecore

#pragma once
#include <gatecore/config.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace gatecore {

// "GWKS"
inline constexpr uint32_t protocol_magic = 0x47574B53;

// magic(4) message_id(4) message_type(4) flags(2) player_id(8) timestamp(8) sequence(4) length(4)
inline constexpr size_t message_header_size = 38;

inline constexpr uint32_t default_max_frame_size = 1024 * 1024;

namespace message_flags {
inline constexpr uint16_t none = 0;
inline constexpr uint16_t request = 1 << 0;
inline constexpr uint16_t response = 1 << 1;
inline constexpr uint16_t error = 1 << 2;
inline constexpr uint16_t async = 1 << 3;
inline constexpr uint16_t broadcast = 1 << 4;
inline constexpr uint16_t encrypted = 1 << 5;
inline constexpr uint16_t compressed = 1 << 6;
}  // namespace message_flags

// 系统消息 0x0000 - 0x00FF
namespace message_types {
inline constexpr uint32_t heartbeat = 0x0001;
inline constexpr uint32_t handshake = 0x0002;
inline constexpr uint32_t auth = 0x0003;
inline constexpr uint32_t disconnect = 0x0004;
inline constexpr uint32_t error = 0x0005;
inline constexpr uint32_t ping = 0x0006;
inline constexpr uint32_t pong = 0x0007;
}  // namespace message_types

enum class message_category : uint8_t {
    system = 0,
    player = 1,
    battle = 2,
    pet = 3,
    building = 4,
    social = 5,
    item = 6,
    quest = 7,
    query = 8,
    unknown = 0xff,
};

// 每个分类占 0x100 个类型
inline constexpr message_category message_category_of(uint32_t message_type) noexcept {
    const auto index = message_type >> 8;
    if (index > static_cast<uint32_t>(message_category::query)) {
        return message_category::unknown;
    }
    return static_cast<message_category>(index);
}

inline constexpr uint32_t message_category_base(message_category category) noexcept {
    return static_cast<uint32_t>(category) << 8;
}

GATECORE_API std::string_view to_string_view(message_category category) noexcept;

// error_ack.code 的取值
namespace wire_errors {
inline constexpr int32_t internal_error = 1001;
inline constexpr int32_t invalid_message = 1002;
inline constexpr int32_t invalid_parameter = 1003;
inline constexpr int32_t unhandled_message = 1004;
inline constexpr int32_t unauthorized = 2001;
inline constexpr int32_t already_authenticated = 2002;

GATECORE_API std::string_view type_name(int32_t code) noexcept;
}  // namespace wire_errors

struct message_header {
    uint32_t magic{protocol_magic};
    uint32_t message_id{0};
    uint32_t message_type{0};
    uint16_t flags{message_flags::none};
    uint64_t player_id{0};
    // 发送方的 unix 毫秒时间
    int64_t timestamp{0};
    uint32_t sequence{0};
    uint32_t length{0};

    [[nodiscard]] bool has_flag(uint16_t flag) const noexcept { return (flags & flag) == flag; }

    bool operator==(const message_header&) const = default;
};

struct message {
    message_header header;
    std::string payload;
};

}  // namespace gatecore

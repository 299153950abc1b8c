#include <gate.pb.h>
#include <gatecore/error.h>
#include <gatecore/protocol/codec.h>
#include <gatecore/utils/time.h>

namespace gatecore {

message_codec::message_codec(uint32_t max_frame_size) : max_frame_size_(max_frame_size) {}

void write_header(const message_header& header, uint8_t (&out)[message_header_size]) {
    uint8_t* ptr = out;
    auto put = [&ptr]<typename T>(T value) {
        const T raw = detail::to_big_endian(value);
        std::memcpy(ptr, &raw, sizeof(T));
        ptr += sizeof(T);
    };

    put(header.magic);
    put(header.message_id);
    put(header.message_type);
    put(header.flags);
    put(header.player_id);
    put(header.timestamp);
    put(header.sequence);
    put(header.length);
}

byte_buffer_ptr message_codec::encode(const message_header& header, std::string_view payload, std::error_code& ec) const {
    if (payload.size() > max_frame_size_) {
        ec = codec_errors::payload_too_large;
        return {};
    }

    auto frame = header;
    frame.length = static_cast<uint32_t>(payload.size());

    uint8_t head[message_header_size];
    write_header(frame, head);

    auto buf = std::make_shared<byte_buffer>();
    buf->reserve(message_header_size + payload.size());
    buf->append(head, message_header_size);
    buf->append(payload);
    ec.clear();
    return buf;
}

byte_buffer_ptr message_codec::encode(const message_header& header, const google::protobuf::MessageLite& payload,
                                      std::error_code& ec) const {
    const auto size = payload.ByteSizeLong();
    if (size > max_frame_size_) {
        ec = codec_errors::payload_too_large;
        return {};
    }

    auto frame = header;
    frame.length = static_cast<uint32_t>(size);

    // 先序列化消息体，消息头回填到前置空间
    auto buf = std::make_shared<byte_buffer>(message_header_size);
    buf->make_sure_writable(size);
    if (size > 0 && !payload.SerializeToArray(buf->begin_write(), static_cast<int>(size))) {
        ec = codec_errors::serialize_failed;
        return {};
    }
    buf->written(size);

    uint8_t head[message_header_size];
    write_header(frame, head);
    buf->prepend(head, message_header_size);
    ec.clear();
    return buf;
}

std::error_code message_codec::decode_header(read_buffer& buf, message_header& header) const {
    if (buf.readable() < message_header_size) {
        return codec_errors::short_buffer;
    }

    auto temp = buf;
    message_header result;
    temp.read_integer(result.magic);
    if (result.magic != protocol_magic) {
        return codec_errors::bad_magic;
    }

    temp.read_integer(result.message_id);
    temp.read_integer(result.message_type);
    temp.read_integer(result.flags);
    temp.read_integer(result.player_id);
    temp.read_integer(result.timestamp);
    temp.read_integer(result.sequence);
    temp.read_integer(result.length);
    if (result.length > max_frame_size_) {
        return codec_errors::bad_length;
    }

    header = result;
    buf = temp;
    return {};
}

std::error_code message_codec::decode(read_buffer& buf, message& msg) const {
    auto temp = buf;
    message_header header;
    if (auto ec = decode_header(temp, header)) {
        return ec;
    }

    if (temp.readable() < header.length) {
        return codec_errors::short_buffer;
    }

    msg.header = header;
    msg.payload.assign(reinterpret_cast<const char*>(temp.begin_read()), header.length);
    temp += header.length;
    buf = temp;
    return {};
}

std::error_code message_codec::decode(std::string_view bytes, message& msg) const {
    read_buffer buf(bytes);
    return decode(buf, msg);
}

message_header make_response_header(const message_header& request, uint32_t message_type) {
    message_header header;
    header.message_id = request.message_id;
    header.message_type = message_type;
    header.flags = message_flags::response;
    header.player_id = request.player_id;
    header.timestamp = get_system_clock_millis();
    header.sequence = request.sequence;
    return header;
}

message make_error_response(const message_header& request, int32_t code, std::string_view text) {
    message msg;
    msg.header = make_response_header(request, message_types::error);
    msg.header.flags = message_flags::response | message_flags::error;

    gate::error_ack ack;
    ack.set_code(code);
    ack.set_error_type(std::string(wire_errors::type_name(code)));
    ack.set_message(std::string(text));
    msg.payload = ack.SerializeAsString();
    msg.header.length = static_cast<uint32_t>(msg.payload.size());
    return msg;
}

}  // namespace gatecore

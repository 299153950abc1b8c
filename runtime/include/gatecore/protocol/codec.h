#pragma once
#include <gatecore/config.h>
#include <gatecore/containers/buffer.hpp>
#include <gatecore/protocol/message.h>

#include <system_error>

namespace google::protobuf {
class MessageLite;
}

namespace gatecore {

/*
 * 帧格式: 38 字节的消息头 + length 字节的消息体，全部字段为大端
 * 消息头里的 length 让对端只读完消息头就能分配消息体的内存
 */
class message_codec {
  public:
    GATECORE_API explicit message_codec(uint32_t max_frame_size = default_max_frame_size);

    [[nodiscard]] uint32_t max_frame_size() const noexcept { return max_frame_size_; }

    /**
     * \brief 编码一帧，header.length 以 payload 的实际长度为准
     * \param ec 消息体超过上限时为 codec_errors::payload_too_large
     */
    GATECORE_API byte_buffer_ptr encode(const message_header& header, std::string_view payload, std::error_code& ec) const;

    GATECORE_API byte_buffer_ptr encode(const message_header& header, const google::protobuf::MessageLite& payload,
                                        std::error_code& ec) const;

    // 先校验 magic 再校验 length，成功时 buf 前进 message_header_size 字节
    GATECORE_API std::error_code decode_header(read_buffer& buf, message_header& header) const;

    // 需要完整的一帧，失败时 buf 不移动
    GATECORE_API std::error_code decode(read_buffer& buf, message& msg) const;

    GATECORE_API std::error_code decode(std::string_view bytes, message& msg) const;

  private:
    uint32_t max_frame_size_;
};

// 序列化消息头到固定长度的缓冲
GATECORE_API void write_header(const message_header& header, uint8_t (&out)[message_header_size]);

// 与请求关联的应答头: message_id 和 sequence 相同，带 response 标记
GATECORE_API message_header make_response_header(const message_header& request, uint32_t message_type);

/**
 * \brief 构造与请求关联的错误应答
 * \param code wire_errors 中的错误码
 * \param text 错误描述
 */
GATECORE_API message make_error_response(const message_header& request, int32_t code, std::string_view text);

}  // namespace gatecore

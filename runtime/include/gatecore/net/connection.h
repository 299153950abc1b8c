#pragma once
#include <gatecore/config.h>
#include <gatecore/containers/buffer.hpp>
#include <gatecore/protocol/codec.h>
#include <gatecore/utils/time.h>

#include <atomic>
#include <memory>
#include <string>
#include <system_error>

namespace gatecore {

using connection_id = uint64_t;

enum class connection_status : uint8_t { active = 0, closed = 1 };

/*
 * 一个传输层连接，由 connection_registry 持有
 * send 和 close 可以在任意线程调用
 */
class connection : public std::enable_shared_from_this<connection> {
  public:
    GATECORE_API connection(connection_id id, std::string remote_address);

    virtual ~connection() noexcept = default;

    GATECORE_NON_COPYABLE(connection)

    [[nodiscard]] connection_id id() const noexcept { return id_; }

    [[nodiscard]] const std::string& remote_address() const noexcept { return remote_address_; }

    [[nodiscard]] steady_point created_at() const noexcept { return created_at_; }

    [[nodiscard]] GATECORE_API steady_point last_activity() const noexcept;

    GATECORE_API void touch(steady_point now = steady_clock::now()) noexcept;

    [[nodiscard]] connection_status status() const noexcept { return status_.load(std::memory_order::acquire); }

    [[nodiscard]] bool is_active() const noexcept { return status() == connection_status::active; }

    // 主动推送的消息使用的序号
    GATECORE_API uint32_t next_sequence() noexcept;

    /**
     * \brief 投递一帧到发送队列
     * \return 已关闭时为 net_errors::connection_gone，队列已满时为 net_errors::send_queue_full
     */
    virtual std::error_code send(byte_buffer_ptr frame) = 0;

    // 幂等，第一次调用时记录关闭原因
    virtual void close(std::error_code reason) = 0;

    [[nodiscard]] GATECORE_API std::error_code close_reason() const;

    GATECORE_API std::error_code send_message(const message_codec& codec, const message_header& header,
                                              std::string_view payload);

    GATECORE_API std::error_code send_message(const message_codec& codec, const message_header& header,
                                              const google::protobuf::MessageLite& payload);

    GATECORE_API std::error_code send_message(const message_codec& codec, const message& msg);

  protected:
    // 只有第一次调用返回 true
    GATECORE_API bool mark_closed(std::error_code reason);

  private:
    connection_id id_;
    std::string remote_address_;
    steady_point created_at_;
    std::atomic<steady_clock::rep> last_activity_;
    std::atomic<connection_status> status_{connection_status::active};
    std::atomic_uint32_t sequence_{0};
    std::atomic<bool> reason_ready_{false};
    std::error_code close_reason_;
};

using connection_ptr = std::shared_ptr<connection>;

}  // namespace gatecore

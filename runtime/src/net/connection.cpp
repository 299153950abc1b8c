#include <gatecore/error.h>
#include <gatecore/net/connection.h>

namespace gatecore {

connection::connection(connection_id id, std::string remote_address)
    : id_(id),
      remote_address_(std::move(remote_address)),
      created_at_(steady_clock::now()),
      last_activity_(created_at_.time_since_epoch().count()) {}

steady_point connection::last_activity() const noexcept {
    return steady_point(steady_clock::duration(last_activity_.load(std::memory_order::relaxed)));
}

void connection::touch(steady_point now) noexcept {
    last_activity_.store(now.time_since_epoch().count(), std::memory_order::relaxed);
}

uint32_t connection::next_sequence() noexcept { return sequence_.fetch_add(1, std::memory_order::relaxed) + 1; }

std::error_code connection::close_reason() const {
    if (!reason_ready_.load(std::memory_order::acquire)) {
        return {};
    }
    return close_reason_;
}

bool connection::mark_closed(std::error_code reason) {
    auto expected = connection_status::active;
    if (!status_.compare_exchange_strong(expected, connection_status::closed, std::memory_order::acq_rel)) {
        return false;
    }

    close_reason_ = reason;
    reason_ready_.store(true, std::memory_order::release);
    return true;
}

std::error_code connection::send_message(const message_codec& codec, const message_header& header,
                                         std::string_view payload) {
    if (!is_active()) {
        return net_errors::connection_gone;
    }

    std::error_code ec;
    auto frame = codec.encode(header, payload, ec);
    if (ec) {
        return ec;
    }
    return send(std::move(frame));
}

std::error_code connection::send_message(const message_codec& codec, const message_header& header,
                                         const google::protobuf::MessageLite& payload) {
    if (!is_active()) {
        return net_errors::connection_gone;
    }

    std::error_code ec;
    auto frame = codec.encode(header, payload, ec);
    if (ec) {
        return ec;
    }
    return send(std::move(frame));
}

std::error_code connection::send_message(const message_codec& codec, const message& msg) {
    return send_message(codec, msg.header, msg.payload);
}

}  // namespace gatecore

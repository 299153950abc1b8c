#include <gatecore/error.h>
#include <gatecore/log/log.h>
#include <gatecore/net/tcp_connection.h>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

namespace gatecore {

std::string to_string(const asio::ip::tcp::endpoint& endpoint) {
    const auto address = endpoint.address();
    if (address.is_v4()) {
        return fmt::format("{}:{}", address.to_string(), endpoint.port());
    }
    return fmt::format("[{}]:{}", address.to_string(), endpoint.port());
}

static std::string remote_of(const asio::ip::tcp::socket& socket) {
    std::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    if (ec) {
        return {};
    }
    return to_string(remote);
}

tcp_connection::tcp_connection(connection_id id, tcp::socket socket, const message_codec& codec,
                               tcp_connection_options options, logger_ptr log, metrics_sink_ptr metrics)
    : connection(id, remote_of(socket)),
      strand_(asio::make_strand(socket.get_executor())),
      socket_(std::move(socket)),
      write_blocker_(strand_),
      codec_(codec),
      options_(options),
      logger_(std::move(log)),
      metrics_(metrics_or_null(std::move(metrics))) {}

void tcp_connection::register_message_handle(message_handle handle) { message_handle_ = std::move(handle); }

void tcp_connection::register_close_handle(close_handle handle) { close_handle_ = std::move(handle); }

void tcp_connection::start() {
    debug(logger_, "connection:{} remote:{} start", id(), remote_address());
    write_blocker_.expires_at(asio_timer::clock_type::time_point::max());
    if (options_.no_delay) {
        std::error_code ec;
        socket_.set_option(tcp::no_delay{true}, ec);
    }

    auto self = std::static_pointer_cast<tcp_connection>(shared_from_this());
    // 发送协程
    co_spawn(
        strand_,
        [self, this]() {
            std::ignore = self;
            return co_write();
        },
        asio::detached);

    // 接收协程
    co_spawn(
        strand_,
        [self, this]() {
            std::ignore = self;
            return co_read();
        },
        asio::detached);
}

std::error_code tcp_connection::send(byte_buffer_ptr frame) {
    if (!is_active()) {
        return net_errors::connection_gone;
    }

    if (pending_.fetch_add(1, std::memory_order::relaxed) >= options_.send_queue_limit) {
        pending_.fetch_sub(1, std::memory_order::relaxed);
        warn(logger_, "connection:{} remote:{} send queue full, limit:{}", id(), remote_address(), options_.send_queue_limit);
        close(net_errors::send_queue_full);
        return net_errors::send_queue_full;
    }

    auto self = std::static_pointer_cast<tcp_connection>(shared_from_this());
    asio::post(strand_, [self, this, frame = std::move(frame)]() mutable {
        if (write_stopped_) {
            pending_.fetch_sub(1, std::memory_order::relaxed);
            return;
        }
        write_deque_.emplace_back(std::move(frame));
        write_blocker_.cancel();
    });
    return {};
}

void tcp_connection::close(std::error_code reason) {
    if (!mark_closed(reason)) {
        return;
    }

    debug(logger_, "connection:{} remote:{} close, {}", id(), remote_address(), reason.message());
    auto self = std::static_pointer_cast<tcp_connection>(shared_from_this());
    asio::post(strand_, [self, this, reason]() {
        closing_ = true;
        std::error_code ignore;
        if (reason == net_errors::send_queue_full) {
            // 对端不读数据，正在进行的写不会完成，直接关闭
            socket_.close(ignore);
        } else {
            // 唤醒读协程，写协程发完队列后关闭 socket
            socket_.shutdown(tcp::socket::shutdown_receive, ignore);
        }
        write_blocker_.cancel();
    });
}

void tcp_connection::on_closed(std::error_code reason) {
    mark_closed(reason);
    closing_ = true;
    write_blocker_.cancel();

    if (close_notified_) {
        return;
    }
    close_notified_ = true;
    metrics_->inc_counter("conn.closed", 1);

    if (close_handle_) {
        close_handle_(shared_from_this(), close_reason());
    }
}

void tcp_connection::close_socket() {
    // 写协程已退出，剩下的帧不再发送
    write_stopped_ = true;
    pending_.fetch_sub(write_deque_.size(), std::memory_order::relaxed);
    write_deque_.clear();

    if (!socket_.is_open()) return;

    std::error_code ignore;
    socket_.shutdown(tcp::socket::shutdown_both, ignore);
    socket_.close(ignore);
    write_blocker_.cancel();
}

asio::awaitable<void> tcp_connection::co_read() {
    uint8_t head[message_header_size];
    for (;;) {
        auto [ec, len] = co_await asio::async_read(socket_, asio::buffer(head));
        if (ec) {
            on_closed(ec == asio::error::eof ? make_error_code(net_errors::initiative_disconnect) : ec);
            co_return;
        }

        message msg;
        read_buffer buf(head, len);
        if (const auto frame_ec = codec_.decode_header(buf, msg.header)) {
            // 帧错误时对端不可信，直接断开不回应答
            metrics_->inc_counter("codec.frame_error", 1);
            warn(logger_, "connection:{} remote:{} frame error, {}", id(), remote_address(), frame_ec.message());
            on_closed(net_errors::frame_error);
            co_return;
        }

        if (msg.header.length > 0) {
            msg.payload.resize(msg.header.length);
            auto [payload_ec, payload_len] = co_await asio::async_read(socket_, asio::buffer(msg.payload));
            if (payload_ec) {
                on_closed(payload_ec);
                co_return;
            }
        }

        touch();
        if (message_handle_) {
            message_handle_(shared_from_this(), std::move(msg));
        }

        if (closing_ || !is_active()) {
            on_closed(close_reason());
            co_return;
        }
    }
}

asio::awaitable<void> tcp_connection::co_write() {
    std::vector<byte_buffer_ptr> cache_write;
    std::vector<asio::const_buffer> buffers;
    cache_write.reserve(options_.max_buffers);
    buffers.reserve(options_.max_buffers);

    while (socket_.is_open()) {
        if (write_deque_.empty()) {
            if (closing_) break;
            co_await write_blocker_.async_wait();
            continue;
        }

        const auto size = (std::min)(write_deque_.size(), options_.max_buffers);
        const auto it_begin = write_deque_.begin();
        const auto it_end = it_begin + static_cast<int64_t>(size);
        for (auto it = it_begin; it != it_end; ++it) {
            byte_buffer_ptr temp = *it;
            buffers.emplace_back(temp->begin_read(), temp->readable());
            cache_write.emplace_back(std::move(temp));
        }

        write_deque_.erase(it_begin, it_end);
        auto [ec, len] = co_await async_write(socket_, buffers);
        pending_.fetch_sub(size, std::memory_order::relaxed);
        buffers.clear();
        cache_write.clear();
        if (ec) {
            mark_closed(ec);
            break;
        }
    }

    close_socket();
}

}  // namespace gatecore

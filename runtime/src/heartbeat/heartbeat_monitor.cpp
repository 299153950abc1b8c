#include <gate.pb.h>
#include <gatecore/error.h>
#include <gatecore/heartbeat/heartbeat_monitor.h>
#include <gatecore/log/log.h>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

namespace gatecore {

heartbeat_monitor::heartbeat_monitor(const message_codec& codec, heartbeat_options options, logger_ptr log,
                                     metrics_sink_ptr metrics)
    : codec_(codec), logger_(std::move(log)), metrics_(metrics_or_null(std::move(metrics))), options_(options) {}

heartbeat_monitor::~heartbeat_monitor() noexcept { stop(); }

void heartbeat_monitor::set_disconnect_handle(disconnect_handle handle) {
    std::scoped_lock lock(mtx_);
    disconnect_handle_ = std::move(handle);
}

void heartbeat_monitor::track(const connection_ptr& conn, steady_point now) {
    std::scoped_lock lock(mtx_);
    tracked item{conn, {}};
    item.status.last_sent = now;
    item.status.last_received = now;
    tracked_.insert_or_assign(conn->id(), std::move(item));
}

void heartbeat_monitor::untrack(connection_id id) {
    std::scoped_lock lock(mtx_);
    tracked_.erase(id);
}

bool heartbeat_monitor::record_heartbeat(connection_id id, steady_point now) {
    std::scoped_lock lock(mtx_);
    const auto it = tracked_.find(id);
    if (it == tracked_.end()) {
        return false;
    }

    auto& status = it->second.status;
    status.last_received = now;
    status.missed_count = 0;
    status.is_alive = true;
    return true;
}

bool heartbeat_monitor::on_pong(connection_id id, steady_point now) {
    steady_clock::duration rtt{0};
    {
        std::scoped_lock lock(mtx_);
        const auto it = tracked_.find(id);
        if (it == tracked_.end()) {
            return false;
        }

        auto& status = it->second.status;
        status.last_received = now;
        status.missed_count = 0;
        status.is_alive = true;
        status.rtt = now - status.last_sent;
        rtt = status.rtt;
    }

    metrics_->observe_duration("heartbeat.rtt", rtt);
    return true;
}

std::optional<heartbeat_status> heartbeat_monitor::status(connection_id id) const {
    std::scoped_lock lock(mtx_);
    if (const auto it = tracked_.find(id); it != tracked_.end()) {
        return it->second.status;
    }
    return std::nullopt;
}

size_t heartbeat_monitor::tracked_count() const {
    std::scoped_lock lock(mtx_);
    return tracked_.size();
}

heartbeat_options heartbeat_monitor::options() const {
    std::scoped_lock lock(mtx_);
    return options_;
}

void heartbeat_monitor::reconfigure(heartbeat_options options) {
    {
        std::scoped_lock lock(mtx_);
        options_ = options;
    }

    info(logger_, "heartbeat reconfigure interval:{}ms timeout:{}ms max_missed:{}", options.interval.count(),
         options.timeout.count(), options.max_missed);
    if (options.timeout >= options.interval) {
        warn(logger_, "heartbeat timeout:{}ms not less than interval:{}ms, every tick counts a miss",
             options.timeout.count(), options.interval.count());
    }

    // 让后台协程按新的间隔重新计时
    cancel_timer();
}

size_t heartbeat_monitor::tick(steady_point now) {
    std::vector<std::pair<connection_ptr, heartbeat_status>> dead;
    std::vector<connection_ptr> pings;
    disconnect_handle handle;
    {
        std::scoped_lock lock(mtx_);
        handle = disconnect_handle_;
        for (auto it = tracked_.begin(); it != tracked_.end();) {
            auto& [conn, status] = it->second;
            if (now - status.last_received > options_.timeout) {
                ++status.missed_count;
                status.is_alive = false;
                if (status.missed_count >= options_.max_missed) {
                    dead.emplace_back(std::move(conn), status);
                    it = tracked_.erase(it);
                    continue;
                }
            }

            status.last_sent = now;
            pings.emplace_back(conn);
            ++it;
        }
    }

    for (const auto& conn : pings) {
        send_ping(conn);
    }

    for (const auto& [conn, status] : dead) {
        metrics_->inc_counter("heartbeat.evicted", 1);
        warn(logger_, "connection:{} remote:{} heartbeat timeout, missed:{}", conn->id(), conn->remote_address(),
             status.missed_count);
        conn->close(net_errors::heartbeat_timeout);
        if (handle) {
            handle(conn, status);
        }
    }

    return dead.size();
}

void heartbeat_monitor::send_ping(const connection_ptr& conn) {
    message_header header;
    header.sequence = conn->next_sequence();
    header.message_id = header.sequence;
    header.message_type = message_types::ping;
    header.flags = message_flags::request;
    header.timestamp = get_system_clock_millis();

    gate::ping_req req;
    req.set_server_time(header.timestamp);
    if (const auto ec = conn->send_message(codec_, header, req)) {
        debug(logger_, "connection:{} send ping fail, {}", conn->id(), ec.message());
    }
}

void heartbeat_monitor::start(const asio::any_io_executor& executor) {
    std::scoped_lock lock(timer_mtx_);
    stopped_ = false;
    strand_.emplace(asio::make_strand(executor));
    timer_.emplace(*strand_);
    co_spawn(
        *strand_, [this]() { return co_tick(); }, asio::detached);
}

void heartbeat_monitor::stop() {
    stopped_ = true;
    cancel_timer();
}

void heartbeat_monitor::cancel_timer() {
    std::scoped_lock lock(timer_mtx_);
    if (!strand_) return;
    asio::post(*strand_, [this]() { timer_->cancel(); });
}

asio::awaitable<void> heartbeat_monitor::co_tick() {
    // 协程运行在 strand_ 上，检查 stopped_ 到发起等待之间不会被取消打断
    for (;;) {
        if (stopped_) co_return;

        timer_->expires_after(options().interval);
        auto [ec] = co_await timer_->async_wait(asio::as_tuple(asio::use_awaitable));
        if (ec == asio::error::operation_aborted) {
            // reconfigure 或 stop
            continue;
        }

        tick();
    }
}

}  // namespace gatecore

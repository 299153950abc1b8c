#include <gatecore/error.h>
#include <gatecore/log/log.h>
#include <gatecore/net/connection_registry.h>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

namespace gatecore {

connection_registry::connection_registry(size_t max_connections, logger_ptr log, metrics_sink_ptr metrics)
    : max_connections_(max_connections), logger_(std::move(log)), metrics_(metrics_or_null(std::move(metrics))) {}

connection_registry::~connection_registry() noexcept { stop(); }

void connection_registry::set_remove_handle(remove_handle handle) {
    std::unique_lock lock(mtx_);
    remove_handle_ = std::move(handle);
}

std::error_code connection_registry::add(const connection_ptr& conn) {
    {
        std::unique_lock lock(mtx_);
        if (max_connections_ > 0 && connections_.size() >= max_connections_) {
            lock.unlock();
            metrics_->inc_counter("conn.rejected", 1);
            warn(logger_, "connection:{} remote:{} rejected, max connections:{}", conn->id(), conn->remote_address(),
                 max_connections_);
            return net_errors::connection_limit;
        }

        connections_.insert_or_assign(conn->id(), conn);
    }

    metrics_->inc_counter("conn.accepted", 1);
    debug(logger_, "connection:{} remote:{} added", conn->id(), conn->remote_address());
    return {};
}

connection_ptr connection_registry::erase_unlock(connection_id id) {
    const auto it = connections_.find(id);
    if (it == connections_.end()) {
        return {};
    }

    auto conn = std::move(it->second);
    connections_.erase(it);

    if (const auto member_it = memberships_.find(id); member_it != memberships_.end()) {
        for (const auto& group : member_it->second) {
            if (const auto group_it = groups_.find(group); group_it != groups_.end()) {
                group_it->second.erase(id);
                if (group_it->second.empty()) {
                    groups_.erase(group_it);
                }
            }
        }
        memberships_.erase(member_it);
    }

    return conn;
}

void connection_registry::remove(connection_id id, std::error_code reason) {
    connection_ptr conn;
    remove_handle handle;
    {
        std::unique_lock lock(mtx_);
        conn = erase_unlock(id);
        if (!conn) {
            return;
        }
        handle = remove_handle_;
    }

    if (!reason) {
        reason = conn->close_reason();
    }
    if (!reason) {
        reason = net_errors::initiative_disconnect;
    }

    conn->close(reason);
    debug(logger_, "connection:{} remote:{} removed, {}", id, conn->remote_address(), reason.message());
    if (handle) {
        handle(conn, reason);
    }
}

connection_ptr connection_registry::get(connection_id id) const {
    std::shared_lock lock(mtx_);
    if (const auto it = connections_.find(id); it != connections_.end()) {
        return it->second;
    }
    return {};
}

size_t connection_registry::size() const {
    std::shared_lock lock(mtx_);
    return connections_.size();
}

std::vector<connection_ptr> connection_registry::connections() const {
    std::shared_lock lock(mtx_);
    std::vector<connection_ptr> result;
    result.reserve(connections_.size());
    for (const auto& [_, conn] : connections_) {
        result.emplace_back(conn);
    }
    return result;
}

bool connection_registry::join_group(connection_id id, const std::string& group) {
    std::unique_lock lock(mtx_);
    if (!connections_.contains(id)) {
        return false;
    }

    groups_[group].insert(id);
    memberships_[id].insert(group);
    return true;
}

void connection_registry::leave_group(connection_id id, const std::string& group) {
    std::unique_lock lock(mtx_);
    if (const auto it = groups_.find(group); it != groups_.end()) {
        it->second.erase(id);
        if (it->second.empty()) {
            groups_.erase(it);
        }
    }

    if (const auto it = memberships_.find(id); it != memberships_.end()) {
        it->second.erase(group);
        if (it->second.empty()) {
            memberships_.erase(it);
        }
    }
}

size_t connection_registry::group_size(const std::string& group) const {
    std::shared_lock lock(mtx_);
    if (const auto it = groups_.find(group); it != groups_.end()) {
        return it->second.size();
    }
    return 0;
}

size_t connection_registry::deliver(const std::vector<connection_ptr>& targets, const byte_buffer_ptr& frame) {
    size_t delivered = 0;
    for (const auto& conn : targets) {
        if (const auto ec = conn->send(frame)) {
            metrics_->inc_counter("conn.broadcast_fail", 1);
            warn(logger_, "broadcast to connection:{} remote:{} fail, {}", conn->id(), conn->remote_address(), ec.message());
            continue;
        }
        ++delivered;
    }
    return delivered;
}

size_t connection_registry::broadcast(const byte_buffer_ptr& frame) { return deliver(connections(), frame); }

size_t connection_registry::broadcast_to_group(const std::string& group, const byte_buffer_ptr& frame) {
    std::vector<connection_ptr> targets;
    {
        std::shared_lock lock(mtx_);
        const auto it = groups_.find(group);
        if (it == groups_.end()) {
            return 0;
        }

        targets.reserve(it->second.size());
        for (const auto id : it->second) {
            if (const auto conn_it = connections_.find(id); conn_it != connections_.end()) {
                targets.emplace_back(conn_it->second);
            }
        }
    }

    return deliver(targets, frame);
}

size_t connection_registry::cleanup_inactive(std::chrono::steady_clock::duration timeout, steady_point now) {
    std::vector<connection_id> expired;
    {
        std::shared_lock lock(mtx_);
        for (const auto& [id, conn] : connections_) {
            if (!conn->is_active() || now - conn->last_activity() > timeout) {
                expired.emplace_back(id);
            }
        }
    }

    for (const auto id : expired) {
        remove(id, net_errors::idle_timeout);
    }

    if (!expired.empty()) {
        info(logger_, "cleanup {} inactive connections", expired.size());
    }
    return expired.size();
}

void connection_registry::close_all(std::error_code reason) {
    std::vector<connection_id> ids;
    {
        std::shared_lock lock(mtx_);
        ids.reserve(connections_.size());
        for (const auto& [id, _] : connections_) {
            ids.emplace_back(id);
        }
    }

    for (const auto id : ids) {
        remove(id, reason);
    }
}

void connection_registry::start(const asio::any_io_executor& executor, std::chrono::steady_clock::duration interval,
                                std::chrono::steady_clock::duration timeout) {
    std::scoped_lock lock(timer_mtx_);
    stopped_ = false;
    strand_.emplace(asio::make_strand(executor));
    timer_.emplace(*strand_);
    co_spawn(
        *strand_, [this, interval, timeout]() { return co_cleanup(interval, timeout); }, asio::detached);
}

void connection_registry::stop() {
    stopped_ = true;
    std::scoped_lock lock(timer_mtx_);
    if (!strand_) return;
    asio::post(*strand_, [this]() { timer_->cancel(); });
}

asio::awaitable<void> connection_registry::co_cleanup(std::chrono::steady_clock::duration interval,
                                                      std::chrono::steady_clock::duration timeout) {
    for (;;) {
        if (stopped_) co_return;

        timer_->expires_after(interval);
        auto [ec] = co_await timer_->async_wait(asio::as_tuple(asio::use_awaitable));
        if (ec) co_return;

        cleanup_inactive(timeout);
    }
}

}  // namespace gatecore

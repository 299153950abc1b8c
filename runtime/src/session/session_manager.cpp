#include <gatecore/error.h>
#include <gatecore/log/log.h>
#include <gatecore/session/session_manager.h>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

namespace gatecore {

session_manager::session_manager(session_manager_options options, logger_ptr log, metrics_sink_ptr metrics)
    : options_(options), logger_(std::move(log)), metrics_(metrics_or_null(std::move(metrics))) {}

session_manager::~session_manager() noexcept { stop(); }

void session_manager::set_remove_handle(remove_handle handle) {
    std::unique_lock lock(mtx_);
    remove_handle_ = std::move(handle);
}

session_id session_manager::next_session_id() noexcept { return id_allocator_.fetch_add(1, std::memory_order::relaxed) + 1; }

session_ptr session_manager::create_session(session_id id, connection_id conn) {
    if (get_session(id)) {
        warn(logger_, "session:{} already exists, replace it", id);
        remove_session(id);
    }

    auto ptr = std::make_shared<session>(id, conn, options_.idle_timeout);
    {
        std::unique_lock lock(mtx_);
        sessions_.insert_or_assign(id, ptr);
        connections_.insert_or_assign(conn, id);
    }

    metrics_->inc_counter("session.created", 1);
    debug(logger_, "session:{} connection:{} created", id, conn);
    return ptr;
}

session_ptr session_manager::get_session(session_id id) const {
    std::shared_lock lock(mtx_);
    if (const auto it = sessions_.find(id); it != sessions_.end()) {
        return it->second;
    }
    return {};
}

session_ptr session_manager::get_session_by_player(player_id player) const {
    std::shared_lock lock(mtx_);
    const auto it = players_.find(player);
    if (it == players_.end()) {
        return {};
    }

    if (const auto session_it = sessions_.find(it->second); session_it != sessions_.end()) {
        return session_it->second;
    }
    return {};
}

session_ptr session_manager::get_session_by_connection(connection_id conn) const {
    std::shared_lock lock(mtx_);
    const auto it = connections_.find(conn);
    if (it == connections_.end()) {
        return {};
    }

    if (const auto session_it = sessions_.find(it->second); session_it != sessions_.end()) {
        return session_it->second;
    }
    return {};
}

bind_result session_manager::bind_player_to_session(session_id id, player_id player) {
    bind_result result;
    if (player == 0) {
        result.ec = session_errors::invalid_player;
        return result;
    }

    {
        std::unique_lock lock(mtx_);
        const auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            result.ec = session_errors::session_not_found;
            return result;
        }

        const auto& target = it->second;
        // 正在断开的会话不能再绑定玩家，否则会顶掉仍然在线的会话
        if (const auto state = target->state();
            state == session_state::disconnecting || state == session_state::disconnected) {
            result.ec = session_errors::invalid_transition;
            return result;
        }

        const auto old_player = target->player_id();
        if (old_player == player) {
            return result;
        }

        // 重新绑定到别的玩家
        if (old_player != 0) {
            if (const auto old_it = players_.find(old_player); old_it != players_.end() && old_it->second == id) {
                players_.erase(old_it);
            }
        }

        if (const auto bound_it = players_.find(player); bound_it != players_.end() && bound_it->second != id) {
            if (const auto evicted_it = sessions_.find(bound_it->second); evicted_it != sessions_.end()) {
                result.evicted = evicted_it->second;
                result.evicted->begin_disconnect();
                result.evicted->set_player(0);
            }
        }

        players_.insert_or_assign(player, id);
        target->set_player(player);
    }

    if (result.evicted) {
        metrics_->inc_counter("session.takeover", 1);
        info(logger_, "player:{} takeover, session:{} evicted by session:{}", player, result.evicted->id(), id);
    }
    return result;
}

void session_manager::unbind_player(player_id player) {
    std::unique_lock lock(mtx_);
    const auto it = players_.find(player);
    if (it == players_.end()) {
        return;
    }

    if (const auto session_it = sessions_.find(it->second); session_it != sessions_.end()) {
        session_it->second->set_player(0);
    }
    players_.erase(it);
}

session_ptr session_manager::erase_unlock(session_id id) {
    const auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return {};
    }

    auto ptr = std::move(it->second);
    sessions_.erase(it);

    if (const auto player = ptr->player_id(); player != 0) {
        if (const auto player_it = players_.find(player); player_it != players_.end() && player_it->second == id) {
            players_.erase(player_it);
        }
    }

    if (const auto conn_it = connections_.find(ptr->connection_id()); conn_it != connections_.end() && conn_it->second == id) {
        connections_.erase(conn_it);
    }

    return ptr;
}

void session_manager::remove_session(session_id id, std::error_code reason) {
    session_ptr ptr;
    remove_handle handle;
    {
        std::unique_lock lock(mtx_);
        ptr = erase_unlock(id);
        if (!ptr) {
            return;
        }
        handle = remove_handle_;
    }

    ptr->begin_disconnect();
    ptr->mark_disconnected();
    metrics_->inc_counter("session.removed", 1);
    debug(logger_, "session:{} connection:{} player:{} removed", id, ptr->connection_id(), ptr->player_id());

    if (handle) {
        handle(ptr, reason);
    }
}

void session_manager::remove_session_by_connection(connection_id conn, std::error_code reason) {
    session_id id = 0;
    {
        std::shared_lock lock(mtx_);
        const auto it = connections_.find(conn);
        if (it == connections_.end()) {
            return;
        }
        id = it->second;
    }

    remove_session(id, reason);
}

std::vector<session_ptr> session_manager::get_all_sessions() const {
    std::shared_lock lock(mtx_);
    std::vector<session_ptr> result;
    result.reserve(sessions_.size());
    for (const auto& [_, ptr] : sessions_) {
        result.emplace_back(ptr);
    }
    return result;
}

std::vector<session_ptr> session_manager::get_active_sessions() const {
    std::shared_lock lock(mtx_);
    std::vector<session_ptr> result;
    for (const auto& [_, ptr] : sessions_) {
        if (ptr->state() == session_state::active) {
            result.emplace_back(ptr);
        }
    }
    return result;
}

size_t session_manager::session_count() const {
    std::shared_lock lock(mtx_);
    return sessions_.size();
}

session_stats session_manager::stats() const {
    std::shared_lock lock(mtx_);
    session_stats result;
    result.total = sessions_.size();
    result.bound = players_.size();
    for (const auto& [_, ptr] : sessions_) {
        switch (ptr->state()) {
            case session_state::authenticated:
                ++result.authenticated;
                break;
            case session_state::active:
                ++result.active;
                break;
            case session_state::idle:
                ++result.idle;
                break;
            default:
                break;
        }
    }
    return result;
}

size_t session_manager::sweep_idle(steady_point now) {
    std::vector<session_id> expired;
    {
        std::shared_lock lock(mtx_);
        for (const auto& [id, ptr] : sessions_) {
            if (ptr->state() == session_state::disconnected) {
                expired.emplace_back(id);
                continue;
            }

            if (ptr->check_idle(now) > ptr->idle_timeout() + options_.idle_grace) {
                expired.emplace_back(id);
            }
        }
    }

    for (const auto id : expired) {
        remove_session(id, net_errors::idle_timeout);
    }

    if (!expired.empty()) {
        metrics_->inc_counter("session.idle_evicted", static_cast<int64_t>(expired.size()));
        info(logger_, "idle sweep removed {} sessions", expired.size());
    }
    return expired.size();
}

void session_manager::start(const asio::any_io_executor& executor, std::chrono::steady_clock::duration interval) {
    std::scoped_lock lock(timer_mtx_);
    stopped_ = false;
    strand_.emplace(asio::make_strand(executor));
    timer_.emplace(*strand_);
    co_spawn(
        *strand_, [this, interval]() { return co_sweep(interval); }, asio::detached);
}

void session_manager::stop() {
    stopped_ = true;
    std::scoped_lock lock(timer_mtx_);
    if (!strand_) return;
    asio::post(*strand_, [this]() { timer_->cancel(); });
}

asio::awaitable<void> session_manager::co_sweep(std::chrono::steady_clock::duration interval) {
    for (;;) {
        if (stopped_) co_return;

        timer_->expires_after(interval);
        auto [ec] = co_await timer_->async_wait(asio::as_tuple(asio::use_awaitable));
        if (ec) co_return;

        sweep_idle();
    }
}

}  // namespace gatecore

#include <gatecore/error.h>
#include <gatecore/session/session.h>

namespace gatecore {

std::string_view to_string_view(session_state state) noexcept {
    using namespace std::string_view_literals;
    switch (state) {
        case session_state::created:
            return "new"sv;
        case session_state::connected:
            return "connected"sv;
        case session_state::authenticated:
            return "authenticated"sv;
        case session_state::active:
            return "active"sv;
        case session_state::idle:
            return "idle"sv;
        case session_state::disconnecting:
            return "disconnecting"sv;
        case session_state::disconnected:
            return "disconnected"sv;
    }

    return "unknown"sv;
}

bool is_valid_transition(session_state from, session_state to) noexcept {
    using enum session_state;
    switch (from) {
        case created:
            return to == connected || to == authenticated || to == disconnecting;
        case connected:
            return to == authenticated || to == disconnecting;
        case authenticated:
            return to == active || to == idle || to == disconnecting;
        case active:
            return to == idle || to == disconnecting;
        case idle:
            return to == active || to == disconnecting;
        case disconnecting:
            return to == disconnected;
        case disconnected:
            return false;
    }

    return false;
}

session::session(session_id id, gatecore::connection_id conn, std::chrono::seconds idle_timeout)
    : id_(id), connection_id_(conn), created_at_(steady_clock::now()), idle_timeout_(idle_timeout), last_activity_(created_at_) {}

player_id session::player_id() const {
    std::scoped_lock lock(mtx_);
    return player_id_;
}

session_state session::state() const {
    std::scoped_lock lock(mtx_);
    return state_;
}

steady_point session::last_activity() const {
    std::scoped_lock lock(mtx_);
    return last_activity_;
}

std::optional<std::chrono::system_clock::time_point> session::auth_time() const {
    std::scoped_lock lock(mtx_);
    return auth_time_;
}

bool session::is_authenticated() const {
    std::scoped_lock lock(mtx_);
    return state_ == session_state::authenticated || state_ == session_state::active || state_ == session_state::idle;
}

std::error_code session::transition(session_state next) {
    std::scoped_lock lock(mtx_);
    if (!is_valid_transition(state_, next)) {
        return session_errors::invalid_transition;
    }

    state_ = next;
    if (next == session_state::authenticated) {
        auth_time_ = std::chrono::system_clock::now();
    }
    return {};
}

std::error_code session::authenticate() {
    std::scoped_lock lock(mtx_);
    if (state_ != session_state::created && state_ != session_state::connected) {
        return state_ == session_state::disconnecting || state_ == session_state::disconnected
                   ? make_error_code(session_errors::invalid_transition)
                   : make_error_code(session_errors::already_authenticated);
    }

    state_ = session_state::authenticated;
    auth_time_ = std::chrono::system_clock::now();
    return {};
}

void session::update_activity(steady_point now) {
    std::scoped_lock lock(mtx_);
    last_activity_ = now;
    if (state_ == session_state::authenticated || state_ == session_state::idle) {
        state_ = session_state::active;
    }
}

void session::set_data(const std::string& key, std::string value) {
    std::scoped_lock lock(mtx_);
    data_.insert_or_assign(key, std::move(value));
}

std::optional<std::string> session::get_data(const std::string& key) const {
    std::scoped_lock lock(mtx_);
    if (const auto it = data_.find(key); it != data_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool session::remove_data(const std::string& key) {
    std::scoped_lock lock(mtx_);
    return data_.erase(key) > 0;
}

void session::set_player(gatecore::player_id player) {
    std::scoped_lock lock(mtx_);
    player_id_ = player;
}

bool session::begin_disconnect() {
    std::scoped_lock lock(mtx_);
    if (state_ == session_state::disconnecting || state_ == session_state::disconnected) {
        return false;
    }
    state_ = session_state::disconnecting;
    return true;
}

void session::mark_disconnected() {
    std::scoped_lock lock(mtx_);
    state_ = session_state::disconnected;
}

steady_clock::duration session::check_idle(steady_point now) {
    std::scoped_lock lock(mtx_);
    const auto elapsed = now - last_activity_;
    if (elapsed > idle_timeout_ && (state_ == session_state::authenticated || state_ == session_state::active)) {
        state_ = session_state::idle;
    }
    return elapsed;
}

}  // namespace gatecore

#include <gate.pb.h>
#include <gatecore/error.h>
#include <gatecore/log/log.h>
#include <gatecore/server/gate_server.h>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>

namespace gatecore {

gate_server::gate_server(server_config config, authenticator_ptr auth, logger_ptr log, metrics_sink_ptr metrics)
    : context_(static_cast<int>(config.io_threads)),
      config_(std::move(config)),
      authenticator_(std::move(auth)),
      logger_(std::move(log)),
      metrics_(metrics_or_null(std::move(metrics))),
      codec_(config_.max_frame_size),
      registry_(config_.max_connections, logger_, metrics_),
      sessions_(config_.session, logger_, metrics_),
      heartbeat_(codec_, config_.heartbeat, logger_, metrics_),
      router_(codec_, &sessions_, logger_, metrics_),
      acceptor_(context_) {
    registry_.set_remove_handle(
        [this](const connection_ptr& conn, std::error_code reason) { on_connection_removed(conn, reason); });

    sessions_.set_remove_handle(
        [this](const session_ptr& ptr, std::error_code reason) { registry_.remove(ptr->connection_id(), reason); });

    heartbeat_.set_disconnect_handle([this](const connection_ptr& conn, const heartbeat_status&) {
        registry_.remove(conn->id(), net_errors::heartbeat_timeout);
    });

    register_system_handlers();
}

gate_server::~gate_server() noexcept {
    stop();
    join();
}

void gate_server::start() {
    tcp::endpoint endpoint;
    if (config_.host.empty()) {
        endpoint = tcp::endpoint(tcp::v6(), config_.port);
    } else {
        endpoint = tcp::endpoint(asio::ip::make_address(config_.host), config_.port);
    }

    std::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw std::system_error(ec, "gate_server open acceptor");
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) throw std::system_error(ec, "gate_server reuse address");
    if (endpoint.address().is_v6()) {
        // 双栈，失败时只监听 ipv6
        std::error_code ignore;
        acceptor_.set_option(asio::ip::v6_only(false), ignore);
    }
    acceptor_.bind(endpoint, ec);
    if (ec) throw std::system_error(ec, fmt::format("gate_server bind port {}", config_.port));
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) throw std::system_error(ec, "gate_server listen");

    port_ = acceptor_.local_endpoint(ec).port();
    running_.store(true, std::memory_order::release);

    const auto executor = context_.get_executor();
    registry_.start(executor, config_.cleanup_interval, config_.inactive_timeout);
    sessions_.start(executor, config_.sweep_interval);
    heartbeat_.start(executor);

    co_spawn(context_, co_accept(), asio::detached);

    threads_.reserve(config_.io_threads);
    for (size_t i = 0; i < config_.io_threads; ++i) {
        threads_.emplace_back([this]() { context_.run(); });
    }

    info(logger_, "gate server listen on port:{} io_threads:{} require_auth:{}", port_, config_.io_threads,
         config_.require_auth);
}

void gate_server::stop() {
    if (!running_.exchange(false, std::memory_order::acq_rel)) {
        return;
    }

    info(logger_, "gate server stop, connections:{} sessions:{}", registry_.size(), sessions_.session_count());
    asio::post(context_, [this]() {
        std::error_code ignore;
        acceptor_.close(ignore);
    });

    heartbeat_.stop();
    sessions_.stop();
    registry_.stop();
    registry_.close_all(net_errors::server_shutdown);
}

void gate_server::join() {
    for (auto& thread : threads_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }
    threads_.clear();
}

asio::awaitable<void> gate_server::co_accept() {
    while (acceptor_.is_open()) {
        auto [ec, socket] = co_await acceptor_.async_accept();
        if (ec) {
            if (ec == asio::error::operation_aborted) co_return;
            warn(logger_, "gate server accept fail, {}", ec.message());
            continue;
        }

        if (!running_.load(std::memory_order::acquire)) {
            std::error_code ignore;
            socket.close(ignore);
            co_return;
        }

        on_accept(tcp::socket(std::move(socket)));
    }
}

void gate_server::on_accept(tcp::socket socket) {
    const auto id = conn_id_allocator_.fetch_add(1, std::memory_order::relaxed) + 1;
    tcp_connection_options options;
    options.send_queue_limit = config_.send_queue_limit;
    auto conn = std::make_shared<tcp_connection>(id, std::move(socket), codec_, options, logger_, metrics_);

    if (const auto ec = registry_.add(conn)) {
        conn->close(ec);
        return;
    }

    heartbeat_.track(conn);
    const auto session = sessions_.create_session(sessions_.next_session_id(), id);

    conn->register_message_handle([this](const connection_ptr& ptr, message&& msg) { on_message(ptr, std::move(msg)); });
    conn->register_close_handle([this](const connection_ptr& ptr, std::error_code reason) { registry_.remove(ptr->id(), reason); });
    conn->start();

    info(logger_, "connection:{} remote:{} accepted, session:{}", id, conn->remote_address(), session->id());
}

void gate_server::on_connection_removed(const connection_ptr& conn, std::error_code reason) {
    heartbeat_.untrack(conn->id());
    sessions_.remove_session_by_connection(conn->id(), reason);
    info(logger_, "connection:{} remote:{} removed, {}", conn->id(), conn->remote_address(), reason.message());
}

void gate_server::on_message(const connection_ptr& conn, message&& msg) {
    const auto session = sessions_.get_session_by_connection(conn->id());
    if (!session) {
        debug(logger_, "connection:{} message type:{:#06x} without session", conn->id(), msg.header.message_type);
        return;
    }

    session->update_activity();
    const session_context ctx{session, conn, &codec_};

    if (config_.require_auth && message_category_of(msg.header.message_type) != message_category::system &&
        !session->is_authenticated()) {
        warn(logger_, "session:{} message type:{:#06x} before auth", session->id(), msg.header.message_type);
        reply_error(ctx, msg.header, wire_errors::unauthorized, "authentication required");
        return;
    }

    // 错误已经在 router 中记录
    router_.route_message(ctx, msg);
}

void gate_server::evict_session(const session_ptr& evicted) {
    const auto conn = registry_.get(evicted->connection_id());
    if (!conn) {
        sessions_.remove_session(evicted->id(), net_errors::takeover);
        return;
    }

    message_header header;
    header.sequence = conn->next_sequence();
    header.message_id = header.sequence;
    header.message_type = message_types::disconnect;
    header.flags = message_flags::async;
    header.timestamp = get_system_clock_millis();

    gate::disconnect_brd brd;
    brd.set_reason("takeover");
    if (const auto ec = conn->send_message(codec_, header, brd)) {
        debug(logger_, "connection:{} send takeover notice fail, {}", conn->id(), ec.message());
    }

    registry_.remove(conn->id(), net_errors::takeover);
}

void gate_server::reply_error(const session_context& ctx, const message_header& request, int32_t code,
                              std::string_view text) {
    if (const auto ec = ctx.reply_error(request, code, text)) {
        debug(logger_, "connection:{} reply {} fail, {}", ctx.connection->id(), wire_errors::type_name(code), ec.message());
    }
}

void gate_server::register_system_handlers() {
    using namespace std::placeholders;
    router_.register_handler(message_types::handshake, std::bind(&gate_server::handle_handshake, this, _1, _2));
    router_.register_handler(message_types::auth, std::bind(&gate_server::handle_auth, this, _1, _2));
    router_.register_handler(message_types::heartbeat, std::bind(&gate_server::handle_heartbeat, this, _1, _2));
    router_.register_handler(message_types::ping, std::bind(&gate_server::handle_ping, this, _1, _2));
    router_.register_handler(message_types::pong, std::bind(&gate_server::handle_pong, this, _1, _2));
    router_.register_handler(message_types::disconnect, std::bind(&gate_server::handle_disconnect, this, _1, _2));
}

std::error_code gate_server::handle_handshake(const session_context& ctx, const message& msg) {
    gate::handshake_req req;
    if (!req.ParseFromString(msg.payload)) {
        reply_error(ctx, msg.header, wire_errors::invalid_parameter, "bad handshake payload");
        return router_errors::bad_payload;
    }

    if (const auto ec = ctx.session->transition(session_state::connected)) {
        reply_error(ctx, msg.header, wire_errors::invalid_parameter,
                    fmt::format("handshake in state {}", to_string_view(ctx.session->state())));
        return ec;
    }

    gate::handshake_ack ack;
    ack.set_session_id(ctx.session->id());
    ack.set_server_time(get_system_clock_millis());
    ack.set_heartbeat_interval_ms(static_cast<int32_t>(config_.heartbeat.interval.count()));
    debug(logger_, "session:{} handshake, client version:{}", ctx.session->id(), req.client_version());
    return ctx.reply(msg.header, message_types::handshake, ack);
}

std::error_code gate_server::handle_auth(const session_context& ctx, const message& msg) {
    gate::auth_req req;
    if (!req.ParseFromString(msg.payload)) {
        reply_error(ctx, msg.header, wire_errors::invalid_parameter, "bad auth payload");
        return router_errors::bad_payload;
    }

    const auto& session = ctx.session;
    if (session->is_authenticated()) {
        reply_error(ctx, msg.header, wire_errors::already_authenticated, "session already authenticated");
        return session_errors::already_authenticated;
    }

    player_id player = 0;
    std::error_code auth_ec = auth_errors::invalid_credential;
    if (authenticator_) {
        auth_ec = authenticator_->verify(req.token(), player);
    }
    if (auth_ec) {
        warn(logger_, "session:{} connection:{} auth fail, {}", session->id(), ctx.connection->id(), auth_ec.message());
        reply_error(ctx, msg.header, wire_errors::unauthorized, auth_ec.message());
        return auth_ec;
    }

    const auto result = sessions_.bind_player_to_session(session->id(), player);
    if (result.ec) {
        reply_error(ctx, msg.header, wire_errors::internal_error, result.ec.message());
        return result.ec;
    }

    if (const auto ec = session->authenticate()) {
        reply_error(ctx, msg.header, wire_errors::internal_error, ec.message());
        return ec;
    }

    info(logger_, "session:{} connection:{} player:{} authenticated", session->id(), ctx.connection->id(), player);

    gate::auth_ack ack;
    ack.set_player_id(player);
    ack.set_session_id(session->id());
    ack.set_takeover(result.evicted != nullptr);
    const auto ec = ctx.reply(msg.header, message_types::auth, ack);

    if (result.evicted) {
        evict_session(result.evicted);
    }
    return ec;
}

std::error_code gate_server::handle_heartbeat(const session_context& ctx, const message& msg) {
    gate::heartbeat_req req;
    if (!req.ParseFromString(msg.payload)) {
        reply_error(ctx, msg.header, wire_errors::invalid_parameter, "bad heartbeat payload");
        return router_errors::bad_payload;
    }

    heartbeat_.record_heartbeat(ctx.connection->id());

    gate::heartbeat_ack ack;
    ack.set_client_time(req.client_time());
    ack.set_server_time(get_system_clock_millis());
    return ctx.reply(msg.header, message_types::heartbeat, ack);
}

std::error_code gate_server::handle_ping(const session_context& ctx, const message& msg) {
    heartbeat_.record_heartbeat(ctx.connection->id());

    gate::pong_ack ack;
    ack.set_server_time(get_system_clock_millis());
    return ctx.reply(msg.header, message_types::pong, ack);
}

std::error_code gate_server::handle_pong(const session_context& ctx, const message&) {
    heartbeat_.on_pong(ctx.connection->id());
    return {};
}

std::error_code gate_server::handle_disconnect(const session_context& ctx, const message&) {
    if (const auto ec = ctx.session->transition(session_state::disconnecting)) {
        debug(logger_, "session:{} logout in state {}", ctx.session->id(), to_string_view(ctx.session->state()));
    }
    info(logger_, "session:{} player:{} logout", ctx.session->id(), ctx.session->player_id());
    registry_.remove(ctx.connection->id(), net_errors::initiative_disconnect);
    return {};
}

}  // namespace gatecore

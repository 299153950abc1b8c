#include <gatecore/server/server_config.h>

#include <fstream>
#include <limits>

namespace gatecore {

static int64_t read_ranged(const std::string& key, const toml_table_t& table, int64_t default_value, int64_t min_value,
                           int64_t max_value) {
    int64_t value = default_value;
    if (read_toml_integer(value, key, table) && (value < min_value || value > max_value)) {
        throw std::logic_error(fmt::format("config key '{}' out of range [{}, {}]", key, min_value, max_value));
    }
    return value;
}

server_config parse_server_config(const toml_table_t& root) {
    server_config config;
    constexpr auto int_max = std::numeric_limits<int32_t>::max();

    read_toml_string(config.host, "host", root);
    config.port = static_cast<uint16_t>(read_ranged("port", root, config.port, 0, 65535));
    config.io_threads = static_cast<size_t>(read_ranged("io_threads", root, 1, 1, 256));
    config.max_connections = static_cast<size_t>(read_ranged("max_connections", root, 10000, 0, int_max));
    config.max_frame_size = static_cast<uint32_t>(read_ranged("max_frame_size", root, default_max_frame_size, 1, int_max));
    config.send_queue_limit = static_cast<size_t>(read_ranged("send_queue_limit", root, 1024, 1, int_max));
    read_toml_boolean(config.require_auth, "require_auth", root);
    read_toml_string(config.log_config, "log_config", root);

    if (const auto* table = find_toml_table("heartbeat", root)) {
        config.heartbeat.interval = std::chrono::milliseconds(read_ranged("interval_ms", *table, 30000, 1, int_max));
        config.heartbeat.timeout = std::chrono::milliseconds(read_ranged("timeout_ms", *table, 10000, 1, int_max));
        config.heartbeat.max_missed = static_cast<uint32_t>(read_ranged("max_missed", *table, 3, 1, 1000));
    }

    if (config.heartbeat.timeout >= config.heartbeat.interval) {
        throw std::logic_error(fmt::format("heartbeat timeout_ms {} must be less than interval_ms {}",
                                           config.heartbeat.timeout.count(), config.heartbeat.interval.count()));
    }

    if (const auto* table = find_toml_table("session", root)) {
        config.session.idle_timeout = std::chrono::seconds(read_ranged("idle_timeout_s", *table, 1800, 1, int_max));
        config.session.idle_grace = std::chrono::seconds(read_ranged("idle_grace_s", *table, 0, 0, int_max));
        config.sweep_interval = std::chrono::seconds(read_ranged("sweep_interval_s", *table, 300, 1, int_max));
    }

    if (const auto* table = find_toml_table("connection", root)) {
        config.inactive_timeout = std::chrono::seconds(read_ranged("inactive_timeout_s", *table, 300, 1, int_max));
        config.cleanup_interval = std::chrono::seconds(read_ranged("cleanup_interval_s", *table, 30, 1, int_max));
    }

    if (const auto* auth = find_toml_table("auth", root)) {
        if (const auto* tokens = find_toml_table("tokens", *auth)) {
            for (const auto& [token, value] : *tokens) {
                if (!value.is_integer() || value.as_integer() <= 0) {
                    throw std::logic_error(fmt::format("auth token '{}' need a positive player id", token));
                }
                config.auth_tokens.emplace(token, static_cast<uint64_t>(value.as_integer()));
            }
        }
    }

    return config;
}

server_config load_server_config(const std::string& path) {
    std::ifstream ifs(path, std::ios_base::binary | std::ios_base::in);
    if (!ifs.is_open()) {
        throw std::logic_error(fmt::format("open config {} fail, {}", path, std::generic_category().message(errno)));
    }

    const auto config = toml::parse(ifs, path);
    return parse_server_config(config.as_table());
}

}  // namespace gatecore

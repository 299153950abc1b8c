#include <gatecore/server/server_config.h>
#include <gtest/gtest.h>

#include <sstream>

using namespace gatecore;

static server_config parse_text(const std::string& text) {
    std::istringstream iss(text);
    const auto value = toml::parse(iss, "test_server.toml");
    return parse_server_config(value.as_table());
}

TEST(server_config, defaults) {
    const auto config = parse_text("");
    EXPECT_TRUE(config.host.empty());
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.io_threads, 1U);
    EXPECT_EQ(config.max_frame_size, default_max_frame_size);
    EXPECT_TRUE(config.require_auth);
    EXPECT_EQ(config.heartbeat.interval, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.heartbeat.timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.heartbeat.max_missed, 3U);
    EXPECT_EQ(config.session.idle_timeout, std::chrono::seconds(1800));
    EXPECT_EQ(config.session.idle_grace, std::chrono::seconds(0));
    EXPECT_TRUE(config.auth_tokens.empty());
}

TEST(server_config, full) {
    const auto config = parse_text(R"(
host = "127.0.0.1"
port = 0
io_threads = 2
max_connections = 100
require_auth = false

[heartbeat]
interval_ms = 1500
timeout_ms = 500
max_missed = 5

[session]
idle_timeout_s = 60
idle_grace_s = 10
sweep_interval_s = 5

[connection]
inactive_timeout_s = 120
cleanup_interval_s = 15

[auth.tokens]
"p1" = 1
"p2" = 2
)");

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.io_threads, 2U);
    EXPECT_EQ(config.max_connections, 100U);
    EXPECT_FALSE(config.require_auth);
    EXPECT_EQ(config.heartbeat.interval, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.heartbeat.timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(config.heartbeat.max_missed, 5U);
    EXPECT_EQ(config.session.idle_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.session.idle_grace, std::chrono::seconds(10));
    EXPECT_EQ(config.sweep_interval, std::chrono::seconds(5));
    EXPECT_EQ(config.inactive_timeout, std::chrono::seconds(120));
    EXPECT_EQ(config.cleanup_interval, std::chrono::seconds(15));
    ASSERT_EQ(config.auth_tokens.size(), 2U);
    EXPECT_EQ(config.auth_tokens.at("p2"), 2U);
}

TEST(server_config, invalid_values) {
    EXPECT_THROW(parse_text("port = 70000"), std::logic_error);
    EXPECT_THROW(parse_text("io_threads = 0"), std::logic_error);
    EXPECT_THROW(parse_text("port = \"9090\""), std::logic_error);
    EXPECT_THROW(parse_text("[heartbeat]\nmax_missed = 0"), std::logic_error);
    EXPECT_THROW(parse_text("[heartbeat]\ninterval_ms = 1000\ntimeout_ms = 1000"), std::logic_error);
    EXPECT_THROW(parse_text("[heartbeat]\ninterval_ms = 5000"), std::logic_error);
    EXPECT_NO_THROW(parse_text("[heartbeat]\ninterval_ms = 1000\ntimeout_ms = 999"));
    EXPECT_THROW(parse_text("[auth.tokens]\np1 = 0"), std::logic_error);
    EXPECT_THROW(parse_text("[auth.tokens]\np1 = \"one\""), std::logic_error);
}

TEST(server_config, missing_file) { EXPECT_THROW(load_server_config("/nonexistent/gatecore.toml"), std::logic_error); }

#include <gatecore/log/log.h>
#include <gatecore/metrics/metrics.h>
#include <gatecore/server/gate_server.h>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>

static void dump_metrics(const gatecore::metrics_registry& metrics) {
    const auto snapshot = metrics.snapshot();
    for (const auto& [name, value] : snapshot.counters) {
        gatecore::info("metrics counter {}={}", name, value);
    }

    for (const auto& [name, summary] : snapshot.durations) {
        const auto avg = summary.count > 0 ? summary.sum.count() / summary.count : 0;
        gatecore::info("metrics duration {} count={} avg={}ns max={}ns", name, summary.count, avg, summary.max.count());
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        gatecore::error("gatecore_server need config");
        return 1;
    }

    gatecore::server_config config;
    try {
        config = gatecore::load_server_config(argv[1]);
        if (!config.log_config.empty()) {
            gatecore::load_log_config(config.log_config);
        }
    } catch (const std::exception& e) {
        gatecore::error("load config {} fail, {}", argv[1], e.what());
        return 1;
    }

    auto metrics = std::make_shared<gatecore::metrics_registry>();
    auto auth = std::make_shared<gatecore::static_token_authenticator>(config.auth_tokens);
    gatecore::gate_server server(std::move(config), std::move(auth), gatecore::find_logger("gate"), metrics);

    try {
        server.start();
    } catch (const std::system_error& e) {
        gatecore::error("gate server start fail, {}", e.what());
        return 1;
    }

    // 信号在单独的 io_context 上等待
    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const std::error_code& ec, int sig) {
        if (!ec) {
            gatecore::info("receive signal {}, stopping", sig);
        }
        server.stop();
    });
    signal_context.run();

    server.join();
    dump_metrics(*metrics);
    gatecore::log_flush();
    return 0;
}

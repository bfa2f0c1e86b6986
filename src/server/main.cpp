#include "common/clock.hpp"
#include "common/logger.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/database.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    tkv::ServerConfig cfg;
    try {
        cfg = tkv::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    tkv::init_default_logger(tkv::parse_log_level(cfg.log_level));

    spdlog::info("tkv-server starting – {}:{} threads={} max_connections={} auth={}",
                 cfg.host, cfg.port, cfg.threads, cfg.max_connections,
                 cfg.requirepass.empty() ? "off" : "on");
    spdlog::debug("  max_bulk_length={} max_inline_length={} expiry_sweep_interval_ms={}",
                  cfg.max_bulk_length, cfg.max_inline_length, cfg.expiry_sweep_interval_ms);

    // ── Storage + server ─────────────────────────────────────────────────────
    tkv::SystemClock clock;
    tkv::storage::Database db{clock};

    try {
        tkv::network::Server server{cfg, db};
        server.run();
    } catch (const std::exception& e) {
        spdlog::error("tkv-server: {}", e.what());
        return 1;
    }

    spdlog::info("tkv-server stopped");
    return 0;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace tkv {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one tkv-server process.
// Populated by parse_config() from CLI arguments and the environment.

struct ServerConfig {
    std::string host = "127.0.0.1";            // Bind address
    uint16_t    port = 6379;                   // Listening port
    unsigned    threads = 0;                   // I/O threads, 0 = hardware concurrency
    std::size_t max_connections = 10000;       // Concurrent client limit
    std::size_t max_bulk_length = 512 * 1024 * 1024; // Largest accepted bulk string
    std::size_t max_inline_length = 64 * 1024; // Largest inline command / header line
    std::string requirepass;                   // Empty = no AUTH required
    uint32_t    expiry_sweep_interval_ms = 30000; // 0 disables the background sweep
    std::string log_level = "info";            // spdlog level string
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// The HOST and PORT environment variables are honoured as defaults for
// --host / --port; explicit command-line options take precedence.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (also used to carry the --help text).
//
// Validates:
//   - port in [1, 65535]
//   - host not empty
//   - max-connections, max-bulk-length, max-inline-length > 0

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with tkv-server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace tkv

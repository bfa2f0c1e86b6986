#include "common/server_config.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace tkv {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Validate that a port number is in [1, 65535].
void validate_port(uint16_t port, std::string_view field_name) {
    if (port == 0) {
        throw std::runtime_error(
            fmt::format("Port for {} must be in [1, 65535], got 0", field_name));
    }
}

void validate_positive(std::size_t value, std::string_view field_name) {
    if (value == 0) {
        throw std::runtime_error(fmt::format("{} must be > 0", field_name));
    }
}

// Maps environment variable names onto option names; "" means ignore.
std::string map_environment(const std::string& name) {
    if (name == "HOST") return "host";
    if (name == "PORT") return "port";
    return {};
}

void validate(const ServerConfig& cfg) {
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }
    validate_port(cfg.port, "--port");
    validate_positive(cfg.max_connections,   "--max-connections");
    validate_positive(cfg.max_bulk_length,   "--max-bulk-length");
    validate_positive(cfg.max_inline_length, "--max-inline-length");
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const ServerConfig defaults;
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value(defaults.host),
            "Bind address (env HOST)")
        ("port,p",
            po::value<uint16_t>()->default_value(defaults.port),
            "Listening port (env PORT)")
        ("threads",
            po::value<unsigned>()->default_value(defaults.threads),
            "I/O threads, 0 = hardware concurrency")
        ("max-connections",
            po::value<std::size_t>()->default_value(defaults.max_connections),
            "Maximum number of concurrent clients")
        ("max-bulk-length",
            po::value<std::size_t>()->default_value(defaults.max_bulk_length),
            "Maximum bulk string length accepted from clients")
        ("max-inline-length",
            po::value<std::size_t>()->default_value(defaults.max_inline_length),
            "Maximum inline command / protocol header line length")
        ("requirepass",
            po::value<std::string>()->default_value(defaults.requirepass),
            "Password clients must send with AUTH (empty = none)")
        ("expiry-sweep-interval-ms",
            po::value<uint32_t>()->default_value(defaults.expiry_sweep_interval_ms),
            "Period of the background expired-key sweep, 0 disables it")
        ("log-level",
            po::value<std::string>()->default_value(defaults.log_level),
            "Log level: trace|debug|info|warn|error|critical");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("tkv-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        // Command line first: the first store of an option wins, so the
        // environment only replaces defaults.
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::store(po::parse_environment(desc, map_environment), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServerConfig cfg;
    cfg.host                     = vm["host"].as<std::string>();
    cfg.port                     = vm["port"].as<uint16_t>();
    cfg.threads                  = vm["threads"].as<unsigned>();
    cfg.max_connections          = vm["max-connections"].as<std::size_t>();
    cfg.max_bulk_length          = vm["max-bulk-length"].as<std::size_t>();
    cfg.max_inline_length        = vm["max-inline-length"].as<std::size_t>();
    cfg.requirepass              = vm["requirepass"].as<std::string>();
    cfg.expiry_sweep_interval_ms = vm["expiry-sweep-interval-ms"].as<uint32_t>();
    cfg.log_level                = vm["log-level"].as<std::string>();

    validate(cfg);
    return cfg;
}

} // namespace tkv

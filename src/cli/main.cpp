#include "client/client.hpp"
#include "common/logger.hpp"
#include "network/resp_codec.hpp"

#include <boost/program_options.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

namespace {

bool is_command(const std::vector<std::string>& args, std::string_view name) {
    if (args.empty() || args[0].size() != name.size()) return false;
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(args[0][i])) != name[i]) return false;
    }
    return true;
}

// SUBSCRIBE a b: one confirmation per channel, then messages until the
// connection closes.
void subscribe_loop(tkv::client::Connection& conn, const std::vector<std::string>& args) {
    for (std::size_t i = 1; i < args.size(); ++i) {
        fprintf(stdout, "%s\n", tkv::client::format_reply(conn.read_reply()).c_str());
    }
    fprintf(stdout, "Reading messages... (press Ctrl-C to quit)\n");
    fflush(stdout);
    while (conn.is_open()) {
        fprintf(stdout, "%s\n", tkv::client::format_reply(conn.read_reply()).c_str());
        fflush(stdout);
    }
}

// Sends one command and prints its reply. Returns false once the connection
// is gone or the user asked to quit.
bool run_command(tkv::client::Connection& conn, const std::vector<std::string>& args) {
    if (is_command(args, "subscribe") && args.size() > 1) {
        conn.send_raw(tkv::network::encode_command(args));
        subscribe_loop(conn, args);
        return false;
    }
    const auto reply = conn.command(args);
    fprintf(stdout, "%s\n", tkv::client::format_reply(reply).c_str());
    return !is_command(args, "quit");
}

// ── REPL ──────────────────────────────────────────────────────────────────────

void repl(tkv::client::Connection& conn, const std::string& prompt) {
    std::string line;
    while (true) {
        fprintf(stdout, "%s> ", prompt.c_str());
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        std::vector<std::string> args;
        try {
            args = tkv::client::split_command_line(line);
        } catch (const std::runtime_error& e) {
            fprintf(stdout, "%s\n", e.what());
            continue;
        }
        if (args.empty()) {
            continue;
        }

        if (!run_command(conn, args)) {
            break;
        }
    }
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("tkv-cli options");
    desc.add_options()
        ("help,h",                                                       "Show this help")
        ("host",        po::value<std::string>()->default_value("127.0.0.1"), "Server host")
        ("port,p",      po::value<std::uint16_t>()->default_value(6379),      "Server port")
        ("log-level,l", po::value<std::string>()->default_value("warn"),      "Log level")
        ("command",     po::value<std::vector<std::string>>(),
                        "Command to run once instead of starting the REPL");

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << "Usage: tkv-cli [options] [command [arg ...]]\n" << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto host      = vm["host"].as<std::string>();
    const auto port      = vm["port"].as<std::uint16_t>();
    const auto log_level = vm["log-level"].as<std::string>();

    tkv::init_default_logger(tkv::parse_log_level(log_level));
    spdlog::debug("tkv-cli connecting to {}:{}", host, port);

    try {
        tkv::client::Connection conn{host, port};

        if (vm.count("command")) {
            run_command(conn, vm["command"].as<std::vector<std::string>>());
            return 0;
        }

        repl(conn, host + ":" + std::to_string(port));
    } catch (const std::exception& ex) {
        spdlog::error("tkv-cli: {}", ex.what());
        return 1;
    }

    return 0;
}

#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace roomsync::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);

struct Params {
    std::string url          = "ws://localhost:8080/collab";
    std::string host_name    = "Alice";
    std::string guest_name   = "Bob";
    std::string snapshot_dir;
    int duration_sec         = 10;
    int max_participants     = 10;
    std::string log_level    = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL          : " << url << "\n"
           << "  Host         : " << host_name << "\n"
           << "  Guest        : " << guest_name << "\n"
           << "  Snapshots    : " << (snapshot_dir.empty() ? "(disabled)" : snapshot_dir) << "\n"
           << "  Duration     : " << duration_sec << "s\n"
           << "  Log Level    : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "Relay WebSocket endpoint")->check(ws_url_validator)->default_val(params.url);
    app.add_option("--host", params.host_name, "Display name of the hosting participant")->default_val(params.host_name);
    app.add_option("--guest", params.guest_name, "Display name of the joining participant")->default_val(params.guest_name);
    app.add_option("--snapshot-dir", params.snapshot_dir, "Directory for session snapshots (empty disables)");
    app.add_option("-d,--duration", params.duration_sec, "Seconds to keep the session running")
        ->check(CLI::Range(1, 3600))->default_val(params.duration_sec);
    app.add_option("-m,--max-participants", params.max_participants, "Room capacity")
        ->check(CLI::Range(1, 100))->default_val(params.max_participants);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))->default_val(params.log_level);

    app.footer(
        "Runs a host and a guest in one process.\n"
        "Room codes are resolved through an in-process directory,\n"
        "all session traffic goes through the relay."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    lcr::log::Logger::instance().set_level(params.log_level);
    return params;
}

} // namespace roomsync::examples::cli

#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "roomsync/core/transport/error.hpp"


namespace roomsync::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{true};    // true = wss, false = ws
        std::string host;
        std::string port;
        std::string path;
    };


    // ---------------------------------------------------------------------
    // Minimal ws:// and wss:// URL parser.
    // Accepts the URLs a sync endpoint is configured with and rejects
    // malformed inputs without attempting full RFC compliance.
    //
    // Example inputs:
    //   wss://collaborate.roomsnap.app
    //   ws://localhost:8080/sync
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.compare(0, ws.size(), ws) == 0) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.compare(0, wss.size(), wss) == 0) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) host[:port]
        const std::size_t slash = url.find('/', pos);
        const std::string hostport = (slash == std::string::npos) ? url.substr(pos) : url.substr(pos, slash - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        const std::size_t colon = hostport.find(':');
        if (colon != std::string::npos) {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        } else {
            out.host = hostport;
            out.port = out.secure ? "443" : "80";
        }
        // 3) Path (default "/")
        out.path = (slash == std::string::npos) ? "/" : url.substr(slash);

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        return Error::None;
    }

} // namespace roomsync::core::transport

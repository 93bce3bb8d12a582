#pragma once
#include <string>

// A connectable WebSocket endpoint, already split for Beast.
struct Endpoint {
    bool secure = false;      // wss://
    std::string host;         // IPv6 literals without brackets
    std::string port;
    std::string target;       // path + query, e.g. "/api/downloads/ws?token=..."

    bool operator==(const Endpoint&) const = default;
};

/// Build the download-progress endpoint for an API base URL and token:
///   http://h:8080/api  + t  →  ws://h:8080/api/downloads/ws?token=t
///   https://h/api      + t  →  wss://h:443/api/downloads/ws?token=t
///   http://[::1]:8080  + t  →  host "::1", port "8080"
/// ws:// and wss:// bases are accepted as-is. The token is percent-encoded.
/// Throws std::invalid_argument for an unsupported scheme or empty host.
Endpoint buildDownloadsEndpoint(const std::string& baseUrl, const std::string& token);

/// "host:port" for the Host header; IPv6 literals are bracketed.
std::string hostAndPort(const Endpoint& endpoint);

/// "wss://host:port/target" with the token query value masked.
std::string describeEndpoint(const Endpoint& endpoint);

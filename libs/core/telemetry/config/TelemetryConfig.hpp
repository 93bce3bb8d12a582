/*
Lookout — TelemetryConfig
Role: Runtime configuration for the telemetry client (server, credential, backoff, transport).
Inputs/Outputs: Reads a JSON file plus LOOKOUT_* environment variables; outputs a TelemetryConfig.
Threading: Load once at startup on the calling thread.
Performance: One-time file I/O.
Integration: Consumed by TelemetryClient and lookout_cli.
Observability: Logs the resolved endpoint base (never the token).
Related: TelemetryConfig.cpp, Endpoint.hpp, ReconnectPolicy.hpp.
Assumptions: Token files are JSON objects with a "token" field.
*/
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "telemetry/ReconnectPolicy.hpp"

struct TelemetryConfig {
    std::string baseUrl = "http://127.0.0.1:12555/api";
    std::optional<std::string> token;          // inline token, wins over tokenFile
    std::string tokenFile;
    std::optional<std::string> ownerFilter;    // streamer id; empty = all downloads
    ReconnectPolicy reconnect;
    std::chrono::seconds pingInterval{25};
    std::chrono::seconds handshakeTimeout{30};
    bool verifyPeer = true;
};

/// Parse a configuration object. Unknown keys are ignored; missing keys keep
/// their defaults. Throws std::runtime_error on wrongly-typed or invalid values.
TelemetryConfig parseTelemetryConfig(const nlohmann::json& j);

/// Load and parse a JSON configuration file, then apply environment overrides.
/// Throws std::runtime_error if the file cannot be opened or parsed.
TelemetryConfig loadTelemetryConfig(const std::string& path);

/// LOOKOUT_BASE_URL, LOOKOUT_TOKEN, LOOKOUT_OWNER_FILTER
void applyEnvironmentOverrides(TelemetryConfig& config);

/// Read {"token": "..."} from a file. Throws std::runtime_error on failure.
std::string loadTokenFile(const std::string& path);

/// Inline token if set, else the token file if set, else nothing.
std::optional<std::string> resolveToken(const TelemetryConfig& config);

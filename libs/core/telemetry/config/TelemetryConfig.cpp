/*
Lookout — TelemetryConfig
Role: JSON + environment configuration loading.
Inputs/Outputs: File path / json object in; TelemetryConfig out.
Threading: Calling thread only.
Performance: One-time.
Integration: See TelemetryConfig.hpp.
Observability: Logs which file was loaded and the base URL.
Related: TelemetryConfig.hpp.
Assumptions: Durations are given as integer milliseconds / seconds.
*/
#include "TelemetryConfig.hpp"
#include "Endpoint.hpp"
#include "LookoutLogging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

template <class T>
T readField(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    try {
        return j[key].get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("TelemetryConfig: bad value for '") + key + "': " + ex.what());
    }
}

std::optional<std::string> nonEmpty(std::string s) {
    if (s.empty()) return std::nullopt;
    return s;
}

} // namespace

TelemetryConfig parseTelemetryConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("TelemetryConfig: top-level JSON value must be an object");
    }

    TelemetryConfig cfg;
    cfg.baseUrl     = readField<std::string>(j, "base_url", cfg.baseUrl);
    cfg.token       = nonEmpty(readField<std::string>(j, "token", ""));
    cfg.tokenFile   = readField<std::string>(j, "token_file", "");
    cfg.ownerFilter = nonEmpty(readField<std::string>(j, "owner_filter", ""));

    const auto baseMs = readField<int64_t>(j, "reconnect_base_ms", cfg.reconnect.baseDelay.count());
    const auto maxMs  = readField<int64_t>(j, "reconnect_max_ms", cfg.reconnect.maxDelay.count());
    if (baseMs <= 0 || maxMs < baseMs) {
        throw std::runtime_error("TelemetryConfig: require 0 < reconnect_base_ms <= reconnect_max_ms");
    }
    cfg.reconnect.baseDelay = std::chrono::milliseconds{baseMs};
    cfg.reconnect.maxDelay  = std::chrono::milliseconds{maxMs};

    const auto ping = readField<int64_t>(j, "ping_interval_secs", cfg.pingInterval.count());
    const auto hs   = readField<int64_t>(j, "handshake_timeout_secs", cfg.handshakeTimeout.count());
    if (ping < 0 || hs <= 0) {
        throw std::runtime_error("TelemetryConfig: ping_interval_secs must be >= 0 and handshake_timeout_secs > 0");
    }
    cfg.pingInterval     = std::chrono::seconds{ping};
    cfg.handshakeTimeout = std::chrono::seconds{hs};
    cfg.verifyPeer       = readField<bool>(j, "verify_peer", cfg.verifyPeer);

    // Fail early on a base URL the endpoint builder would reject
    try {
        (void)buildDownloadsEndpoint(cfg.baseUrl, "");
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(std::string("TelemetryConfig: ") + ex.what());
    }
    return cfg;
}

TelemetryConfig loadTelemetryConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("TelemetryConfig: Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        throw std::runtime_error("TelemetryConfig: Failed to parse JSON from " + path + ": " + ex.what());
    }

    TelemetryConfig cfg = parseTelemetryConfig(j);
    applyEnvironmentOverrides(cfg);
    lLog_App("Loaded telemetry config from" << QString::fromStdString(path)
             << "base_url" << QString::fromStdString(cfg.baseUrl));
    return cfg;
}

void applyEnvironmentOverrides(TelemetryConfig& config) {
    if (const char* url = std::getenv("LOOKOUT_BASE_URL"); url && *url) {
        config.baseUrl = url;
    }
    if (const char* token = std::getenv("LOOKOUT_TOKEN"); token && *token) {
        config.token = std::string(token);
    }
    if (const char* owner = std::getenv("LOOKOUT_OWNER_FILTER"); owner) {
        config.ownerFilter = nonEmpty(owner);
    }
}

std::string loadTokenFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("TelemetryConfig: Failed to open token file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        throw std::runtime_error("TelemetryConfig: Failed to parse JSON from token file: " + std::string(ex.what()));
    }

    const std::string token = j.is_object() ? j.value("token", "") : "";
    if (token.empty()) {
        throw std::runtime_error("TelemetryConfig: Missing 'token' field in token file " + path);
    }
    return token;
}

std::optional<std::string> resolveToken(const TelemetryConfig& config) {
    if (config.token) return config.token;
    if (!config.tokenFile.empty()) return loadTokenFile(config.tokenFile);
    return std::nullopt;
}

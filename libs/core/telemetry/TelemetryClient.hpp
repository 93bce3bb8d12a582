#pragma once
/*
Lookout — TelemetryClient
Role: Facade that wires config, TLS, the Beast transport and a ConnectionManager onto one I/O thread.
Inputs/Outputs: TelemetryConfig + CredentialSource in; ConnectionManager signals and projection out.
Threading: Runs a Boost.Asio io_context on a dedicated worker thread.
Performance: All network I/O is asynchronous; public calls never block except stop().
Integration: Used by lookout_cli and by embedding applications.
Observability: Lifecycle logging via LookoutLogging.
Related: TelemetryClient.cpp, ConnectionManager.hpp, BeastWsTransport.hpp, TelemetryConfig.hpp.
Assumptions: The CredentialSource outlives this object.
*/
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include "telemetry/ConnectionManager.hpp"
#include "telemetry/config/TelemetryConfig.hpp"

class TelemetryClient {
public:
    TelemetryClient(TelemetryConfig config, CredentialSource& credentials);
    ~TelemetryClient();

    static constexpr std::chrono::seconds kTeardownTimeout{2};

    void start();
    /// Blocks until the manager has torn down (bounded) and the I/O thread has joined.
    void stop();

    void setFilter(std::optional<std::string> ownerId) { m_manager->setFilter(std::move(ownerId)); }

    ConnectionManager& manager() { return *m_manager; }
    Projection projection() const { return m_manager->projection(); }
    ConnectionStatus status() const { return m_manager->status(); }

    // Non-copyable, non-movable (manages thread)
    TelemetryClient(const TelemetryClient&) = delete;
    TelemetryClient& operator=(const TelemetryClient&) = delete;

private:
    void run();

    TelemetryConfig                 m_config;
    net::io_context                 m_ioc;
    net::ssl::context               m_sslCtx{net::ssl::context::tlsv12_client};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> m_workGuard;
    std::unique_ptr<ConnectionManager> m_manager;
    std::atomic<bool>               m_running{false};
    std::thread                     m_ioThread;
};

#include "TelemetryClient.hpp"
#include "LookoutLogging.hpp"
#include "telemetry/config/Endpoint.hpp"
#include "telemetry/ws/BeastWsTransport.hpp"
#include <chrono>
#include <future>
#include <memory>

TelemetryClient::TelemetryClient(TelemetryConfig config, CredentialSource& credentials)
    : m_config(std::move(config))
{
    // Configure SSL context
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(m_config.verifyPeer ? net::ssl::verify_peer : net::ssl::verify_none);

    TransportOptions opts;
    opts.handshakeTimeout = m_config.handshakeTimeout;
    opts.pingInterval     = m_config.pingInterval;
    opts.verifyPeer       = m_config.verifyPeer;

    auto makeTransport = [this, opts]() -> std::shared_ptr<WsTransport> {
        return std::make_shared<BeastWsTransport>(m_ioc, m_sslCtx, opts);
    };
    auto endpointFor = [baseUrl = m_config.baseUrl](const std::string& token) {
        return buildDownloadsEndpoint(baseUrl, token);
    };

    m_manager = std::make_unique<ConnectionManager>(m_ioc, credentials,
                                                    std::move(makeTransport),
                                                    std::move(endpointFor),
                                                    m_config.reconnect);
    if (m_config.ownerFilter) {
        m_manager->setFilter(m_config.ownerFilter);
    }
    lLog_App("TelemetryClient initialized for" << QString::fromStdString(m_config.baseUrl));
}

TelemetryClient::~TelemetryClient() {
    stop();
    // Thread joined: safe to destroy the manager and its pending handlers
    m_manager.reset();
}

void TelemetryClient::start() {
    if (!m_running.exchange(true)) {
        lLog_App("Starting TelemetryClient...");

        // Keep io_context alive between connections
        m_workGuard.emplace(m_ioc.get_executor());
        m_ioc.restart();

        m_ioThread = std::thread(&TelemetryClient::run, this);
        m_manager->start();
    }
}

void TelemetryClient::stop() {
    if (m_running.exchange(false)) {
        lLog_App("Stopping TelemetryClient...");

        // The handler may outlive this call if the wait below times out
        auto tornDown = std::make_shared<std::promise<void>>();
        auto done = tornDown->get_future();
        m_manager->stop([tornDown]() { tornDown->set_value(); });
        if (done.wait_for(kTeardownTimeout) != std::future_status::ready) {
            lLog_Warning("ConnectionManager teardown timed out; stopping I/O anyway");
        }

        m_workGuard.reset();
        m_ioc.stop();
        if (m_ioThread.joinable()) {
            m_ioThread.join();
        }
        lLog_App("TelemetryClient stopped");
    }
}

void TelemetryClient::run() {
    lLog_App("IO context running for telemetry transport");
    m_ioc.run();
    lLog_App("IO context stopped");
}

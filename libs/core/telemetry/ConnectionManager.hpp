#pragma once
/*
Lookout — ConnectionManager
Role: Owns the download-progress WebSocket lifecycle: connect, receive, reconnect with backoff, teardown.
Inputs/Outputs: Takes a CredentialSource and a transport factory; exposes the live Projection and a status signal.
Threading: Every state change runs on one Boost.Asio strand; public methods post onto it and return immediately.
Performance: One decode and one projection fold per frame; the projection is republished only when it changed.
Integration: Created and owned by TelemetryClient (or a test with its own io_context).
Observability: Logs lifecycle via LookoutLogging; emits statusChanged, projectionChanged, reconnectScheduled, errorOccurred.
Related: ConnectionManager.cpp, DownloadStore.hpp, SubscriptionController.hpp, WsTransport.hpp, CredentialSource.hpp.
Assumptions: The CredentialSource outlives this object; the io_context is stopped (or drained) before this object is destroyed.
*/
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <QObject>
#include <QMetaType>
#include <QString>
#include "telemetry/ReconnectPolicy.hpp"
#include "telemetry/auth/CredentialSource.hpp"
#include "telemetry/config/Endpoint.hpp"
#include "telemetry/store/DownloadStore.hpp"
#include "telemetry/ws/SubscriptionController.hpp"
#include "telemetry/ws/WsTransport.hpp"

namespace net = boost::asio;

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Error,
    Closed
};

inline const char* toString(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Error:        return "error";
        case ConnectionStatus::Closed:       return "closed";
    }
    return "disconnected";
}

Q_DECLARE_METATYPE(ConnectionStatus)

class ConnectionManager : public QObject {
    Q_OBJECT

public:
    using TransportFactory = std::function<std::shared_ptr<WsTransport>()>;
    using EndpointResolver = std::function<Endpoint(const std::string& token)>;

    ConnectionManager(net::io_context& ioc,
                      CredentialSource& credentials,
                      TransportFactory makeTransport,
                      EndpointResolver endpointFor,
                      ReconnectPolicy policy = {},
                      DownloadStore store = {},
                      QObject* parent = nullptr);
    ~ConnectionManager() override;

    /// Begin observing the credential source; connects if a credential is present.
    void start();
    /// Stop observing, tear down and settle in Closed. `done` runs on the
    /// strand once teardown has happened.
    void stop(std::function<void()> done = {});

    /// No-op without a credential, while Connecting/Connected, or with an attempt in flight.
    void connectToServer();
    /// Idempotent. Cancels any pending reconnect, closes the transport, clears the projection.
    void disconnectFromServer();

    /// std::nullopt = receive all downloads.
    void setFilter(std::optional<std::string> ownerId);

    // Thread-safe observers
    ConnectionStatus status() const { return m_status.load(); }
    Projection projection() const;
    std::shared_ptr<const Projection> projectionSnapshot() const;
    uint32_t reconnectAttempt() const { return m_attempt.load(); }
    bool reconnectPending() const { return m_timerPending.load(); }
    const ReconnectPolicy& reconnectPolicy() const { return m_policy; }

    // Non-copyable, non-movable (callbacks capture this)
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    ConnectionManager(ConnectionManager&&) = delete;
    ConnectionManager& operator=(ConnectionManager&&) = delete;

signals:
    void statusChanged(ConnectionStatus status);
    void projectionChanged();
    void reconnectScheduled(qint64 delayMs, int attempt);
    void eventDecoded(const QString& type);
    void errorOccurred(const QString& message);

private:
    // Strand-only
    void doConnect();
    void doDisconnect(ConnectionStatus settleIn);
    void handleCredential(const std::optional<std::string>& token);
    void handleOpen(uint64_t generation);
    void handleDown(uint64_t generation);
    void handleTransportError(uint64_t generation, const std::string& message);
    void handleFrame(uint64_t generation, const std::string& frame);
    void logInformational(const TelemetryEvent& event);
    void scheduleReconnect();
    void cancelReconnect();
    void releaseTransport();
    void sendFrame(std::string frame);
    void setStatus(ConnectionStatus s);
    void publishProjection();
    void emitError(const QString& message);

    net::strand<net::io_context::executor_type> m_strand;
    CredentialSource&               m_credentials;
    CredentialSource::Subscription  m_credentialSub;
    TransportFactory                m_makeTransport;
    EndpointResolver                m_endpointFor;
    ReconnectPolicy                 m_policy;

    DownloadStore                   m_store;
    SubscriptionController          m_subscriptions;
    std::shared_ptr<WsTransport>    m_transport;
    net::steady_timer               m_reconnectTimer;

    // A connect attempt / timer only acts while its generation is current
    uint64_t                        m_connGeneration{0};
    uint64_t                        m_timerGeneration{0};
    bool                            m_connectInFlight{false};
    bool                            m_stopped{false};

    std::atomic<ConnectionStatus>   m_status{ConnectionStatus::Disconnected};
    std::atomic<uint32_t>           m_attempt{0};
    std::atomic<bool>               m_timerPending{false};

    mutable std::mutex              m_publishMutex;
    std::shared_ptr<const Projection> m_published;
};

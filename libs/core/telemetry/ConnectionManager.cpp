/*
Lookout — ConnectionManager
Role: Connection state machine, backoff scheduling and event routing into the DownloadStore.
Inputs/Outputs: Transport callbacks and credential changes in; projection/status publications out.
Threading: Transport and credential callbacks are re-posted onto m_strand, so every handler below runs
           serialized there. Signals are emitted from that strand; receivers in other threads should
           connect with a context object to get queued delivery.
Performance: Progress frames dominate; they update one entry in place.
Integration: See ConnectionManager.hpp.
Observability: Lifecycle at app level; per-frame logging is throttled on the data category.
Related: ConnectionManager.hpp, MessageCodec.hpp, DownloadStore.hpp.
Assumptions: A transport reports status(false) at most once, after any error it reports.
*/
#include "ConnectionManager.hpp"
#include "LookoutLogging.hpp"
#include "telemetry/codec/MessageCodec.hpp"
#include <boost/asio/post.hpp>
#include <exception>
#include <type_traits>
#include <utility>

ConnectionManager::ConnectionManager(net::io_context& ioc,
                                     CredentialSource& credentials,
                                     TransportFactory makeTransport,
                                     EndpointResolver endpointFor,
                                     ReconnectPolicy policy,
                                     DownloadStore store,
                                     QObject* parent)
    : QObject(parent)
    , m_strand(net::make_strand(ioc))
    , m_credentials(credentials)
    , m_makeTransport(std::move(makeTransport))
    , m_endpointFor(std::move(endpointFor))
    , m_policy(policy)
    , m_store(std::move(store))
    , m_subscriptions([this](std::string frame) { sendFrame(std::move(frame)); })
    , m_reconnectTimer(m_strand)
    , m_published(std::make_shared<const Projection>(m_store.projection()))
{
    qRegisterMetaType<ConnectionStatus>("ConnectionStatus");
    lLog_App("ConnectionManager initialized");
}

ConnectionManager::~ConnectionManager() {
    m_credentialSub.reset();
    if (m_transport) {
        // Detach before closing: completions may still run after we are gone
        m_transport->onMessage(nullptr);
        m_transport->onStatus(nullptr);
        m_transport->onError(nullptr);
        m_transport->close();
        m_transport.reset();
    }
    lLog_App("ConnectionManager destroyed");
}

// ---------------------------------------------------------------------------
// Public API: fire-and-forget, everything runs on the strand
// ---------------------------------------------------------------------------

void ConnectionManager::start() {
    net::post(m_strand, [this]() {
        m_stopped = false;
        if (!m_credentialSub.active()) {
            m_credentialSub = m_credentials.subscribe([this](const std::optional<std::string>& token) {
                net::post(m_strand, [this, token]() { handleCredential(token); });
            });
        }
        lLog_App("ConnectionManager started");
        handleCredential(m_credentials.currentCredential());
    });
}

void ConnectionManager::stop(std::function<void()> done) {
    net::post(m_strand, [this, done = std::move(done)]() {
        m_credentialSub.reset();
        m_stopped = true;
        doDisconnect(ConnectionStatus::Closed);
        lLog_App("ConnectionManager stopped");
        if (done) done();
    });
}

void ConnectionManager::connectToServer() {
    net::post(m_strand, [this]() { doConnect(); });
}

void ConnectionManager::disconnectFromServer() {
    net::post(m_strand, [this]() { doDisconnect(ConnectionStatus::Disconnected); });
}

void ConnectionManager::setFilter(std::optional<std::string> ownerId) {
    net::post(m_strand, [this, owner = std::move(ownerId)]() mutable {
        lLog_App("Download filter:" << (owner ? QString::fromStdString(*owner) : QStringLiteral("<all>")));
        m_subscriptions.setFilter(std::move(owner));
    });
}

Projection ConnectionManager::projection() const {
    std::lock_guard<std::mutex> lock(m_publishMutex);
    return *m_published;
}

std::shared_ptr<const Projection> ConnectionManager::projectionSnapshot() const {
    std::lock_guard<std::mutex> lock(m_publishMutex);
    return m_published;
}

// ---------------------------------------------------------------------------
// Connection lifecycle
// ---------------------------------------------------------------------------

void ConnectionManager::doConnect() {
    if (m_stopped) return;

    const auto token = m_credentials.currentCredential();
    if (!token) return;

    // Single-flight guard
    const auto s = m_status.load();
    if (m_connectInFlight || s == ConnectionStatus::Connecting || s == ConnectionStatus::Connected) {
        return;
    }

    // A direct connect supersedes any pending timer
    cancelReconnect();

    Endpoint endpoint;
    try {
        endpoint = m_endpointFor(*token);
    } catch (const std::exception& e) {
        emitError(QString("Cannot build endpoint: %1").arg(QString::fromUtf8(e.what())));
        setStatus(ConnectionStatus::Error);
        return;
    }

    auto transport = m_makeTransport ? m_makeTransport() : nullptr;
    if (!transport) {
        emitError("No transport available");
        setStatus(ConnectionStatus::Error);
        return;
    }

    const uint64_t gen = ++m_connGeneration;
    m_connectInFlight = true;
    setStatus(ConnectionStatus::Connecting);

    transport->onStatus([this, gen](bool up) {
        net::post(m_strand, [this, gen, up]() {
            if (up) handleOpen(gen);
            else    handleDown(gen);
        });
    });
    transport->onError([this, gen](std::string err) {
        net::post(m_strand, [this, gen, e = std::move(err)]() { handleTransportError(gen, e); });
    });
    transport->onMessage([this, gen](std::string frame) {
        net::post(m_strand, [this, gen, f = std::move(frame)]() { handleFrame(gen, f); });
    });

    m_transport = std::move(transport);
    lLog_App("Connecting to" << QString::fromStdString(describeEndpoint(endpoint)));
    m_transport->connect(endpoint);
}

void ConnectionManager::doDisconnect(ConnectionStatus settleIn) {
    // Timer first, so nothing can reconnect once the transport is gone
    cancelReconnect();
    ++m_connGeneration;
    m_connectInFlight = false;
    m_attempt.store(0);
    m_subscriptions.onDisconnected();
    releaseTransport();
    if (m_store.clear()) {
        publishProjection();
    }
    setStatus(settleIn);
}

void ConnectionManager::handleCredential(const std::optional<std::string>& token) {
    if (m_stopped) return;
    // Notifications can arrive out of order; the source's current value wins
    const bool present = m_credentials.currentCredential().has_value();
    if (present != token.has_value()) {
        lLog_Debug("Ignoring stale credential notification");
    }
    if (present) {
        doConnect();
    } else {
        lLog_App("Credential unavailable; tearing down telemetry connection");
        doDisconnect(ConnectionStatus::Disconnected);
    }
}

void ConnectionManager::handleOpen(uint64_t generation) {
    if (generation != m_connGeneration) return;
    m_connectInFlight = false;
    m_attempt.store(0);
    setStatus(ConnectionStatus::Connected);
    // Re-assert the filter on every fresh connection
    m_subscriptions.onConnected();
}

void ConnectionManager::handleDown(uint64_t generation) {
    if (generation != m_connGeneration) return;
    ++m_connGeneration;   // late callbacks from the dead transport are ignored
    m_connectInFlight = false;
    m_subscriptions.onDisconnected();
    releaseTransport();

    // The projection is kept across a transient drop; observers decide how to show staleness
    setStatus(m_status.load() == ConnectionStatus::Error ? ConnectionStatus::Error
                                                         : ConnectionStatus::Disconnected);

    if (!m_stopped && m_credentials.currentCredential()) {
        scheduleReconnect();
    }
}

void ConnectionManager::handleTransportError(uint64_t generation, const std::string& message) {
    if (generation != m_connGeneration) return;
    lLog_Warning("Telemetry transport error:" << QString::fromStdString(message));
    emitError(QString::fromStdString(message));
    setStatus(ConnectionStatus::Error);
}

void ConnectionManager::handleFrame(uint64_t generation, const std::string& frame) {
    if (generation != m_connGeneration) return;

    auto result = MessageCodec::decodeEvent(frame);
    if (!result) {
        // Bad frame: drop it, keep the connection
        lLog_Warning("Dropping undecodable telemetry frame:" << QString::fromStdString(result.error));
        return;
    }

    const TelemetryEvent& event = *result.event;
    lLog_Data("Telemetry event" << eventName(event));
    emit eventDecoded(QString::fromLatin1(eventName(event)));
    logInformational(event);

    if (m_store.apply(event)) {
        publishProjection();
    }
}

void ConnectionManager::logInformational(const TelemetryEvent& event) {
    std::visit([this](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, SnapshotEvent>) {
            lLog_DataN(1, "Snapshot with" << ev.downloads.size() << "active downloads");
        } else if constexpr (std::is_same_v<T, ServerErrorEvent>) {
            lLog_Warning("Server error" << QString::fromStdString(ev.code) << QString::fromStdString(ev.message));
            emitError(QString("Server error %1: %2").arg(QString::fromStdString(ev.code),
                                                         QString::fromStdString(ev.message)));
        } else if constexpr (std::is_same_v<T, RejectedEvent>) {
            lLog_Warning("Download rejected for" << QString::fromStdString(ev.ownerId)
                         << QString::fromStdString(ev.reason) << "retry after" << ev.retryAfterSecs << "s");
            emitError(QString("Download rejected for %1: %2").arg(QString::fromStdString(ev.ownerId),
                                                                  QString::fromStdString(ev.reason)));
        } else if constexpr (std::is_same_v<T, FailedEvent>) {
            lLog_DataN(1, "Download" << QString::fromStdString(ev.id) << "failed:"
                       << QString::fromStdString(ev.error) << (ev.recoverable ? "(recoverable)" : ""));
        } else if constexpr (std::is_same_v<T, UnitCompletedEvent>) {
            lLog_Data("Segment" << ev.segmentIndex << "of" << QString::fromStdString(ev.id) << "completed");
        }
    }, event);
}

// ---------------------------------------------------------------------------
// Reconnect scheduling
// ---------------------------------------------------------------------------

void ConnectionManager::scheduleReconnect() {
    if (m_timerPending.load()) return;   // exactly one timer outstanding

    const uint32_t attempt = m_attempt.load();
    const auto delay = m_policy.delayFor(attempt);
    m_attempt.store(attempt + 1);

    const uint64_t gen = ++m_timerGeneration;
    m_timerPending.store(true);

    lLog_App("Scheduling reconnect in" << delay.count() << "ms (attempt" << attempt + 1 << ")");
    emit reconnectScheduled(static_cast<qint64>(delay.count()), static_cast<int>(attempt));

    m_reconnectTimer.expires_after(delay);
    m_reconnectTimer.async_wait([this, gen](const boost::system::error_code& ec) {
        // A cancelled or superseded timer must never resurrect the connection
        if (ec || gen != m_timerGeneration || !m_timerPending.load()) return;
        m_timerPending.store(false);
        lLog_App("Attempting reconnection...");
        doConnect();
    });
}

void ConnectionManager::cancelReconnect() {
    ++m_timerGeneration;
    if (m_timerPending.exchange(false)) {
        m_reconnectTimer.cancel();
    }
}

void ConnectionManager::releaseTransport() {
    if (!m_transport) return;
    auto transport = std::move(m_transport);
    transport->close();
}

void ConnectionManager::sendFrame(std::string frame) {
    if (!m_transport) return;
    m_transport->send(std::move(frame));
}

// ---------------------------------------------------------------------------
// Publication
// ---------------------------------------------------------------------------

void ConnectionManager::setStatus(ConnectionStatus s) {
    if (m_status.exchange(s) == s) return;
    lLog_App("Telemetry connection" << toString(s));
    emit statusChanged(s);
}

void ConnectionManager::publishProjection() {
    auto snapshot = std::make_shared<const Projection>(m_store.projection());
    {
        std::lock_guard<std::mutex> lock(m_publishMutex);
        m_published = std::move(snapshot);
    }
    emit projectionChanged();
}

void ConnectionManager::emitError(const QString& message) {
    emit errorOccurred(message);
}

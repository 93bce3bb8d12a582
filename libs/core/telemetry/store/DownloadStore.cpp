#include "DownloadStore.hpp"
#include "LookoutLogging.hpp"
#include <type_traits>

bool DownloadStore::applySnapshot(const std::vector<DownloadEntity>& downloads) {
    Projection next;
    for (const auto& d : downloads) {
        if (isTerminal(d.status)) continue;
        next.upsert(d);
    }
    if (next == m_projection) return false;
    m_projection = std::move(next);
    return true;
}

bool DownloadStore::applyCreated(const CreatedEvent& created) {
    DownloadEntity e;
    e.id         = created.id;
    e.ownerId    = created.ownerId;
    e.sessionId  = created.sessionId;
    e.engineType = created.engineType;
    e.status     = DownloadStatus::Starting;
    e.startedAt  = created.startedAt;
    m_projection.upsert(std::move(e));
    return true;
}

bool DownloadStore::applyMetricsUpdated(const MetricsUpdatedEvent& update) {
    DownloadEntity* e = m_projection.find(update.id);
    if (!e) {
        lLog_Debug("Discarding metrics for unknown download" << QString::fromStdString(update.id));
        return false;
    }
    e->metrics = update.metrics;
    if (update.status && !isTerminal(*update.status)) {
        e->status = *update.status;
    }
    return true;
}

bool DownloadStore::applyTerminal(const std::string& id) {
    return m_projection.erase(id);
}

bool DownloadStore::clear() {
    if (m_projection.empty()) return false;
    m_projection.clear();
    return true;
}

bool DownloadStore::apply(const TelemetryEvent& event) {
    return std::visit([this](const auto& ev) -> bool {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, SnapshotEvent>) {
            return applySnapshot(ev.downloads);
        } else if constexpr (std::is_same_v<T, CreatedEvent>) {
            return applyCreated(ev);
        } else if constexpr (std::is_same_v<T, MetricsUpdatedEvent>) {
            return applyMetricsUpdated(ev);
        } else if constexpr (std::is_same_v<T, CompletedEvent>
                          || std::is_same_v<T, FailedEvent>
                          || std::is_same_v<T, CancelledEvent>) {
            return applyTerminal(ev.id);
        } else {
            return false;
        }
    }, event);
}

Projection DownloadStore::fold(Projection current, const TelemetryEvent& event) {
    DownloadStore store(std::move(current));
    store.apply(event);
    return std::move(store.m_projection);
}

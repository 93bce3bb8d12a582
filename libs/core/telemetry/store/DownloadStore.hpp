/*
Lookout — DownloadStore
Role: Authoritative client-side projection of active downloads.
Inputs/Outputs: Decoded TelemetryEvents in; the resulting Projection out.
Threading: Single writer. ConnectionManager applies events from its strand only; no locking here.
Performance: O(1) lookup by id; erase is O(n) to keep insertion order.
Integration: Owned by ConnectionManager; one store per logical session.
Observability: Debug-level logging of discarded updates.
Related: DownloadStore.cpp, Projection.hpp, TelemetryEvents.hpp.
Assumptions: Events arrive in server order on one connection.
*/
#pragma once
#include <vector>
#include "Projection.hpp"
#include "telemetry/codec/TelemetryEvents.hpp"

class DownloadStore {
public:
    DownloadStore() = default;
    explicit DownloadStore(Projection initial) : m_projection(std::move(initial)) {}

    const Projection& projection() const { return m_projection; }

    // Every apply* returns true when the projection changed.

    /// Replace the projection wholesale. Order follows the snapshot; entries
    /// already in a terminal state are not retained.
    bool applySnapshot(const std::vector<DownloadEntity>& downloads);

    /// Insert a freshly started download (status Starting, zero metrics).
    /// An existing entry with the same id is overwritten in place.
    bool applyCreated(const CreatedEvent& created);

    /// Merge metrics into a known download. Identity fields are untouched.
    /// Updates for unknown ids are discarded.
    bool applyMetricsUpdated(const MetricsUpdatedEvent& update);

    /// Completed / Failed / Cancelled. Removing an unknown id is a no-op.
    bool applyTerminal(const std::string& id);

    bool clear();

    /// Dispatch on the event alternative. Informational events return false.
    bool apply(const TelemetryEvent& event);

    /// Pure fold step: (old projection, event) → new projection.
    static Projection fold(Projection current, const TelemetryEvent& event);

private:
    Projection m_projection;
};

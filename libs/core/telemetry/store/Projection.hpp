#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "telemetry/model/DownloadEntity.hpp"

// Insertion-ordered id → DownloadEntity map. Value type; copies are cheap
// enough to publish a fresh one to observers after every change.
class Projection {
public:
    using const_iterator = std::vector<DownloadEntity>::const_iterator;

    const DownloadEntity* find(const std::string& id) const;
    DownloadEntity* find(const std::string& id);
    bool contains(const std::string& id) const { return m_index.count(id) != 0; }

    // Overwrites in place when the id is known, appends otherwise.
    void upsert(DownloadEntity entity);
    // Returns false if the id was not present.
    bool erase(const std::string& id);
    void clear();

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }
    const std::vector<DownloadEntity>& entries() const { return m_entries; }
    std::vector<std::string> ids() const;

    bool operator==(const Projection& other) const { return m_entries == other.m_entries; }

private:
    std::vector<DownloadEntity> m_entries;
    std::unordered_map<std::string, size_t> m_index;   // id → position in m_entries

    void reindexFrom(size_t pos);
};

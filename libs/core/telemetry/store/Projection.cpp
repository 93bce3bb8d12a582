#include "Projection.hpp"

const DownloadEntity* Projection::find(const std::string& id) const {
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : &m_entries[it->second];
}

DownloadEntity* Projection::find(const std::string& id) {
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : &m_entries[it->second];
}

void Projection::upsert(DownloadEntity entity) {
    auto it = m_index.find(entity.id);
    if (it != m_index.end()) {
        m_entries[it->second] = std::move(entity);
        return;
    }
    m_index.emplace(entity.id, m_entries.size());
    m_entries.emplace_back(std::move(entity));
}

bool Projection::erase(const std::string& id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) return false;
    const size_t pos = it->second;
    m_index.erase(it);
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(pos));
    reindexFrom(pos);
    return true;
}

void Projection::clear() {
    m_entries.clear();
    m_index.clear();
}

std::vector<std::string> Projection::ids() const {
    std::vector<std::string> out;
    out.reserve(m_entries.size());
    for (const auto& e : m_entries) out.push_back(e.id);
    return out;
}

void Projection::reindexFrom(size_t pos) {
    for (size_t i = pos; i < m_entries.size(); ++i) {
        m_index[m_entries[i].id] = i;
    }
}

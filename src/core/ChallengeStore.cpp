#include "ChallengeStore.hpp"

void CChallengeStore::put(const std::string& id, SPuzzleRecord record) {
    std::lock_guard<std::mutex> lg(m_mutex);
    m_records.insert_or_assign(id, std::move(record));
}

std::optional<SPuzzleRecord> CChallengeStore::takeAndRemove(const std::string& id) {
    std::lock_guard<std::mutex> lg(m_mutex);

    auto                        it = m_records.find(id);
    if (it == m_records.end())
        return std::nullopt;

    SPuzzleRecord record = std::move(it->second);
    m_records.erase(it);

    return record;
}

std::optional<SPuzzleRecord> CChallengeStore::peek(const std::string& id) const {
    std::lock_guard<std::mutex> lg(m_mutex);

    const auto                  it = m_records.find(id);
    if (it == m_records.end())
        return std::nullopt;

    return it->second;
}

size_t CChallengeStore::reapExpired(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lg(m_mutex);
    return std::erase_if(m_records, [now](const auto& r) { return r.second.pow.expiresAt < now; });
}

size_t CChallengeStore::size() const {
    std::lock_guard<std::mutex> lg(m_mutex);
    return m_records.size();
}

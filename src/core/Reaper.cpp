#include "Reaper.hpp"
#include "ChallengeStore.hpp"

#include "../debug/log.hpp"

CStoreReaper::CStoreReaper(CChallengeStore& store, std::chrono::seconds interval) : m_store(store), m_interval(interval) {
    m_thread = std::thread([this]() { runLoop(); });
}

CStoreReaper::~CStoreReaper() {
    stop();
}

void CStoreReaper::stop() {
    {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_stopping = true;
    }

    m_cv.notify_all();

    if (m_thread.joinable())
        m_thread.join();
}

size_t CStoreReaper::totalReaped() const {
    return m_totalReaped.load();
}

void CStoreReaper::runLoop() {
    Debug::log(TRACE, "CStoreReaper: started, interval {}s", m_interval.count());

    std::unique_lock<std::mutex> lk(m_mutex);
    while (!m_stopping) {
        if (m_cv.wait_for(lk, m_interval, [this] { return m_stopping; }))
            break;

        lk.unlock();

        const auto REAPED = m_store.reapExpired();
        m_totalReaped += REAPED;

        if (REAPED > 0)
            Debug::log(LOG, "Reaped {} expired challenges, {} pending", REAPED, m_store.size());

        lk.lock();
    }

    Debug::log(TRACE, "CStoreReaper: stopped");
}

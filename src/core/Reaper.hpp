#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <atomic>

class CChallengeStore;

// Sweeps expired puzzles off a store on a fixed interval, on its own thread.
class CStoreReaper {
  public:
    CStoreReaper(CChallengeStore& store, std::chrono::seconds interval);
    ~CStoreReaper();

    void   stop();
    size_t totalReaped() const;

  private:
    void                    runLoop();

    CChallengeStore&        m_store;
    std::chrono::seconds    m_interval;

    std::mutex              m_mutex;
    std::condition_variable m_cv;
    bool                    m_stopping = false;
    std::atomic<size_t>     m_totalReaped = 0;

    std::thread             m_thread;
};

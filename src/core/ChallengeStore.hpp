#pragma once

#include <string>
#include <set>
#include <mutex>
#include <chrono>
#include <optional>
#include <unordered_map>

#include "Pow.hpp"

struct SPuzzleRecord {
    std::set<std::string> correctIds;
    SPowChallenge         pow;
};

// Pending puzzles. Every operation holds m_mutex for its whole duration.
class CChallengeStore {
  public:
    void                         put(const std::string& id, SPuzzleRecord record);

    // lookup and erase in one critical section: only one caller can ever get a record
    std::optional<SPuzzleRecord> takeAndRemove(const std::string& id);
    std::optional<SPuzzleRecord> peek(const std::string& id) const;

    // drops records whose pow expired before `now`, returns how many were dropped
    size_t                       reapExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    size_t                       size() const;

  private:
    mutable std::mutex                             m_mutex;
    std::unordered_map<std::string, SPuzzleRecord> m_records;
};

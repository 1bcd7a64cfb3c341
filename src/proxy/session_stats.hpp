#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mirage::proxy {

/// Point-in-time copy of the proxy counters
struct StatisticsSnapshot {
    std::uint64_t record_count = 0;
    std::uint64_t playback_hits = 0;
    std::uint64_t playback_misses = 0;
};

/// Process-lifetime counters, monotonically increasing
class Statistics {
public:
    void increment_record();
    void increment_hit();
    void increment_miss();

    [[nodiscard]] StatisticsSnapshot snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    StatisticsSnapshot counters_;
};

/// Summary of one proxied request
struct HistoryEntry {
    Fingerprint id;
    WallTime timestamp;
    std::string method;
    std::string url;
    std::string target;
    int status = 0;
    DurationMs duration_ms = 0;
    bool saved = false;  // true when the call stored a new recording
};

/// Bounded most-recent-first request log
class RequestHistory {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit RequestHistory(std::size_t capacity = kDefaultCapacity);

    /// Insert at the front, evicting the oldest entry beyond capacity
    void add(HistoryEntry entry);

    /// Copy of all entries, newest first
    [[nodiscard]] std::vector<HistoryEntry> snapshot() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

private:
    std::size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::deque<HistoryEntry> entries_;
};

}  // namespace mirage::proxy

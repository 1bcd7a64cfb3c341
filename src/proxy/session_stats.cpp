#include "proxy/session_stats.hpp"
#include <mutex>

namespace mirage::proxy {

// ============================================================================
// Statistics
// ============================================================================

void Statistics::increment_record() {
    std::unique_lock lock(mutex_);
    ++counters_.record_count;
}

void Statistics::increment_hit() {
    std::unique_lock lock(mutex_);
    ++counters_.playback_hits;
}

void Statistics::increment_miss() {
    std::unique_lock lock(mutex_);
    ++counters_.playback_misses;
}

StatisticsSnapshot Statistics::snapshot() const {
    std::shared_lock lock(mutex_);
    return counters_;
}

// ============================================================================
// RequestHistory
// ============================================================================

RequestHistory::RequestHistory(std::size_t capacity)
    : capacity_(capacity)
{}

void RequestHistory::add(HistoryEntry entry) {
    std::unique_lock lock(mutex_);
    entries_.push_front(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_back();
    }
}

std::vector<HistoryEntry> RequestHistory::snapshot() const {
    std::shared_lock lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

std::size_t RequestHistory::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace mirage::proxy

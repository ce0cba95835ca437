#pragma once
// Single Responsibility: First-seen bookkeeping per fingerprint

#include "ClipboardItem.hpp"
#include <chrono>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace clipexpire {

class ExpiryStore {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    // Record first-seen time if absent. Returns true for a new fingerprint;
    // an existing record keeps its original timestamp.
    bool observe(Fingerprint fp, TimePoint now);

    std::optional<Duration> ageOf(Fingerprint fp, TimePoint now) const;

    void drop(Fingerprint fp);

    // Forget every fingerprint missing from the live history. Returns how many
    // records were dropped.
    std::size_t reconcile(const std::unordered_set<Fingerprint>& live);

    bool contains(Fingerprint fp) const { return m_firstSeen.count(fp) != 0; }
    std::size_t size() const { return m_firstSeen.size(); }
    bool empty() const { return m_firstSeen.empty(); }

private:
    std::unordered_map<Fingerprint, TimePoint> m_firstSeen;
};

} // namespace clipexpire

#pragma once
// Single Responsibility: One reconciliation pass (fetch -> deny -> age -> reconcile)

#include "Forward.hpp"
#include "Config.hpp"
#include "ExpiryStore.hpp"
#include "PatternFilter.hpp"
#include <chrono>
#include <cstdint>

namespace clipexpire {

enum class TickOutcome {
    Completed,
    Skipped,   // Previous tick still running
    Aborted    // Gateway failed; retried next tick
};

struct TickReport {
    TickOutcome outcome = TickOutcome::Completed;
    std::size_t liveItems = 0;
    std::size_t newlyTracked = 0;
    std::size_t deniedRemoved = 0;
    std::size_t expiredRemoved = 0;
    std::size_t reconciled = 0;

    std::size_t removals() const { return deniedRemoved + expiredRemoved; }
};

struct SchedulerStats {
    std::uint64_t ticks = 0;
    std::uint64_t skipped = 0;
    std::uint64_t aborted = 0;
    std::uint64_t deniedRemoved = 0;
    std::uint64_t expiredRemoved = 0;
};

// Owns the expiry store and the tick state. Not thread-safe: every tick must
// come from the same thread (the main loop).
class Scheduler {
public:
    enum class State { Idle, Ticking };

    Scheduler(const ResolvedConfig& config, PatternFilterPtr filter, ClipboardGateway& gateway);

    TickReport tick(ExpiryStore::TimePoint now);
    TickReport tick() { return tick(ExpiryStore::Clock::now()); }

    State state() const { return m_state; }
    const SchedulerStats& stats() const { return m_stats; }
    const ExpiryStore& store() const { return m_store; }
    ExpiryStore::TimePoint lastTick() const { return m_lastTick; }
    std::chrono::seconds itemExpiry() const { return m_itemExpiry; }

private:
    std::chrono::seconds m_itemExpiry;
    PatternFilterPtr m_filter;
    ClipboardGateway& m_gateway;
    ExpiryStore m_store;

    State m_state = State::Idle;
    SchedulerStats m_stats;
    ExpiryStore::TimePoint m_lastTick{};

    void runTick(ExpiryStore::TimePoint now, TickReport& report);
};

const char* toString(TickOutcome outcome);

} // namespace clipexpire

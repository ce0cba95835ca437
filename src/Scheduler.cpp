// Single Responsibility: One reconciliation pass over the clipboard history
//
// Order inside a tick is fixed: deny check, then age check, then reconcile.
// A newly seen denied item is therefore never recorded and later aged out.
// Both checks feed a single removal batch, so the manager sees at most one
// rewrite per tick.

#include "clipexpire/Scheduler.hpp"
#include "clipexpire/ClipboardGateway.hpp"
#include "clipexpire/Errors.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace clipexpire {

namespace {

// Resets the scheduler to Idle however the tick ends
class TickGuard {
public:
    explicit TickGuard(Scheduler::State& state) : m_state(state) { m_state = Scheduler::State::Ticking; }
    ~TickGuard() { m_state = Scheduler::State::Idle; }

    TickGuard(const TickGuard&) = delete;
    TickGuard& operator=(const TickGuard&) = delete;

private:
    Scheduler::State& m_state;
};

struct PendingRemoval {
    Fingerprint fp;
    bool expired;               // false: denied on sight
    std::chrono::seconds age;
};

} // namespace

const char* toString(TickOutcome outcome) {
    switch (outcome) {
        case TickOutcome::Completed: return "completed";
        case TickOutcome::Skipped: return "skipped";
        case TickOutcome::Aborted: return "aborted";
    }
    return "unknown";
}

Scheduler::Scheduler(const ResolvedConfig& config, PatternFilterPtr filter, ClipboardGateway& gateway)
    : m_itemExpiry(config.itemExpiry),
      m_filter(std::move(filter)),
      m_gateway(gateway) {
}

TickReport Scheduler::tick(ExpiryStore::TimePoint now) {
    TickReport report;

    if (m_state == State::Ticking) {
        ++m_stats.skipped;
        spdlog::debug("previous tick still running, skipping (skipped {} so far)", m_stats.skipped);
        report.outcome = TickOutcome::Skipped;
        return report;
    }

    TickGuard guard(m_state);
    ++m_stats.ticks;

    try {
        runTick(now, report);
    } catch (const GatewayError& e) {
        ++m_stats.aborted;
        spdlog::warn("clipboard sync failed, retrying next tick: {}", e.what());
        report.outcome = TickOutcome::Aborted;
    }

    m_stats.deniedRemoved += report.deniedRemoved;
    m_stats.expiredRemoved += report.expiredRemoved;
    m_lastTick = now;
    return report;
}

void Scheduler::runTick(ExpiryStore::TimePoint now, TickReport& report) {
    std::vector<ClipboardItem> live = m_gateway.listHistory();
    report.liveItems = live.size();

    // Duplicated content collapses to one fingerprint; keep the newest copy
    std::unordered_set<Fingerprint> liveFingerprints;
    std::vector<std::pair<Fingerprint, const ClipboardItem*>> unique;
    unique.reserve(live.size());
    for (const auto& item : live) {
        Fingerprint fp = fingerprintOf(item);
        if (liveFingerprints.insert(fp).second) {
            unique.emplace_back(fp, &item);
        }
    }

    // Removals are collected and sent as one batch after both checks
    std::vector<ClipboardItem> removals;
    std::vector<PendingRemoval> pending;   // parallel to removals

    // 1. New items: deny removes on sight, everything else starts its clock
    std::vector<Fingerprint> observed;
    for (const auto& [fp, item] : unique) {
        if (m_store.contains(fp)) continue;

        Classification cls = m_filter->classify(item->content);
        if (cls == Classification::Deny) {
            removals.push_back(*item);
            pending.push_back({fp, false, std::chrono::seconds::zero()});
            continue;
        }

        observed.push_back(fp);
        spdlog::debug("tracking clipboard entry {:016x} ({})", fp, toString(cls));
    }

    // 2. Tracked, unprotected items past the expiry window. Compared in whole
    // seconds so a window near the clock's range cannot overflow.
    for (const auto& [fp, item] : unique) {
        auto age = m_store.ageOf(fp, now);
        if (!age) continue;
        auto ageSeconds = std::chrono::duration_cast<std::chrono::seconds>(*age);
        if (ageSeconds < m_itemExpiry) continue;
        if (m_filter->classify(item->content) != Classification::Neutral) continue;

        removals.push_back(*item);
        pending.push_back({fp, true, ageSeconds});
    }

    // Nothing is recorded or forgotten until the batch went through
    std::vector<RemoveResult> results;
    if (!removals.empty()) {
        results = m_gateway.remove(removals);
        if (results.size() != removals.size()) {
            throw GatewayError("clipboard manager answered " + std::to_string(results.size()) +
                               " results for " + std::to_string(removals.size()) + " removals");
        }
    }

    for (Fingerprint fp : observed) {
        m_store.observe(fp, now);
        ++report.newlyTracked;
    }

    for (std::size_t i = 0; i < removals.size(); i++) {
        const PendingRemoval& removal = pending[i];
        const char* note = results[i] == RemoveResult::NotFound ? " (already gone)" : "";
        if (removal.expired) {
            m_store.drop(removal.fp);
            ++report.expiredRemoved;
            spdlog::info("expired clipboard entry {:016x} after {}s{}", removal.fp, removal.age.count(), note);
        } else {
            ++report.deniedRemoved;
            spdlog::info("removed denied clipboard entry {:016x}{}", removal.fp, note);
        }
    }

    // 3. Entries the manager evicted on its own: forget them, no removal call
    report.reconciled = m_store.reconcile(liveFingerprints);
    if (report.reconciled > 0) {
        spdlog::debug("forgot {} entries evicted by the clipboard manager", report.reconciled);
    }

    spdlog::trace("tick: {} live, {} tracked, {} new, {} denied, {} expired",
                  report.liveItems, m_store.size(), report.newlyTracked,
                  report.deniedRemoved, report.expiredRemoved);
}

} // namespace clipexpire

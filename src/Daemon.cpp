// GLib main loop driving the scheduler.
// Timer ticks and Klipper notifications both end up in Scheduler::tick on
// this thread, so the expiry store only ever has one writer.

#include "clipexpire/Daemon.hpp"
#include "clipexpire/ClipboardGateway.hpp"
#include "clipexpire/Scheduler.hpp"
#include <glib-unix.h>
#include <spdlog/spdlog.h>
#include <csignal>

namespace clipexpire {

Daemon::Daemon(Scheduler& scheduler, ClipboardGateway& gateway, std::chrono::seconds interval)
    : m_scheduler(scheduler),
      m_gateway(gateway),
      m_interval(interval),
      m_mainLoop(g_main_loop_new(nullptr, FALSE)) {
}

Daemon::~Daemon() {
    m_gateway.unsubscribeHistoryChanged();

    for (guint source : {m_timerSource, m_pendingSource, m_sigintSource, m_sigtermSource}) {
        if (source != 0) g_source_remove(source);
    }
    g_main_loop_unref(m_mainLoop);
}

void Daemon::start() {
    spdlog::info("starting clipboard expiry daemon (expiry {}s, interval {}s)",
                 m_scheduler.itemExpiry().count(), m_interval.count());

    if (!m_gateway.subscribeHistoryChanged([this]() { scheduleNotifiedTick(); })) {
        spdlog::warn("failed to subscribe to clipboard notifications; falling back to polling only");
    }

    m_sigintSource = g_unix_signal_add(SIGINT, onShutdownSignal, this);
    m_sigtermSource = g_unix_signal_add(SIGTERM, onShutdownSignal, this);

    runTick("startup");
    m_timerSource = g_timeout_add_seconds(static_cast<guint>(m_interval.count()), onTimer, this);
}

void Daemon::run() {
    start();
    g_main_loop_run(m_mainLoop);

    const auto& stats = m_scheduler.stats();
    spdlog::info("stopped after {} ticks ({} skipped, {} aborted), removed {} denied and {} expired entries",
                 stats.ticks, stats.skipped, stats.aborted, stats.deniedRemoved, stats.expiredRemoved);
}

void Daemon::quit() {
    g_main_loop_quit(m_mainLoop);
}

void Daemon::runTick(const char* trigger) {
    TickReport report = m_scheduler.tick();
    spdlog::debug("{} tick {}: {} live, {} removed, {} tracked", trigger, toString(report.outcome),
                  report.liveItems, report.removals(), m_scheduler.store().size());
}

// Bursts of notifications collapse into one pending idle tick
void Daemon::scheduleNotifiedTick() {
    if (m_pendingSource == 0) {
        m_pendingSource = g_idle_add(onNotified, this);
    }
}

gboolean Daemon::onTimer(gpointer data) {
    static_cast<Daemon*>(data)->runTick("timer");
    return G_SOURCE_CONTINUE;
}

gboolean Daemon::onNotified(gpointer data) {
    auto* self = static_cast<Daemon*>(data);
    self->m_pendingSource = 0;
    self->runTick("notification");
    return G_SOURCE_REMOVE;
}

gboolean Daemon::onShutdownSignal(gpointer data) {
    spdlog::info("shutting down on signal");
    static_cast<Daemon*>(data)->quit();
    return G_SOURCE_CONTINUE;
}

} // namespace clipexpire

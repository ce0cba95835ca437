#pragma once
// Single Responsibility: GLib main loop driving the scheduler

#include "Forward.hpp"
#include <glib.h>
#include <chrono>

namespace clipexpire {

class Daemon {
public:
    Daemon(Scheduler& scheduler, ClipboardGateway& gateway, std::chrono::seconds interval);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // Subscribe, install the timer and signal handlers and run the startup
    // tick. Sources attach to the default main context.
    void start();

    // start(), then block until SIGINT/SIGTERM or quit()
    void run();
    void quit();

private:
    Scheduler& m_scheduler;
    ClipboardGateway& m_gateway;
    std::chrono::seconds m_interval;

    GMainLoop* m_mainLoop = nullptr;
    guint m_timerSource = 0;
    guint m_pendingSource = 0;   // Coalesced notification tick
    guint m_sigintSource = 0;
    guint m_sigtermSource = 0;

    void runTick(const char* trigger);
    void scheduleNotifiedTick();

    static gboolean onTimer(gpointer data);
    static gboolean onNotified(gpointer data);
    static gboolean onShutdownSignal(gpointer data);
};

} // namespace clipexpire

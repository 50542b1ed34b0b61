#pragma once

#include <memory>

#include <QObject>

#include "common/enums.hpp"
#include "daemon/daemon_options.hpp"
#include "daemon/watch_registry.hpp"
#include "daemon/worker_tracker.hpp"

namespace inreact {

class ConfigReconciler;
class EventDispatcher;
class InotifySource;
class ProcessExecutor;
class ReactionDispatcher;
class SignalBridge;
class WatchManager;

/**
 * InreactDaemon wires the daemon together:
 * - inotify source and process executor (the OS-facing seams)
 * - registry, worker tracker and the watch manager that owns them
 * - configuration reconciler for the root configuration and companions
 * - dispatcher and signal bridge feeding everything through Qt's event loop
 *
 * It is owned from main() and lives for the lifetime of the process.
 */
class InreactDaemon : public QObject
{
    Q_OBJECT
public:
    explicit InreactDaemon(DaemonOptions options, QObject *parent = nullptr);
    ~InreactDaemon() override;

    // Returns false when the notification facility is unavailable.
    bool start();

private:
    void handleIntent(ControlIntent intent);
    void bootstrapCompanions();
    void reload();
    void dumpState();
    void restart();

    DaemonOptions m_options;
    WatchRegistry m_registry;
    WorkerTracker m_workers;
    std::unique_ptr<InotifySource> m_source;
    std::unique_ptr<ProcessExecutor> m_executor;
    std::unique_ptr<ReactionDispatcher> m_reactions;
    std::unique_ptr<WatchManager> m_manager;
    std::unique_ptr<ConfigReconciler> m_reconciler;
    std::unique_ptr<EventDispatcher> m_dispatcher;
    std::unique_ptr<SignalBridge> m_signals;
};

} // namespace inreact

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/anomaly_handler.hpp"
#include "daemon/notification_source.hpp"
#include "daemon/reaction_dispatcher.hpp"
#include "daemon/watch_registry.hpp"
#include "daemon/worker_tracker.hpp"

namespace inreact {

struct WatchPolicy {
    // How long a missing path may take to reappear before giving up.
    int graceMs = 250;
};

/**
 * WatchManager owns the watch lifecycle of every registry entry:
 * - establishing OS watches (create-if-missing, run-if-missing, grace wait)
 * - wipe/restore: a firing entry gets the sentinel callback until its reaction
 *   completes, then the live callback back, or a fresh watch if the inode
 *   changed meanwhile
 * - reaping workers and the recovery actions the AnomalyHandler asks for
 *
 * All methods run on the dispatcher thread.
 */
class WatchManager : public AnomalyActions
{
public:
    using RestartHandler = std::function<void(const std::string &reason)>;

    WatchManager(WatchRegistry &registry,
                 NotificationSource &source,
                 ReactionDispatcher &reactions,
                 WorkerTracker &workers,
                 WatchPolicy policy = {});
    ~WatchManager() override;

    void setRestartHandler(RestartHandler handler) { m_restartHandler = std::move(handler); }

    UpsertOutcome apply(const WatchSpec &spec);
    bool remove(const std::string &path);

    // Live callback target for real events on path.
    void handleEvent(const std::string &path, const FsEvent &event);
    // Synthetic trigger: runs path's reaction as if it had fired, with args.
    bool handleDirectInvocation(const std::string &path,
                                const std::vector<std::string> &args = {});
    // Events whose handle has no callback attached (overflow, stale descriptors).
    void handleUnroutedEvent(const FsEvent &event);

    void completeWorker(WorkerId id, int exitCode);

    WatchState stateOf(const std::string &path) const;

    WatchRegistry &registry() { return m_registry; }
    const WorkerTracker &workers() const { return m_workers; }
    AnomalyHandler &anomalies() { return m_anomalies; }

    // AnomalyActions
    std::optional<std::string> pathForHandle(int handle) const override;
    bool recreateWatch(const std::string &path) override;
    void dropEntry(const std::string &path) override;
    void requestRestart(const std::string &reason) override;

private:
    void handleSuspendedEvent(const std::string &path, const FsEvent &event);

    bool establish(WatchEntry &entry, bool allowMissingReaction);
    void cancel(WatchEntry &entry);
    void releaseHandle(int handle);
    void wipe(WatchEntry &entry);
    void restore(const std::string &path, WorkerReason reason, std::uint64_t suspension);
    void runReaction(const std::string &path, WorkerReason reason,
                     const std::vector<std::string> &args);

    WatchCallback liveCallback(const std::string &path);
    WatchCallback sentinelCallback(const std::string &path);

    WatchRegistry &m_registry;
    NotificationSource &m_source;
    ReactionDispatcher &m_reactions;
    WorkerTracker &m_workers;
    WatchPolicy m_policy;
    AnomalyHandler m_anomalies;
    RestartHandler m_restartHandler;
    std::uint64_t m_lastSuspension = 0;
};

} // namespace inreact

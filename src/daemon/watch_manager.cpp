#include "daemon/watch_manager.hpp"

#include "common/fs_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace inreact {

namespace {

const QString kComponent = QStringLiteral("WatchManager");

nlohmann::json eventContext(const std::string &path, const FsEvent &event)
{
    return nlohmann::json{{"path", path},
                          {"handle", event.handle},
                          {"mask", describeMask(event.mask)},
                          {"name", event.name}};
}

QString toQString(WatchError error)
{
    switch (error) {
    case WatchError::None:
        return QStringLiteral("none");
    case WatchError::NotFound:
        return QStringLiteral("not_found");
    case WatchError::PermissionDenied:
        return QStringLiteral("permission_denied");
    case WatchError::Aliased:
        return QStringLiteral("aliased");
    case WatchError::NoSpace:
        return QStringLiteral("no_space");
    case WatchError::Other:
        return QStringLiteral("other");
    }
    return QStringLiteral("other");
}

} // namespace

WatchManager::WatchManager(WatchRegistry &registry,
                           NotificationSource &source,
                           ReactionDispatcher &reactions,
                           WorkerTracker &workers,
                           WatchPolicy policy)
    : m_registry(registry)
    , m_source(source)
    , m_reactions(reactions)
    , m_workers(workers)
    , m_policy(policy)
    , m_anomalies(*this)
{
}

WatchManager::~WatchManager() = default;

UpsertOutcome WatchManager::apply(const WatchSpec &spec)
{
    UpsertResult result = m_registry.upsert(spec);

    switch (result.outcome) {
    case UpsertOutcome::Conflict:
        IRLOG_WARN(kComponent,
                   QStringLiteral("apply"),
                   QStringLiteral("config_conflict"),
                   QStringLiteral("path_owned_by_other_source"),
                   (nlohmann::json{{"path", spec.path},
                                   {"owner", result.previous ? result.previous->sourceConfig
                                                             : std::string()},
                                   {"rejected", spec.sourceConfig},
                                   {"line", spec.lineNumber}}));
        break;
    case UpsertOutcome::Inserted:
        if (WatchEntry *entry = m_registry.get(spec.path)) {
            IRLOG_INFO(kComponent,
                       QStringLiteral("apply"),
                       QStringLiteral("watch_added"),
                       QString::fromStdString(spec.sourceConfig),
                       nlohmann::json(*entry));
            establish(*entry, true);
        }
        break;
    case UpsertOutcome::Replaced:
        if (result.previous && result.previous->watchHandle) {
            releaseHandle(*result.previous->watchHandle);
        }
        if (WatchEntry *entry = m_registry.get(spec.path)) {
            IRLOG_INFO(kComponent,
                       QStringLiteral("apply"),
                       QStringLiteral("watch_replaced"),
                       QString::fromStdString(spec.sourceConfig),
                       nlohmann::json(*entry));
            establish(*entry, true);
        }
        break;
    case UpsertOutcome::Unchanged:
        // A previously failed watch gets another attempt, but the missing-path
        // reaction only runs for new or changed entries.
        if (WatchEntry *entry = m_registry.get(spec.path)) {
            if (!entry->suspended && !entry->watchHandle) {
                establish(*entry, false);
            }
        }
        break;
    }
    return result.outcome;
}

bool WatchManager::remove(const std::string &path)
{
    std::optional<WatchEntry> removed = m_registry.remove(path);
    if (!removed) {
        return false;
    }
    if (removed->watchHandle) {
        releaseHandle(*removed->watchHandle);
    }
    IRLOG_INFO(kComponent,
               QStringLiteral("remove"),
               QStringLiteral("watch_removed"),
               QString::fromStdString(removed->sourceConfig),
               (nlohmann::json{{"path", path}}));
    return true;
}

void WatchManager::handleEvent(const std::string &path, const FsEvent &event)
{
    if (event.isErrorClass()) {
        m_anomalies.handle(event);
        return;
    }

    WatchEntry *entry = m_registry.get(path);
    if (!entry) {
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("handleEvent"),
                    QStringLiteral("event_without_entry"),
                    QString(),
                    eventContext(path, event));
        return;
    }
    if (entry->suspended) {
        handleSuspendedEvent(path, event);
        return;
    }

    logging::CorrelationScope corrScope(logging::newCorrelationId());
    IRLOG_DEBUG(kComponent,
                QStringLiteral("handleEvent"),
                QStringLiteral("event_received"),
                QString(),
                eventContext(path, event));

    if (event.isSelfGone()) {
        IRLOG_INFO(kComponent,
                   QStringLiteral("handleEvent"),
                   QStringLiteral("watch_target_gone"),
                   QString::fromStdString(describeMask(event.mask)),
                   eventContext(path, event));
        cancel(*entry);
        // On failure the missing-path reaction has already been dealt with.
        if (!establish(*entry, true)) {
            return;
        }
    }

    runReaction(path, WorkerReason::Event, {});
}

void WatchManager::handleSuspendedEvent(const std::string &path, const FsEvent &event)
{
    if (event.isErrorClass()) {
        m_anomalies.handle(event);
        return;
    }

    WatchEntry *entry = m_registry.get(path);
    if (!entry) {
        return;
    }

    if (event.isSelfGone()) {
        // The file was replaced while its reaction runs. Follow the new inode
        // right away so nothing is missed after restore; the sentinel stays.
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("handleSuspendedEvent"),
                    QStringLiteral("suspended_target_gone"),
                    QString(),
                    eventContext(path, event));
        cancel(*entry);
        establish(*entry, false);
        return;
    }

    IRLOG_DEBUG(kComponent,
                QStringLiteral("handleSuspendedEvent"),
                QStringLiteral("event_suppressed"),
                QStringLiteral("reaction_in_progress"),
                eventContext(path, event));
}

bool WatchManager::handleDirectInvocation(const std::string &path,
                                          const std::vector<std::string> &args)
{
    const WatchEntry *entry = m_registry.get(path);
    if (!entry) {
        IRLOG_WARN(kComponent,
                   QStringLiteral("handleDirectInvocation"),
                   QStringLiteral("direct_invocation_rejected"),
                   QStringLiteral("unknown_path"),
                   (nlohmann::json{{"path", path}}));
        return false;
    }
    if (entry->suspended) {
        IRLOG_INFO(kComponent,
                   QStringLiteral("handleDirectInvocation"),
                   QStringLiteral("direct_invocation_rejected"),
                   QStringLiteral("reaction_in_progress"),
                   (nlohmann::json{{"path", path}}));
        return false;
    }

    logging::CorrelationScope corrScope(logging::newCorrelationId());
    IRLOG_INFO(kComponent,
               QStringLiteral("handleDirectInvocation"),
               QStringLiteral("direct_invocation"),
               QString(),
               (nlohmann::json{{"path", path}, {"args", args}}));
    runReaction(path, WorkerReason::Direct, args);
    return true;
}

void WatchManager::handleUnroutedEvent(const FsEvent &event)
{
    if (event.isErrorClass()) {
        m_anomalies.handle(event);
        return;
    }
    IRLOG_DEBUG(kComponent,
                QStringLiteral("handleUnroutedEvent"),
                QStringLiteral("event_for_unknown_handle"),
                QString(),
                eventContext(event.path, event));
}

void WatchManager::completeWorker(WorkerId id, int exitCode)
{
    std::optional<WorkerRecord> record = m_workers.release(id);
    if (!record) {
        IRLOG_ERROR(kComponent,
                    QStringLiteral("completeWorker"),
                    QStringLiteral("unknown_worker"),
                    QStringLiteral("worker_not_tracked"),
                    (nlohmann::json{{"worker", id}, {"exitCode", exitCode}}));
        requestRestart("unknown_worker");
        return;
    }

    logging::CorrelationScope corrScope(record->correlationId);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - record->startedAt);
    const nlohmann::json ctx = {{"worker", id},
                                {"path", record->path},
                                {"reason", toWorkerReasonString(record->reason)},
                                {"exitCode", exitCode},
                                {"durationMs", elapsed.count()}};
    if (exitCode != 0) {
        IRLOG_WARN(kComponent,
                   QStringLiteral("completeWorker"),
                   QStringLiteral("worker_failed"),
                   QStringLiteral("non_zero_exit"),
                   ctx);
    } else {
        IRLOG_INFO(kComponent,
                   QStringLiteral("completeWorker"),
                   QStringLiteral("worker_finished"),
                   QString(),
                   ctx);
    }

    restore(record->path, record->reason, record->suspension);
}

WatchState WatchManager::stateOf(const std::string &path) const
{
    const WatchEntry *entry = m_registry.get(path);
    return entry ? watchStateOf(*entry) : WatchState::Unwatched;
}

std::optional<std::string> WatchManager::pathForHandle(int handle) const
{
    const WatchEntry *entry = m_registry.findByHandle(handle);
    if (!entry) {
        return std::nullopt;
    }
    return entry->path;
}

bool WatchManager::recreateWatch(const std::string &path)
{
    WatchEntry *entry = m_registry.get(path);
    if (!entry) {
        return false;
    }
    cancel(*entry);
    return establish(*entry, false);
}

void WatchManager::dropEntry(const std::string &path)
{
    remove(path);
}

void WatchManager::requestRestart(const std::string &reason)
{
    IRLOG_ERROR(kComponent,
                QStringLiteral("requestRestart"),
                QStringLiteral("restart_requested"),
                QString::fromStdString(reason),
                nlohmann::json::object());
    if (m_restartHandler) {
        m_restartHandler(reason);
    }
}

bool WatchManager::establish(WatchEntry &entry, bool allowMissingReaction)
{
    const std::string path = entry.path;

    if (!pathExists(path)) {
        if (entry.createIfMissing) {
            std::string error;
            if (!createEmptyFile(path, &error)) {
                IRLOG_WARN(kComponent,
                           QStringLiteral("establish"),
                           QStringLiteral("create_if_missing_failed"),
                           QString::fromStdString(error),
                           (nlohmann::json{{"path", path}}));
            }
        } else {
            waitForPath(path, m_policy.graceMs);
        }
    }

    if (!pathExists(path)) {
        IRLOG_WARN(kComponent,
                   QStringLiteral("establish"),
                   QStringLiteral("watch_create_failed"),
                   QStringLiteral("path_missing"),
                   (nlohmann::json{{"path", path}, {"graceMs", m_policy.graceMs}}));
        if (entry.runReactionIfMissing && allowMissingReaction && !entry.suspended) {
            // The reaction may mutate the registry; entry is not touched after this.
            runReaction(path, WorkerReason::MissingPath, {});
        }
        return false;
    }

    const WatchCallback callback = entry.suspended ? sentinelCallback(path) : liveCallback(path);
    const WatchResult result = m_source.addWatch(path, entry.mask, callback);
    if (!result.ok()) {
        IRLOG_WARN(kComponent,
                   QStringLiteral("establish"),
                   QStringLiteral("watch_create_failed"),
                   toQString(result.error),
                   (nlohmann::json{{"path", path}, {"message", result.message}}));
        return false;
    }

    entry.watchHandle = result.handle;
    entry.lastInode = inodeOf(path);
    m_anomalies.noteWatchCreated(result.handle);
    IRLOG_DEBUG(kComponent,
                QStringLiteral("establish"),
                QStringLiteral("watch_established"),
                entry.suspended ? QStringLiteral("sentinel") : QStringLiteral("live"),
                (nlohmann::json{{"path", path},
                                {"handle", result.handle},
                                {"mask", describeMask(entry.mask)}}));
    return true;
}

void WatchManager::cancel(WatchEntry &entry)
{
    if (!entry.watchHandle) {
        return;
    }
    releaseHandle(*entry.watchHandle);
    entry.watchHandle.reset();
}

void WatchManager::releaseHandle(int handle)
{
    m_source.removeWatch(handle);
    m_anomalies.noteWatchRemoved(handle);
}

void WatchManager::wipe(WatchEntry &entry)
{
    entry.suspended = true;
    entry.suspension = ++m_lastSuspension;
    if (entry.watchHandle && !m_source.replaceCallback(*entry.watchHandle,
                                                       sentinelCallback(entry.path))) {
        // The source lost the handle; restore will rebuild the watch.
        entry.watchHandle.reset();
    }
}

void WatchManager::restore(const std::string &path, WorkerReason reason,
                           std::uint64_t suspension)
{
    WatchEntry *entry = m_registry.get(path);
    if (!entry) {
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("restore"),
                    QStringLiteral("restore_skipped"),
                    QStringLiteral("entry_removed"),
                    (nlohmann::json{{"path", path}}));
        return;
    }
    if (!entry->suspended) {
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("restore"),
                    QStringLiteral("restore_skipped"),
                    QStringLiteral("not_suspended"),
                    (nlohmann::json{{"path", path}}));
        return;
    }
    if (entry->suspension != suspension) {
        // The entry was replaced and fired again; its current worker restores it.
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("restore"),
                    QStringLiteral("restore_skipped"),
                    QStringLiteral("suspension_superseded"),
                    (nlohmann::json{{"path", path}}));
        return;
    }
    entry->suspended = false;
    entry->suspension = 0;

    const auto inode = inodeOf(path);
    if (entry->watchHandle && inode && entry->lastInode && *inode == *entry->lastInode
        && m_source.replaceCallback(*entry->watchHandle, liveCallback(path))) {
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("restore"),
                    QStringLiteral("watch_restored"),
                    QString(),
                    (nlohmann::json{{"path", path}, {"handle", *entry->watchHandle}}));
        return;
    }

    IRLOG_INFO(kComponent,
               QStringLiteral("restore"),
               QStringLiteral("watch_rebuilt"),
               QStringLiteral("target_replaced_during_reaction"),
               (nlohmann::json{{"path", path},
                               {"reason", toWorkerReasonString(reason)}}));
    cancel(*entry);
    // A missing-path worker does not get to trigger itself again.
    establish(*entry, reason != WorkerReason::MissingPath);
}

void WatchManager::runReaction(const std::string &path, WorkerReason reason,
                               const std::vector<std::string> &args)
{
    WatchEntry *entry = m_registry.get(path);
    if (!entry) {
        return;
    }
    wipe(*entry);

    // Directives run inline and may replace or remove the entry.
    const WatchEntry snapshot = *entry;
    const FireResult result = m_reactions.fire(snapshot, args);

    if (result.status == FireStatus::Spawned) {
        WorkerRecord record;
        record.path = path;
        record.reason = reason;
        record.correlationId = logging::currentCorrelationId();
        record.startedAt = std::chrono::system_clock::now();
        record.suspension = snapshot.suspension;
        m_workers.track(result.worker, std::move(record));
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("runReaction"),
                    QStringLiteral("worker_started"),
                    QString::fromStdString(toWorkerReasonString(reason)),
                    (nlohmann::json{{"path", path}, {"worker", result.worker}}));
        return;
    }

    restore(path, reason, snapshot.suspension);
}

WatchCallback WatchManager::liveCallback(const std::string &path)
{
    return WatchCallback{CallbackRole::Live, [this, path](const FsEvent &event) {
        handleEvent(path, event);
    }};
}

WatchCallback WatchManager::sentinelCallback(const std::string &path)
{
    return WatchCallback{CallbackRole::Sentinel, [this, path](const FsEvent &event) {
        handleSuspendedEvent(path, event);
    }};
}

} // namespace inreact

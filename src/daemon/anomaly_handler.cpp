#include "daemon/anomaly_handler.hpp"

#include "common/logging.hpp"

namespace inreact {

std::string toAnomalyKindString(AnomalyKind kind)
{
    switch (kind) {
    case AnomalyKind::None:
        return "none";
    case AnomalyKind::QueueOverflow:
        return "queue_overflow";
    case AnomalyKind::Unmount:
        return "unmount";
    case AnomalyKind::Invalidated:
        return "invalidated";
    case AnomalyKind::StaleDelivery:
        return "stale_delivery";
    case AnomalyKind::Orphaned:
        return "orphaned";
    }
    return "none";
}

AnomalyHandler::AnomalyHandler(AnomalyActions &actions)
    : m_actions(actions)
{
}

void AnomalyHandler::noteWatchRemoved(int handle)
{
    m_lastRemoved = handle;
    m_lastReused = -1;
}

void AnomalyHandler::noteWatchCreated(int handle)
{
    if (handle >= 0 && handle == m_lastRemoved) {
        m_lastReused = handle;
    }
}

AnomalyKind AnomalyHandler::classify(const FsEvent &event) const
{
    if (event.mask & mask::QueueOverflow) {
        return AnomalyKind::QueueOverflow;
    }
    if (event.mask & mask::Unmount) {
        return AnomalyKind::Unmount;
    }
    if (event.mask & mask::Ignored) {
        if (event.handle == m_lastReused && m_lastReused >= 0) {
            return AnomalyKind::StaleDelivery;
        }
        if (!m_actions.pathForHandle(event.handle)) {
            return AnomalyKind::Orphaned;
        }
        return AnomalyKind::Invalidated;
    }
    return AnomalyKind::None;
}

AnomalyKind AnomalyHandler::handle(const FsEvent &event)
{
    const AnomalyKind kind = classify(event);
    const nlohmann::json ctx = {{"handle", event.handle},
                                {"mask", describeMask(event.mask)},
                                {"path", event.path}};

    switch (kind) {
    case AnomalyKind::None:
        break;
    case AnomalyKind::QueueOverflow:
        IRLOG_ERROR(QStringLiteral("AnomalyHandler"),
                    QStringLiteral("handle"),
                    QStringLiteral("queue_overflow"),
                    QStringLiteral("event_ordering_lost"),
                    ctx);
        m_actions.requestRestart("queue_overflow");
        break;
    case AnomalyKind::Unmount: {
        const auto path = m_actions.pathForHandle(event.handle);
        if (!path) {
            break;
        }
        IRLOG_WARN(QStringLiteral("AnomalyHandler"),
                   QStringLiteral("handle"),
                   QStringLiteral("watch_unmounted"),
                   QStringLiteral("backing_filesystem_unmounted"),
                   ctx);
        if (!m_actions.recreateWatch(*path)) {
            IRLOG_WARN(QStringLiteral("AnomalyHandler"),
                       QStringLiteral("handle"),
                       QStringLiteral("watch_dropped"),
                       QStringLiteral("recreate_after_unmount_failed"),
                       ctx);
            m_actions.dropEntry(*path);
        }
        break;
    }
    case AnomalyKind::StaleDelivery:
        IRLOG_DEBUG(QStringLiteral("AnomalyHandler"),
                    QStringLiteral("handle"),
                    QStringLiteral("stale_ignored_event"),
                    QStringLiteral("descriptor_reused"),
                    ctx);
        m_lastReused = -1;
        break;
    case AnomalyKind::Orphaned:
        IRLOG_DEBUG(QStringLiteral("AnomalyHandler"),
                    QStringLiteral("handle"),
                    QStringLiteral("orphaned_event"),
                    QStringLiteral("descriptor_not_tracked"),
                    ctx);
        break;
    case AnomalyKind::Invalidated: {
        const auto path = m_actions.pathForHandle(event.handle);
        IRLOG_ERROR(QStringLiteral("AnomalyHandler"),
                    QStringLiteral("handle"),
                    QStringLiteral("watch_invalidated"),
                    QStringLiteral("unexplained_ignored_event"),
                    ctx);
        if (path) {
            m_actions.dropEntry(*path);
        }
        break;
    }
    }
    return kind;
}

} // namespace inreact

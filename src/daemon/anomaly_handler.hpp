#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace inreact {

enum class AnomalyKind {
    None,
    QueueOverflow,
    Unmount,
    Invalidated,
    // IN_IGNORED for a descriptor slot that was recycled after our own removal.
    StaleDelivery,
    // IN_IGNORED for a descriptor we no longer track.
    Orphaned
};

// Recovery operations the handler drives; implemented by WatchManager.
class AnomalyActions {
public:
    virtual ~AnomalyActions() = default;

    virtual std::optional<std::string> pathForHandle(int handle) const = 0;
    // Cancel and re-establish the watch; false if the path cannot be watched.
    virtual bool recreateWatch(const std::string &path) = 0;
    virtual void dropEntry(const std::string &path) = 0;
    virtual void requestRestart(const std::string &reason) = 0;
};

/**
 * AnomalyHandler classifies error-class notification events and drives the
 * recovery for each class.
 *
 * Descriptor reuse: after a watch is removed the kernel still queues an
 * IN_IGNORED for its descriptor, and a watch created in between may have been
 * handed the same number. Only the most recent removal is remembered; an older
 * still-pending descriptor that gets reused after a newer removal is reported
 * as Invalidated. This is a known approximation.
 */
class AnomalyHandler {
public:
    explicit AnomalyHandler(AnomalyActions &actions);

    void noteWatchRemoved(int handle);
    void noteWatchCreated(int handle);

    AnomalyKind classify(const FsEvent &event) const;
    AnomalyKind handle(const FsEvent &event);

    int lastReusedHandle() const { return m_lastReused; }

private:
    AnomalyActions &m_actions;
    int m_lastRemoved = -1;
    int m_lastReused = -1;
};

std::string toAnomalyKindString(AnomalyKind kind);

} // namespace inreact

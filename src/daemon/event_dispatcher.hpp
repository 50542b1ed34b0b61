#pragma once

#include <functional>

#include <QObject>

#include "common/enums.hpp"
#include "daemon/notification_source.hpp"
#include "daemon/watch_manager.hpp"

namespace inreact {

/**
 * EventDispatcher is the single consumer of everything that mutates daemon
 * state: notification batches, worker completions and control intents. All
 * of them arrive as Qt events on one thread and are handled one at a time.
 *
 * Intents are only recorded when requested and acted on at the next safe
 * point, after the current event has been handled completely.
 */
class EventDispatcher : public QObject
{
    Q_OBJECT
public:
    using IntentHandler = std::function<void(ControlIntent)>;

    EventDispatcher(NotificationSource &source, WatchManager &manager,
                    QObject *parent = nullptr);
    ~EventDispatcher() override;

    void setIntentHandler(IntentHandler handler) { m_intentHandler = std::move(handler); }

    void requestIntent(ControlIntent intent);
    bool isPending(ControlIntent intent) const;
    bool isStopping() const { return m_stopping; }

    // Routes one event to the callback attached to its handle.
    void dispatchEvent(const FsEvent &event);

public slots:
    void drainEvents();
    void onWorkerFinished(quint64 workerId, int exitCode);

private:
    void processIntents();

    NotificationSource &m_source;
    WatchManager &m_manager;
    IntentHandler m_intentHandler;
    unsigned m_pendingIntents = 0;
    bool m_intentsScheduled = false;
    bool m_stopping = false;
};

} // namespace inreact

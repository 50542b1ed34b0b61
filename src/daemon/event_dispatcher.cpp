#include "daemon/event_dispatcher.hpp"

#include <QMetaObject>

#include "common/logging.hpp"

namespace inreact {

namespace {

unsigned bitOf(ControlIntent intent)
{
    return static_cast<unsigned>(intent);
}

// Order in which simultaneously pending intents are acted on.
constexpr ControlIntent kIntentOrder[] = {
    ControlIntent::Restart,
    ControlIntent::Shutdown,
    ControlIntent::ReopenLog,
    ControlIntent::Reload,
    ControlIntent::DumpState,
};

} // namespace

EventDispatcher::EventDispatcher(NotificationSource &source, WatchManager &manager,
                                 QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_manager(manager)
{
    connect(&m_source, &NotificationSource::eventsReady, this, &EventDispatcher::drainEvents);
}

EventDispatcher::~EventDispatcher() = default;

void EventDispatcher::requestIntent(ControlIntent intent)
{
    m_pendingIntents |= bitOf(intent);
    if (m_intentsScheduled) {
        return;
    }
    m_intentsScheduled = true;
    QMetaObject::invokeMethod(this, [this]() { processIntents(); }, Qt::QueuedConnection);
}

bool EventDispatcher::isPending(ControlIntent intent) const
{
    return (m_pendingIntents & bitOf(intent)) != 0;
}

void EventDispatcher::dispatchEvent(const FsEvent &event)
{
    const WatchCallback *callback = m_source.callbackFor(event.handle);
    if (!callback || !callback->handler) {
        m_manager.handleUnroutedEvent(event);
        return;
    }
    // The handler may replace or remove its own registration.
    const WatchCallback current = *callback;
    current.handler(event);
}

void EventDispatcher::drainEvents()
{
    const std::vector<FsEvent> events = m_source.readEvents();
    for (size_t i = 0; i < events.size(); ++i) {
        if (m_stopping || isPending(ControlIntent::Restart)
            || isPending(ControlIntent::Shutdown)) {
            IRLOG_INFO(QStringLiteral("EventDispatcher"),
                       QStringLiteral("drainEvents"),
                       QStringLiteral("events_discarded"),
                       QStringLiteral("daemon_stopping"),
                       (nlohmann::json{{"count", events.size() - i}}));
            return;
        }
        dispatchEvent(events[i]);
    }
}

void EventDispatcher::onWorkerFinished(quint64 workerId, int exitCode)
{
    m_manager.completeWorker(workerId, exitCode);
}

void EventDispatcher::processIntents()
{
    m_intentsScheduled = false;
    const unsigned pending = m_pendingIntents;
    m_pendingIntents = 0;

    for (ControlIntent intent : kIntentOrder) {
        if ((pending & bitOf(intent)) == 0) {
            continue;
        }
        if (m_intentHandler) {
            m_intentHandler(intent);
        }
        if (intent == ControlIntent::Restart || intent == ControlIntent::Shutdown) {
            // Nothing else matters once the daemon is leaving.
            m_stopping = true;
            break;
        }
    }
}

} // namespace inreact

#include "daemon/inreact_daemon.hpp"

#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/inreact_version.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "daemon/companion_registry.hpp"
#include "daemon/config_reconciler.hpp"
#include "daemon/event_dispatcher.hpp"
#include "daemon/inotify_source.hpp"
#include "daemon/process_executor.hpp"
#include "daemon/reaction_dispatcher.hpp"
#include "daemon/signal_bridge.hpp"
#include "daemon/watch_manager.hpp"

namespace inreact {

namespace {

const QString kComponent = QStringLiteral("InreactDaemon");

} // namespace

InreactDaemon::InreactDaemon(DaemonOptions options, QObject *parent)
    : QObject(parent)
    , m_options(std::move(options))
    , m_source(std::make_unique<InotifySource>())
    , m_executor(std::make_unique<ProcessExecutor>())
{
    m_reactions = std::make_unique<ReactionDispatcher>(*m_executor);

    WatchPolicy policy;
    policy.graceMs = m_options.graceMs;
    m_manager = std::make_unique<WatchManager>(m_registry, *m_source, *m_reactions,
                                               m_workers, policy);
    m_reconciler = std::make_unique<ConfigReconciler>(*m_manager);
    m_reactions->setDirectiveHandler(m_reconciler.get());

    m_dispatcher = std::make_unique<EventDispatcher>(*m_source, *m_manager);
    m_dispatcher->setIntentHandler([this](ControlIntent intent) { handleIntent(intent); });
    m_manager->setRestartHandler([this](const std::string &) {
        m_dispatcher->requestIntent(ControlIntent::Restart);
    });
    connect(m_executor.get(), &ActionExecutor::workerFinished,
            m_dispatcher.get(), &EventDispatcher::onWorkerFinished);

    m_signals = std::make_unique<SignalBridge>();
    connect(m_signals.get(), &SignalBridge::intentRaised, this,
            [this](ControlIntent intent) { m_dispatcher->requestIntent(intent); });
}

InreactDaemon::~InreactDaemon() = default;

bool InreactDaemon::start()
{
    qInfo() << "inreactd: daemon starting (version" << INREACT_VERSION << ")";

    if (!m_source->start()) {
        IRLOG_ERROR(kComponent,
                    QStringLiteral("start"),
                    QStringLiteral("daemon_start_failed"),
                    QStringLiteral("inotify_unavailable"),
                    nlohmann::json::object());
        return false;
    }
    if (!m_signals->start()) {
        // Still usable; operator signals then use their default dispositions.
        IRLOG_WARN(kComponent,
                   QStringLiteral("start"),
                   QStringLiteral("signals_unavailable"),
                   QStringLiteral("signalfd_failed"),
                   nlohmann::json::object());
    }

    logging::CorrelationScope corrScope(logging::newCorrelationId());
    bootstrapCompanions();

    const ReconcileReport report = m_reconciler->loadRoot(m_options.configPath.toStdString());
    IRLOG_INFO(kComponent,
               QStringLiteral("start"),
               QStringLiteral("daemon_ready"),
               QString(),
               (nlohmann::json{{"version", INREACT_VERSION},
                               {"config", m_options.configPath.toStdString()},
                               {"entries", m_registry.size()},
                               {"retracted", report.retracted}}));
    return true;
}

void InreactDaemon::bootstrapCompanions()
{
    if (m_options.companionsPath.isEmpty()) {
        return;
    }
    const CompanionLoadResult loaded = loadCompanions(m_options.companionsPath.toStdString());
    if (loaded.hadError) {
        return;
    }
    m_executor->setCompanions(loaded.companions);
    for (const WatchSpec &spec : companionBootstrapSpecs(loaded.companions)) {
        m_manager->apply(spec);
    }
    for (const CompanionDaemon &companion : loaded.companions) {
        if (!companionSocketIsStale(companion)) {
            continue;
        }
        IRLOG_WARN(kComponent,
                   QStringLiteral("bootstrapCompanions"),
                   QStringLiteral("companion_unreachable"),
                   QStringLiteral("stale_socket"),
                   (nlohmann::json{{"companion", companion.name},
                                   {"socket", companion.socketPath}}));
        // Runs the launch reaction through the watch entry so its worker is tracked.
        m_manager->handleDirectInvocation(companion.socketPath);
    }
}

void InreactDaemon::handleIntent(ControlIntent intent)
{
    switch (intent) {
    case ControlIntent::Reload:
        reload();
        break;
    case ControlIntent::DumpState:
        dumpState();
        break;
    case ControlIntent::ReopenLog:
        logging::reopenLog();
        IRLOG_INFO(kComponent,
                   QStringLiteral("handleIntent"),
                   QStringLiteral("log_reopened"),
                   QStringLiteral("operator_request"),
                   (nlohmann::json{{"path", logging::logFilePath().toStdString()}}));
        break;
    case ControlIntent::Restart:
        restart();
        break;
    case ControlIntent::Shutdown:
        IRLOG_INFO(kComponent,
                   QStringLiteral("handleIntent"),
                   QStringLiteral("daemon_stop"),
                   QStringLiteral("operator_request"),
                   (nlohmann::json{{"inFlightWorkers", m_workers.size()}}));
        QCoreApplication::exit(0);
        break;
    }
}

void InreactDaemon::reload()
{
    const std::string root = m_options.configPath.toStdString();
    // Same path as a config edit: the self-watch entry's LOAD_CONF reaction.
    if (!m_manager->handleDirectInvocation(root)) {
        logging::CorrelationScope corrScope(logging::newCorrelationId());
        m_reconciler->loadRoot(root);
    }
}

void InreactDaemon::dumpState()
{
    nlohmann::json entries = nlohmann::json::array();
    for (const std::string &path : m_registry.paths()) {
        if (const WatchEntry *entry = m_registry.get(path)) {
            entries.push_back(*entry);
        }
    }
    nlohmann::json workers = nlohmann::json::array();
    for (const auto &item : m_workers.snapshot()) {
        workers.push_back({{"worker", item.first},
                           {"path", item.second.path},
                           {"reason", toWorkerReasonString(item.second.reason)},
                           {"corr", item.second.correlationId.toStdString()},
                           {"startedAt", toIso8601Utc(item.second.startedAt)}});
    }
    IRLOG_INFO(kComponent,
               QStringLiteral("dumpState"),
               QStringLiteral("state_dump"),
               QStringLiteral("operator_request"),
               (nlohmann::json{{"entries", entries},
                               {"workers", workers},
                               {"executorInFlight", m_executor->inFlight()}}));
}

void InreactDaemon::restart()
{
    const bool spawned = spawnReplacementInstance();
    IRLOG_WARN(kComponent,
               QStringLiteral("restart"),
               spawned ? QStringLiteral("daemon_restart") : QStringLiteral("daemon_restart_failed"),
               QStringLiteral("recovery"),
               (nlohmann::json{{"inFlightWorkers", m_workers.size()}}));
    QCoreApplication::exit(spawned ? 0 : 1);
}

} // namespace inreact

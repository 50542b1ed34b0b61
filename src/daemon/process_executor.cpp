#include "daemon/process_executor.hpp"

#include <QLocalSocket>
#include <QProcess>
#include <QTimer>

#include <utility>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace inreact {

namespace {

constexpr int kMaxLoggedOutputBytes = 4096;

QString truncatedOutput(const QByteArray &output)
{
    if (output.size() <= kMaxLoggedOutputBytes) {
        return QString::fromUtf8(output);
    }
    return QString::fromUtf8(output.left(kMaxLoggedOutputBytes)) + QStringLiteral("...");
}

} // namespace

struct ProcessExecutor::ForwardState {
    WorkerId id = 0;
    std::string daemon;
    QString socketPath;
    QByteArray payload;
    QByteArray response;
    std::optional<CompanionDaemon> companion;
    QLocalSocket *socket = nullptr;
    bool connected = false;
    bool spawnAttempted = false;
    bool finished = false;
};

ProcessExecutor::ProcessExecutor(QObject *parent)
    : ActionExecutor(parent)
{
}

ProcessExecutor::~ProcessExecutor() = default;

void ProcessExecutor::setCompanions(std::vector<CompanionDaemon> companions)
{
    m_companions = std::move(companions);
}

std::optional<WorkerId> ProcessExecutor::runCommand(const std::string &commandLine)
{
    if (commandLine.empty()) {
        return std::nullopt;
    }

    const WorkerId id = m_nextId++;
    const QString corrId = logging::currentCorrelationId();

    auto *process = new QProcess(this);
    process->setProgram(QStringLiteral("/bin/sh"));
    process->setArguments({QStringLiteral("-c"), QString::fromStdString(commandLine)});
    process->setProcessChannelMode(QProcess::MergedChannels);
    process->setStandardInputFile(QProcess::nullDevice());
    resetChildSignalMask(*process);

    connect(process, &QProcess::finished, this,
            [this, process, id, corrId](int exitCode, QProcess::ExitStatus status) {
                logging::CorrelationScope scope(corrId);
                const int code = status == QProcess::NormalExit ? exitCode : -1;
                const QByteArray output = process->readAll();
                if (!output.isEmpty()) {
                    IRLOG_DEBUG(QStringLiteral("ProcessExecutor"),
                                QStringLiteral("runCommand"),
                                QStringLiteral("worker_output"),
                                QString(),
                                (nlohmann::json{{"worker", id},
                                                {"output", truncatedOutput(output).toStdString()}}));
                }
                process->deleteLater();
                completeLater(id, code);
            });
    connect(process, &QProcess::errorOccurred, this,
            [this, process, id, corrId](QProcess::ProcessError error) {
                if (error != QProcess::FailedToStart) {
                    return;
                }
                logging::CorrelationScope scope(corrId);
                IRLOG_WARN(QStringLiteral("ProcessExecutor"),
                           QStringLiteral("runCommand"),
                           QStringLiteral("worker_start_failed"),
                           process->errorString(),
                           (nlohmann::json{{"worker", id}}));
                process->deleteLater();
                completeLater(id, -1);
            });

    ++m_inFlight;
    process->start();

    IRLOG_INFO(QStringLiteral("ProcessExecutor"),
               QStringLiteral("runCommand"),
               QStringLiteral("worker_spawned"),
               QStringLiteral("reaction_fired"),
               (nlohmann::json{{"worker", id}, {"command", commandLine}}));
    return id;
}

std::optional<WorkerId> ProcessExecutor::forwardToDaemon(const std::string &daemon,
                                                         const std::string &payload)
{
    auto state = std::make_shared<ForwardState>();
    state->daemon = daemon;
    state->companion = findCompanion(daemon);
    if (state->companion && !state->companion->socketPath.empty()) {
        state->socketPath = QString::fromStdString(state->companion->socketPath);
    } else if (!daemon.empty() && daemon.front() == '/') {
        state->socketPath = QString::fromStdString(daemon);
    } else {
        IRLOG_WARN(QStringLiteral("ProcessExecutor"),
                   QStringLiteral("forwardToDaemon"),
                   QStringLiteral("forward_unknown_daemon"),
                   QStringLiteral("no_socket_path"),
                   (nlohmann::json{{"daemon", daemon}}));
        return std::nullopt;
    }

    state->id = m_nextId++;
    state->payload = QByteArray::fromStdString(payload);
    state->payload.append('\n');

    ++m_inFlight;
    startForward(state);

    IRLOG_INFO(QStringLiteral("ProcessExecutor"),
               QStringLiteral("forwardToDaemon"),
               QStringLiteral("worker_spawned"),
               QStringLiteral("reaction_fired"),
               (nlohmann::json{{"worker", state->id},
                               {"daemon", daemon},
                               {"socket", state->socketPath.toStdString()}}));
    return state->id;
}

void ProcessExecutor::startForward(const std::shared_ptr<ForwardState> &state)
{
    auto *socket = new QLocalSocket(this);
    state->socket = socket;
    const QString corrId = logging::currentCorrelationId();

    connect(socket, &QLocalSocket::connected, this, [state]() {
        state->connected = true;
        state->socket->write(state->payload);
    });
    connect(socket, &QLocalSocket::readyRead, this, [state]() {
        state->response += state->socket->readAll();
    });
    connect(socket, &QLocalSocket::disconnected, this, [this, state, corrId]() {
        logging::CorrelationScope scope(corrId);
        state->response += state->socket->readAll();
        finishForward(state, 0);
    });
    connect(socket, &QLocalSocket::errorOccurred, this,
            [this, state, corrId](QLocalSocket::LocalSocketError error) {
                if (error == QLocalSocket::PeerClosedError || state->finished) {
                    return;
                }
                logging::CorrelationScope scope(corrId);
                const bool unreachable = error == QLocalSocket::ServerNotFoundError
                    || error == QLocalSocket::ConnectionRefusedError;
                if (!state->connected && unreachable && trySpawnCompanion(*state)) {
                    QLocalSocket *stale = state->socket;
                    stale->disconnect(this);
                    stale->deleteLater();
                    QTimer::singleShot(m_respawnRetryDelayMs, this,
                                       [this, state]() { startForward(state); });
                    return;
                }
                IRLOG_WARN(QStringLiteral("ProcessExecutor"),
                           QStringLiteral("forwardToDaemon"),
                           QStringLiteral("forward_failed"),
                           state->socket->errorString(),
                           (nlohmann::json{{"worker", state->id}, {"daemon", state->daemon}}));
                finishForward(state, 1);
            });

    socket->connectToServer(state->socketPath);
}

bool ProcessExecutor::trySpawnCompanion(ForwardState &state)
{
    if (state.spawnAttempted || !state.companion || state.companion->executable.empty()) {
        return false;
    }
    if (!isPrivileged()) {
        return false;
    }
    state.spawnAttempted = true;
    if (isProcessRunning(QString::fromStdString(state.companion->processName))) {
        return false;
    }
    return spawnDetached(QString::fromStdString(state.companion->executable));
}

void ProcessExecutor::finishForward(const std::shared_ptr<ForwardState> &state, int exitCode)
{
    if (state->finished) {
        return;
    }
    state->finished = true;
    if (!state->response.isEmpty()) {
        IRLOG_DEBUG(QStringLiteral("ProcessExecutor"),
                    QStringLiteral("forwardToDaemon"),
                    QStringLiteral("forward_response"),
                    QString(),
                    (nlohmann::json{{"worker", state->id},
                                    {"response", truncatedOutput(state->response).toStdString()}}));
    }
    if (state->socket) {
        state->socket->disconnect(this);
        state->socket->deleteLater();
        state->socket = nullptr;
    }
    completeLater(state->id, exitCode);
}

void ProcessExecutor::completeLater(WorkerId id, int exitCode)
{
    QMetaObject::invokeMethod(this, [this, id, exitCode]() {
        --m_inFlight;
        emit workerFinished(id, exitCode);
    }, Qt::QueuedConnection);
}

std::optional<CompanionDaemon> ProcessExecutor::findCompanion(const std::string &name) const
{
    for (const auto &companion : m_companions) {
        if (companion.name == name) {
            return companion;
        }
    }
    return std::nullopt;
}

} // namespace inreact

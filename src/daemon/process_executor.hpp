#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "daemon/action_executor.hpp"

namespace inreact {

/**
 * ProcessExecutor runs commands through /bin/sh -c with QProcess and
 * forwards payloads to companion daemons over QLocalSocket.
 */
class ProcessExecutor : public ActionExecutor
{
    Q_OBJECT
public:
    explicit ProcessExecutor(QObject *parent = nullptr);
    ~ProcessExecutor() override;

    void setCompanions(std::vector<CompanionDaemon> companions);
    void setRespawnRetryDelayMs(int delayMs) { m_respawnRetryDelayMs = delayMs; }

    std::optional<WorkerId> runCommand(const std::string &commandLine) override;
    std::optional<WorkerId> forwardToDaemon(const std::string &daemon,
                                            const std::string &payload) override;

    int inFlight() const { return m_inFlight; }

private:
    struct ForwardState;

    void startForward(const std::shared_ptr<ForwardState> &state);
    bool trySpawnCompanion(ForwardState &state);
    void finishForward(const std::shared_ptr<ForwardState> &state, int exitCode);
    void completeLater(WorkerId id, int exitCode);
    std::optional<CompanionDaemon> findCompanion(const std::string &name) const;

    WorkerId m_nextId = 1;
    int m_inFlight = 0;
    int m_respawnRetryDelayMs = 500;
    std::vector<CompanionDaemon> m_companions;
};

} // namespace inreact

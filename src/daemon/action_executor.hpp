#pragma once

#include <optional>
#include <string>

#include <QObject>

#include "common/models.hpp"

namespace inreact {

/**
 * ActionExecutor runs reactions out of process. Every started worker is
 * reported through workerFinished exactly once, and never before the call
 * that started it has returned its id.
 */
class ActionExecutor : public QObject
{
    Q_OBJECT
public:
    explicit ActionExecutor(QObject *parent = nullptr)
        : QObject(parent)
    {
    }
    ~ActionExecutor() override = default;

    virtual std::optional<WorkerId> runCommand(const std::string &commandLine) = 0;
    virtual std::optional<WorkerId> forwardToDaemon(const std::string &daemon,
                                                    const std::string &payload) = 0;

signals:
    void workerFinished(quint64 workerId, int exitCode);
};

} // namespace inreact

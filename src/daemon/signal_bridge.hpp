#pragma once

#include <memory>

#include <QObject>
#include <QSocketNotifier>

#include "common/enums.hpp"

namespace inreact {

/**
 * SignalBridge turns operator signals into control intents on the Qt event
 * loop through a signalfd. SIGHUP reloads, SIGUSR1 dumps state, SIGUSR2
 * reopens the log, SIGTERM and SIGINT shut down.
 *
 * SIGCHLD is left alone: QProcess reaps its own children.
 */
class SignalBridge : public QObject
{
    Q_OBJECT
public:
    // Must run in main() before any thread is created so every thread
    // inherits the blocked mask.
    static bool blockHandledSignals();

    explicit SignalBridge(QObject *parent = nullptr);
    ~SignalBridge() override;

    bool start();

    static ControlIntent intentForSignal(int signalNumber);

signals:
    void intentRaised(inreact::ControlIntent intent);

private:
    void readSignals();

    int m_fd = -1;
    std::unique_ptr<QSocketNotifier> m_notifier;
};

} // namespace inreact

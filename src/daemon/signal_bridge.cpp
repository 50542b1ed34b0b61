#include "daemon/signal_bridge.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/signalfd.h>
#include <unistd.h>

#include "common/logging.hpp"

namespace inreact {

namespace {

sigset_t handledSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGUSR1);
    sigaddset(&set, SIGUSR2);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGINT);
    return set;
}

} // namespace

bool SignalBridge::blockHandledSignals()
{
    const sigset_t set = handledSignals();
    return pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

ControlIntent SignalBridge::intentForSignal(int signalNumber)
{
    switch (signalNumber) {
    case SIGHUP:
        return ControlIntent::Reload;
    case SIGUSR1:
        return ControlIntent::DumpState;
    case SIGUSR2:
        return ControlIntent::ReopenLog;
    default:
        return ControlIntent::Shutdown;
    }
}

SignalBridge::SignalBridge(QObject *parent)
    : QObject(parent)
{
}

SignalBridge::~SignalBridge()
{
    m_notifier.reset();
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

bool SignalBridge::start()
{
    if (m_fd >= 0) {
        return true;
    }
    const sigset_t set = handledSignals();
    m_fd = ::signalfd(-1, &set, SFD_NONBLOCK | SFD_CLOEXEC);
    if (m_fd < 0) {
        IRLOG_ERROR(QStringLiteral("SignalBridge"),
                    QStringLiteral("start"),
                    QStringLiteral("signalfd_failed"),
                    QString::fromLocal8Bit(std::strerror(errno)),
                    nlohmann::json::object());
        return false;
    }
    m_notifier = std::make_unique<QSocketNotifier>(m_fd, QSocketNotifier::Read);
    connect(m_notifier.get(), &QSocketNotifier::activated, this, &SignalBridge::readSignals);
    return true;
}

void SignalBridge::readSignals()
{
    signalfd_siginfo info;
    for (;;) {
        const ssize_t n = ::read(m_fd, &info, sizeof(info));
        if (n != static_cast<ssize_t>(sizeof(info))) {
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        const int signalNumber = static_cast<int>(info.ssi_signo);
        IRLOG_INFO(QStringLiteral("SignalBridge"),
                   QStringLiteral("readSignals"),
                   QStringLiteral("signal_received"),
                   QString::fromLocal8Bit(strsignal(signalNumber)),
                   (nlohmann::json{{"signal", signalNumber},
                                   {"senderPid", info.ssi_pid}}));
        emit intentRaised(intentForSignal(signalNumber));
    }
}

} // namespace inreact

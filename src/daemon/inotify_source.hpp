#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include <QSocketNotifier>

#include "daemon/notification_source.hpp"

namespace inreact {

/**
 * InotifySource is the Linux inotify implementation of NotificationSource.
 * The inotify descriptor is non-blocking and polled by a QSocketNotifier on
 * the owning thread's event loop.
 */
class InotifySource : public NotificationSource
{
    Q_OBJECT
public:
    explicit InotifySource(QObject *parent = nullptr);
    ~InotifySource() override;

    bool start();
    bool isStarted() const { return m_fd >= 0; }

    WatchResult addWatch(const std::string &path, std::uint32_t mask,
                         WatchCallback callback) override;
    void removeWatch(int handle) override;
    bool replaceCallback(int handle, WatchCallback callback) override;
    const WatchCallback *callbackFor(int handle) const override;
    std::vector<FsEvent> readEvents() override;

private:
    struct Registration {
        std::string path;
        WatchCallback callback;
    };

    int m_fd = -1;
    std::unique_ptr<QSocketNotifier> m_notifier;
    std::unordered_map<int, Registration> m_watches;
};

} // namespace inreact

#include "daemon/inotify_source.hpp"

#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <utility>

#include "common/logging.hpp"

namespace inreact {

static_assert(mask::Modify == IN_MODIFY, "mask values must match inotify");
static_assert(mask::DeleteSelf == IN_DELETE_SELF, "mask values must match inotify");
static_assert(mask::MoveSelf == IN_MOVE_SELF, "mask values must match inotify");
static_assert(mask::AllEvents == IN_ALL_EVENTS, "mask values must match inotify");
static_assert(mask::Unmount == IN_UNMOUNT, "mask values must match inotify");
static_assert(mask::QueueOverflow == IN_Q_OVERFLOW, "mask values must match inotify");
static_assert(mask::Ignored == IN_IGNORED, "mask values must match inotify");
static_assert(mask::OnlyDir == IN_ONLYDIR, "mask values must match inotify");

namespace {

constexpr size_t kEventBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);

WatchError classifyErrno(int error)
{
    switch (error) {
    case ENOENT:
    case ENOTDIR:
        return WatchError::NotFound;
    case EACCES:
    case EPERM:
        return WatchError::PermissionDenied;
    case ENOSPC:
        return WatchError::NoSpace;
    case EEXIST:
        return WatchError::Aliased;
    default:
        return WatchError::Other;
    }
}

} // namespace

InotifySource::InotifySource(QObject *parent)
    : NotificationSource(parent)
{
}

InotifySource::~InotifySource()
{
    m_notifier.reset();
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

bool InotifySource::start()
{
    if (m_fd >= 0) {
        return true;
    }

    m_fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_fd < 0) {
        IRLOG_ERROR(QStringLiteral("InotifySource"),
                    QStringLiteral("start"),
                    QStringLiteral("inotify_init_failed"),
                    QString::fromUtf8(std::strerror(errno)),
                    nlohmann::json::object());
        return false;
    }

    m_notifier = std::make_unique<QSocketNotifier>(m_fd, QSocketNotifier::Read);
    connect(m_notifier.get(), &QSocketNotifier::activated,
            this, &NotificationSource::eventsReady);

    IRLOG_INFO(QStringLiteral("InotifySource"),
               QStringLiteral("start"),
               QStringLiteral("inotify_started"),
               QString(),
               (nlohmann::json{{"fd", m_fd}}));
    return true;
}

WatchResult InotifySource::addWatch(const std::string &path, std::uint32_t mask,
                                    WatchCallback callback)
{
    WatchResult result;
    if (m_fd < 0) {
        result.error = WatchError::Other;
        result.message = "inotify not started";
        return result;
    }

#ifdef IN_MASK_CREATE
    // Refuse to modify a watch some other path already holds on this inode.
    const std::uint32_t requested = mask | IN_MASK_CREATE;
#else
    const std::uint32_t requested = mask;
#endif
    const int wd = inotify_add_watch(m_fd, path.c_str(), requested);
    if (wd < 0) {
        result.error = classifyErrno(errno);
        result.message = std::strerror(errno);
        return result;
    }

    // inotify hands out one descriptor per inode.
    auto it = m_watches.find(wd);
    if (it != m_watches.end() && it->second.path != path) {
        result.error = WatchError::Aliased;
        result.message = "same inode already watched as " + it->second.path;
        return result;
    }

    m_watches[wd] = Registration{path, std::move(callback)};
    result.handle = wd;
    return result;
}

void InotifySource::removeWatch(int handle)
{
    if (m_watches.erase(handle) == 0) {
        return;
    }
    // EINVAL here means the kernel already dropped the watch (self deletion,
    // unmount); the map entry is all that was left.
    if (m_fd >= 0 && inotify_rm_watch(m_fd, handle) != 0 && errno != EINVAL) {
        IRLOG_WARN(QStringLiteral("InotifySource"),
                   QStringLiteral("removeWatch"),
                   QStringLiteral("rm_watch_failed"),
                   QString::fromUtf8(std::strerror(errno)),
                   (nlohmann::json{{"handle", handle}}));
    }
}

bool InotifySource::replaceCallback(int handle, WatchCallback callback)
{
    auto it = m_watches.find(handle);
    if (it == m_watches.end()) {
        return false;
    }
    it->second.callback = std::move(callback);
    return true;
}

const WatchCallback *InotifySource::callbackFor(int handle) const
{
    auto it = m_watches.find(handle);
    return it == m_watches.end() ? nullptr : &it->second.callback;
}

std::vector<FsEvent> InotifySource::readEvents()
{
    std::vector<FsEvent> batch;
    if (m_fd < 0) {
        return batch;
    }

    alignas(struct inotify_event) char buffer[kEventBufferSize];
    for (;;) {
        const ssize_t length = ::read(m_fd, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN) {
                IRLOG_ERROR(QStringLiteral("InotifySource"),
                            QStringLiteral("readEvents"),
                            QStringLiteral("inotify_read_failed"),
                            QString::fromUtf8(std::strerror(errno)),
                            nlohmann::json::object());
            }
            break;
        }
        if (length == 0) {
            break;
        }

        ssize_t offset = 0;
        while (offset < length) {
            const auto *raw = reinterpret_cast<const struct inotify_event *>(buffer + offset);
            FsEvent event;
            event.handle = raw->wd;
            event.mask = raw->mask;
            event.cookie = raw->cookie;
            if (raw->len > 0) {
                event.name = raw->name;
            }
            auto it = m_watches.find(raw->wd);
            if (it != m_watches.end()) {
                event.path = it->second.path;
            }
            batch.push_back(std::move(event));
            offset += static_cast<ssize_t>(sizeof(struct inotify_event) + raw->len);
        }
    }
    return batch;
}

} // namespace inreact

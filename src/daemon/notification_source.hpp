#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <QObject>

#include "common/models.hpp"

namespace inreact {

enum class WatchError {
    None,
    NotFound,
    PermissionDenied,
    Aliased,
    NoSpace,
    Other
};

struct WatchResult {
    int handle = -1;
    WatchError error = WatchError::None;
    std::string message;

    bool ok() const { return error == WatchError::None; }
};

/**
 * NotificationSource abstracts the OS file-change facility. Each handle has
 * exactly one callback attached; replacing it is how the daemon swaps a live
 * reaction for the sentinel and back.
 */
class NotificationSource : public QObject
{
    Q_OBJECT
public:
    explicit NotificationSource(QObject *parent = nullptr)
        : QObject(parent)
    {
    }
    ~NotificationSource() override = default;

    virtual WatchResult addWatch(const std::string &path, std::uint32_t mask,
                                 WatchCallback callback) = 0;
    virtual void removeWatch(int handle) = 0;
    virtual bool replaceCallback(int handle, WatchCallback callback) = 0;

    // Nullptr for unknown handles (including the -1 of a queue overflow).
    virtual const WatchCallback *callbackFor(int handle) const = 0;

    // Drains every event the OS has queued so far.
    virtual std::vector<FsEvent> readEvents() = 0;

signals:
    void eventsReady();
};

} // namespace inreact

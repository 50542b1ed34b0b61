#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "common/fs_utils.hpp"
#include "daemon/notification_source.hpp"

namespace inreact::testing {

// In-memory NotificationSource. Watches succeed for existing paths unless
// told otherwise; events are delivered synchronously through deliver().
class FakeNotificationSource : public NotificationSource
{
public:
    struct Watch {
        std::string path;
        std::uint32_t mask = 0;
        WatchCallback callback;
    };

    WatchResult addWatch(const std::string &path, std::uint32_t mask,
                         WatchCallback callback) override
    {
        ++addCalls;
        WatchResult result;
        if (failingPaths.count(path) > 0) {
            result.error = WatchError::PermissionDenied;
            result.message = "refused by test";
            return result;
        }
        if (!pathExists(path)) {
            result.error = WatchError::NotFound;
            result.message = "no such file";
            return result;
        }
        result.handle = nextHandle++;
        watches[result.handle] = Watch{path, mask, std::move(callback)};
        return result;
    }

    void removeWatch(int handle) override
    {
        if (watches.erase(handle) > 0) {
            removed.push_back(handle);
        }
    }

    bool replaceCallback(int handle, WatchCallback callback) override
    {
        auto it = watches.find(handle);
        if (it == watches.end()) {
            return false;
        }
        ++replaceCalls;
        it->second.callback = std::move(callback);
        return true;
    }

    const WatchCallback *callbackFor(int handle) const override
    {
        auto it = watches.find(handle);
        return it == watches.end() ? nullptr : &it->second.callback;
    }

    std::vector<FsEvent> readEvents() override
    {
        std::vector<FsEvent> batch;
        batch.swap(queued);
        return batch;
    }

    void queue(int handle, std::uint32_t eventMask)
    {
        queued.push_back(makeEvent(handle, eventMask));
    }

    void announce() { emit eventsReady(); }

    // Queue an event for readEvents() and announce it.
    void post(int handle, std::uint32_t eventMask)
    {
        queue(handle, eventMask);
        announce();
    }

    // Calls the attached callback directly, the way the dispatcher does.
    bool deliver(int handle, std::uint32_t eventMask)
    {
        const WatchCallback *callback = callbackFor(handle);
        if (!callback) {
            return false;
        }
        const WatchCallback current = *callback;
        current.handler(makeEvent(handle, eventMask));
        return true;
    }

    int handleFor(const std::string &path) const
    {
        for (const auto &item : watches) {
            if (item.second.path == path) {
                return item.first;
            }
        }
        return -1;
    }

    CallbackRole roleFor(const std::string &path) const
    {
        const int handle = handleFor(path);
        return handle < 0 ? CallbackRole::Live : watches.at(handle).callback.role;
    }

    FsEvent makeEvent(int handle, std::uint32_t eventMask) const
    {
        FsEvent event;
        event.handle = handle;
        event.mask = eventMask;
        auto it = watches.find(handle);
        if (it != watches.end()) {
            event.path = it->second.path;
        }
        return event;
    }

    std::map<int, Watch> watches;
    std::vector<int> removed;
    std::set<std::string> failingPaths;
    std::vector<FsEvent> queued;
    int nextHandle = 1;
    int addCalls = 0;
    int replaceCalls = 0;
};

} // namespace inreact::testing

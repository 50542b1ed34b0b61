#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "common/enums.hpp"
#include "common/event_mask.hpp"

namespace inreact {

using WorkerId = std::uint64_t;

// Source identifier for entries created at startup rather than from a file.
inline const std::string kBootstrapSource = "bootstrap";

struct RunCommand {
    std::string commandLine;
};

struct ForwardToSocket {
    std::string daemon;
    std::string payload;
};

struct LoadConfig {
    std::string configPath;
};

// Holds the "path mask reaction" text of the watch to create on demand.
struct SetWatch {
    std::string specLine;
};

inline bool operator==(const RunCommand &a, const RunCommand &b)
{
    return a.commandLine == b.commandLine;
}
inline bool operator==(const ForwardToSocket &a, const ForwardToSocket &b)
{
    return a.daemon == b.daemon && a.payload == b.payload;
}
inline bool operator==(const LoadConfig &a, const LoadConfig &b)
{
    return a.configPath == b.configPath;
}
inline bool operator==(const SetWatch &a, const SetWatch &b)
{
    return a.specLine == b.specLine;
}

using Reaction = std::variant<RunCommand, ForwardToSocket, LoadConfig, SetWatch>;

// What a configuration line (or bootstrap code) asks for.
struct WatchSpec {
    std::string path;
    std::uint32_t mask = mask::DeleteSelf;
    Reaction reaction;
    std::string sourceConfig;
    bool createIfMissing = false;
    bool runReactionIfMissing = false;
    int lineNumber = 0;
};

struct WatchEntry {
    std::string path;
    std::uint32_t mask = mask::DeleteSelf;
    Reaction reaction;
    std::string sourceConfig;
    bool createIfMissing = false;
    bool runReactionIfMissing = false;

    // Owned OS watch handle; empty while not established.
    std::optional<int> watchHandle;
    std::optional<std::uint64_t> lastInode;
    bool suspended = false;
    // Identifies the wipe that suspended the entry; 0 while live.
    std::uint64_t suspension = 0;
};

// Compares what a configuration can express; runtime state is ignored.
inline bool sameSemantics(const WatchEntry &entry, const WatchSpec &spec)
{
    return entry.mask == spec.mask
        && entry.reaction == spec.reaction
        && entry.createIfMissing == spec.createIfMissing
        && entry.runReactionIfMissing == spec.runReactionIfMissing;
}

inline WatchEntry entryFromSpec(const WatchSpec &spec)
{
    WatchEntry entry;
    entry.path = spec.path;
    entry.mask = spec.mask;
    entry.reaction = spec.reaction;
    entry.sourceConfig = spec.sourceConfig;
    entry.createIfMissing = spec.createIfMissing;
    entry.runReactionIfMissing = spec.runReactionIfMissing;
    return entry;
}

// External daemon the reactions may forward to, and bootstrap may spawn.
struct CompanionDaemon {
    std::string name;
    std::string socketPath;
    std::string executable;
    std::string processName;
    bool autostart = false;
};

struct FsEvent {
    int handle = -1;
    std::uint32_t mask = 0;
    std::uint32_t cookie = 0;
    // Path as known when the watch was registered.
    std::string path;
    // Entry name for events on a watched directory's children.
    std::string name;

    bool isErrorClass() const { return (mask & mask::ErrorClass) != 0; }
    bool isSelfGone() const { return (mask & mask::SelfGone) != 0; }
};

using EventHandler = std::function<void(const FsEvent &)>;

struct WatchCallback {
    CallbackRole role = CallbackRole::Live;
    EventHandler handler;
};

} // namespace inreact

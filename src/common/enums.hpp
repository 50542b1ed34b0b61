#pragma once

namespace inreact {

// Which handler an OS watch currently delivers to.
enum class CallbackRole {
    Live,
    Sentinel
};

// Observable state of a registry entry.
enum class WatchState {
    Live,
    Suspended,
    Unwatched
};

// Why a worker was started; decides how its completion restores the watch.
enum class WorkerReason {
    Event,
    MissingPath,
    Direct
};

enum class UpsertOutcome {
    Inserted,
    Unchanged,
    Replaced,
    Conflict
};

// Operator and internal requests, acted on at the dispatcher's next safe point.
enum class ControlIntent {
    Reload = 0x1,
    DumpState = 0x2,
    ReopenLog = 0x4,
    Restart = 0x8,
    Shutdown = 0x10
};

} // namespace inreact

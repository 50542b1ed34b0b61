#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace inreact {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toReactionKindString(const Reaction &reaction)
{
    return std::visit([](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, RunCommand>) {
            return "run_command";
        } else if constexpr (std::is_same_v<T, ForwardToSocket>) {
            return "forward";
        } else if constexpr (std::is_same_v<T, LoadConfig>) {
            return "load_config";
        } else {
            return "set_watch";
        }
    }, reaction);
}

// Renders a reaction the way it is written in a configuration line.
inline std::string describeReaction(const Reaction &reaction)
{
    return std::visit([](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, RunCommand>) {
            return value.commandLine;
        } else if constexpr (std::is_same_v<T, ForwardToSocket>) {
            return "FORWARD " + value.daemon + " " + value.payload;
        } else if constexpr (std::is_same_v<T, LoadConfig>) {
            return "LOAD_CONF " + value.configPath;
        } else {
            return "SET_WATCH " + value.specLine;
        }
    }, reaction);
}

inline std::string toWatchStateString(WatchState state)
{
    switch (state) {
    case WatchState::Live:
        return "live";
    case WatchState::Suspended:
        return "suspended";
    case WatchState::Unwatched:
        return "unwatched";
    }
    return "unwatched";
}

inline std::string toWorkerReasonString(WorkerReason reason)
{
    switch (reason) {
    case WorkerReason::Event:
        return "event";
    case WorkerReason::MissingPath:
        return "missing_path";
    case WorkerReason::Direct:
        return "direct";
    }
    return "event";
}

inline WatchState watchStateOf(const WatchEntry &entry)
{
    if (entry.suspended) {
        return WatchState::Suspended;
    }
    return entry.watchHandle.has_value() ? WatchState::Live : WatchState::Unwatched;
}

inline void to_json(nlohmann::json &j, const WatchEntry &entry)
{
    j = nlohmann::json{
        {"path", entry.path},
        {"mask", describeMask(entry.mask)},
        {"reactionKind", toReactionKindString(entry.reaction)},
        {"reaction", describeReaction(entry.reaction)},
        {"sourceConfig", entry.sourceConfig},
        {"createIfMissing", entry.createIfMissing},
        {"runReactionIfMissing", entry.runReactionIfMissing},
        {"state", toWatchStateString(watchStateOf(entry))}
    };
    if (entry.watchHandle) {
        j["watchHandle"] = *entry.watchHandle;
    } else {
        j["watchHandle"] = nullptr;
    }
    if (entry.lastInode) {
        j["lastInode"] = *entry.lastInode;
    } else {
        j["lastInode"] = nullptr;
    }
}

inline void to_json(nlohmann::json &j, const CompanionDaemon &companion)
{
    j = nlohmann::json{
        {"name", companion.name},
        {"socket", companion.socketPath},
        {"executable", companion.executable},
        {"process", companion.processName},
        {"autostart", companion.autostart}
    };
}

inline void from_json(const nlohmann::json &j, CompanionDaemon &companion)
{
    companion.name = j.value("name", "");
    companion.socketPath = j.value("socket", "");
    companion.executable = j.value("executable", "");
    companion.processName = j.value("process", "");
    companion.autostart = j.value("autostart", false);
}

} // namespace inreact

#include "daemon/companion_registry.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "common/fs_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "daemon/reaction_dispatcher.hpp"

namespace inreact {

CompanionLoadResult parseCompanions(const std::string &text)
{
    CompanionLoadResult result;
    const nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        result.hadError = true;
        result.error = "malformed companion registry";
        return result;
    }

    const auto it = doc.find("companions");
    if (it == doc.end()) {
        return result;
    }
    if (!it->is_array()) {
        result.hadError = true;
        result.error = "\"companions\" is not an array";
        return result;
    }

    for (const auto &item : *it) {
        if (!item.is_object()) {
            continue;
        }
        CompanionDaemon companion;
        try {
            companion = item.get<CompanionDaemon>();
        } catch (const nlohmann::json::exception &ex) {
            IRLOG_WARN(QStringLiteral("CompanionRegistry"),
                       QStringLiteral("parseCompanions"),
                       QStringLiteral("companion_skipped"),
                       QString::fromUtf8(ex.what()),
                       (nlohmann::json{{"entry", item}}));
            continue;
        }
        if (companion.name.empty()) {
            continue;
        }
        if (companion.processName.empty() && !companion.executable.empty()) {
            const auto slash = companion.executable.find_last_of('/');
            companion.processName = slash == std::string::npos
                ? companion.executable
                : companion.executable.substr(slash + 1);
        }
        result.companions.push_back(std::move(companion));
    }
    return result;
}

CompanionLoadResult loadCompanions(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        CompanionLoadResult result;
        result.hadError = true;
        result.error = "cannot open " + path;
        return result;
    }
    std::ostringstream content;
    content << in.rdbuf();

    CompanionLoadResult result = parseCompanions(content.str());
    if (result.hadError) {
        IRLOG_WARN(QStringLiteral("CompanionRegistry"),
                   QStringLiteral("loadCompanions"),
                   QStringLiteral("companions_rejected"),
                   QString::fromStdString(result.error),
                   (nlohmann::json{{"path", path}}));
    } else {
        IRLOG_INFO(QStringLiteral("CompanionRegistry"),
                   QStringLiteral("loadCompanions"),
                   QStringLiteral("companions_loaded"),
                   QString(),
                   (nlohmann::json{{"path", path}, {"companions", result.companions}}));
    }
    return result;
}

bool companionSocketIsStale(const CompanionDaemon &companion)
{
    if (!companion.autostart || companion.socketPath.empty()
        || !pathExists(companion.socketPath)) {
        return false;
    }
    return !isSocketReachable(QString::fromStdString(companion.socketPath));
}

std::string companionLaunchCommand(const CompanionDaemon &companion)
{
    std::string command;
    if (!companion.processName.empty()) {
        command = "pgrep -x " + shellQuote(companion.processName) + " >/dev/null || ";
    }
    command += "exec " + shellQuote(companion.executable);
    return command;
}

std::vector<WatchSpec> companionBootstrapSpecs(const std::vector<CompanionDaemon> &companions)
{
    std::vector<WatchSpec> specs;
    for (const CompanionDaemon &companion : companions) {
        if (!companion.autostart || companion.socketPath.empty()
            || companion.executable.empty()) {
            continue;
        }
        WatchSpec spec;
        spec.path = companion.socketPath;
        spec.mask = mask::DeleteSelf | mask::Attrib;
        spec.reaction = RunCommand{companionLaunchCommand(companion)};
        spec.sourceConfig = kBootstrapSource;
        spec.runReactionIfMissing = true;
        specs.push_back(std::move(spec));
    }
    return specs;
}

} // namespace inreact

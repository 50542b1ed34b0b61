#include "daemon/config_reconciler.hpp"

#include <map>
#include <utility>
#include <vector>

#include "common/fs_utils.hpp"
#include "common/logging.hpp"
#include "daemon/config_parser.hpp"

namespace inreact {

namespace {

const QString kComponent = QStringLiteral("ConfigReconciler");

nlohmann::json reportToJson(const ReconcileReport &report)
{
    return nlohmann::json{{"config", report.configPath},
                          {"added", report.added},
                          {"updated", report.updated},
                          {"unchanged", report.unchanged},
                          {"removed", report.removed},
                          {"conflicts", report.conflicts},
                          {"skippedLines", report.skippedLines},
                          {"retracted", report.retracted},
                          {"refused", report.refused}};
}

std::optional<std::string> loadTargetOf(const WatchEntry &entry)
{
    if (const auto *load = std::get_if<LoadConfig>(&entry.reaction)) {
        return load->configPath;
    }
    return std::nullopt;
}

} // namespace

ConfigReconciler::ConfigReconciler(WatchManager &manager)
    : m_manager(manager)
{
}

ReconcileReport ConfigReconciler::loadRoot(const std::string &configPath)
{
    m_root = configPath;

    WatchSpec self;
    self.path = configPath;
    self.mask = kConfigWatchMask;
    self.reaction = LoadConfig{configPath};
    self.sourceConfig = kBootstrapSource;
    // Deleting the file reloads it too, which retracts what it owned.
    self.runReactionIfMissing = true;
    m_manager.apply(self);

    return reconcile(configPath);
}

ReconcileReport ConfigReconciler::reconcile(const std::string &configPath)
{
    ReconcileReport report;
    report.configPath = configPath;

    if (m_loading.count(configPath) > 0) {
        IRLOG_WARN(kComponent,
                   QStringLiteral("reconcile"),
                   QStringLiteral("config_load_refused"),
                   QStringLiteral("load_cycle"),
                   (nlohmann::json{{"config", configPath}}));
        report.refused = true;
        return report;
    }

    m_loading.insert(configPath);
    struct LoadingGuard {
        std::set<std::string> &loading;
        std::string path;
        ~LoadingGuard() { loading.erase(path); }
    } guard{m_loading, configPath};

    const auto size = fileSizeOf(configPath);
    if (!size || *size < kRetractedConfigBytes) {
        report.retracted = true;
        report.removed = retract(configPath);
        IRLOG_WARN(kComponent,
                   QStringLiteral("reconcile"),
                   QStringLiteral("config_retracted"),
                   size ? QStringLiteral("config_truncated") : QStringLiteral("config_missing"),
                   reportToJson(report));
        return report;
    }

    ConfigParseResult parsed = parseConfigFile(configPath);
    if (parsed.hadError) {
        // Unreadable is not the same as empty: keep what is loaded.
        IRLOG_ERROR(kComponent,
                    QStringLiteral("reconcile"),
                    QStringLiteral("config_unreadable"),
                    QStringLiteral("open_failed"),
                    (nlohmann::json{{"config", configPath}}));
        report.refused = true;
        return report;
    }

    for (const ParseIssue &issue : parsed.issues) {
        ++report.skippedLines;
        IRLOG_WARN(kComponent,
                   QStringLiteral("reconcile"),
                   QStringLiteral("config_line_skipped"),
                   QString::fromStdString(issue.reason),
                   (nlohmann::json{{"config", configPath},
                                   {"line", issue.lineNumber},
                                   {"text", issue.line}}));
    }

    // Everything this resource wants to exist once it is applied.
    std::map<std::string, WatchSpec> candidates;
    for (WatchSpec &spec : parsed.specs) {
        spec.sourceConfig = configPath;
        candidates.emplace(spec.path, spec);
    }
    for (const WatchSpec &spec : parsed.specs) {
        const auto *setWatch = std::get_if<SetWatch>(&spec.reaction);
        if (!setWatch) {
            continue;
        }
        std::optional<WatchSpec> target = parseWatchLine(setWatch->specLine);
        if (!target) {
            continue;
        }
        target->sourceConfig = configPath;
        target->lineNumber = spec.lineNumber;
        candidates.emplace(target->path, *target);
    }

    // (loader entry, target configuration)
    std::vector<std::pair<std::string, std::string>> nestedLoads;
    for (const auto &item : candidates) {
        const WatchSpec &spec = item.second;
        const WatchEntry *existing = m_manager.registry().get(spec.path);
        if (spec.path == configPath && existing && existing->sourceConfig == kBootstrapSource) {
            // The root self-watch already covers this line.
            ++report.unchanged;
            continue;
        }
        std::optional<std::string> previousTarget;
        if (existing && existing->sourceConfig == configPath) {
            previousTarget = loadTargetOf(*existing);
        }
        const UpsertOutcome outcome = m_manager.apply(spec);
        switch (outcome) {
        case UpsertOutcome::Inserted:
            ++report.added;
            break;
        case UpsertOutcome::Replaced:
            ++report.updated;
            break;
        case UpsertOutcome::Unchanged:
            ++report.unchanged;
            break;
        case UpsertOutcome::Conflict:
            ++report.conflicts;
            break;
        }
        if (outcome != UpsertOutcome::Inserted && outcome != UpsertOutcome::Replaced) {
            continue;
        }
        const auto *load = std::get_if<LoadConfig>(&spec.reaction);
        if (previousTarget && (!load || load->configPath != *previousTarget)) {
            releaseLoader(spec.path, *previousTarget);
        }
        // LOAD_CONF runs immediately unless it would only reload this resource.
        if (load && load->configPath != configPath) {
            nestedLoads.emplace_back(spec.path, load->configPath);
        }
    }

    for (const std::string &path : m_manager.registry().pathsOwnedBy(configPath)) {
        if (candidates.count(path) == 0 && removeWithCascade(path)) {
            ++report.removed;
        }
    }

    IRLOG_INFO(kComponent,
               QStringLiteral("reconcile"),
               QStringLiteral("config_loaded"),
               QString(),
               reportToJson(report));

    for (const auto &load : nestedLoads) {
        // Reloading the root or a configuration still being loaded is a
        // back-reference, not ownership.
        if (load.second != m_root && m_loading.count(load.second) == 0) {
            m_loaders[load.second].insert(load.first);
        }
        reconcile(load.second);
    }
    return report;
}

int ConfigReconciler::retract(const std::string &configPath)
{
    int removed = 0;
    for (const std::string &path : m_manager.registry().pathsOwnedBy(configPath)) {
        if (removeWithCascade(path)) {
            ++removed;
        }
    }
    return removed;
}

std::set<std::string> ConfigReconciler::loadersOf(const std::string &configPath) const
{
    auto it = m_loaders.find(configPath);
    return it == m_loaders.end() ? std::set<std::string>() : it->second;
}

bool ConfigReconciler::removeWithCascade(const std::string &path)
{
    const WatchEntry *entry = m_manager.registry().get(path);
    if (!entry) {
        return false;
    }
    const std::optional<std::string> target = loadTargetOf(*entry);
    if (!m_manager.remove(path)) {
        return false;
    }
    if (target) {
        releaseLoader(path, *target);
    }
    return true;
}

void ConfigReconciler::releaseLoader(const std::string &loader, const std::string &target)
{
    auto it = m_loaders.find(target);
    if (it == m_loaders.end() || it->second.erase(loader) == 0) {
        return;
    }
    if (!it->second.empty()) {
        IRLOG_DEBUG(kComponent,
                    QStringLiteral("releaseLoader"),
                    QStringLiteral("config_still_loaded"),
                    QString(),
                    (nlohmann::json{{"config", target},
                                    {"via", loader},
                                    {"loaders", it->second.size()}}));
        return;
    }
    m_loaders.erase(it);
    if (target == m_root || m_loading.count(target) > 0) {
        return;
    }

    const int cascaded = retract(target);
    IRLOG_INFO(kComponent,
               QStringLiteral("releaseLoader"),
               QStringLiteral("config_retracted"),
               QStringLiteral("last_loader_removed"),
               (nlohmann::json{{"config", target},
                               {"removed", cascaded},
                               {"via", loader}}));
}

bool ConfigReconciler::loadConfig(const std::string &configPath, const std::string &owner)
{
    IRLOG_DEBUG(kComponent,
                QStringLiteral("loadConfig"),
                QStringLiteral("load_conf_directive"),
                QString(),
                (nlohmann::json{{"config", configPath}, {"owner", owner}}));
    return !reconcile(configPath).refused;
}

bool ConfigReconciler::setWatch(const std::string &specLine, const std::string &owner)
{
    std::string reason;
    std::optional<WatchSpec> spec = parseWatchLine(specLine, &reason);
    if (!spec) {
        IRLOG_WARN(kComponent,
                   QStringLiteral("setWatch"),
                   QStringLiteral("set_watch_rejected"),
                   QString::fromStdString(reason),
                   (nlohmann::json{{"line", specLine}, {"owner", owner}}));
        return false;
    }
    spec->sourceConfig = owner;
    return m_manager.apply(*spec) != UpsertOutcome::Conflict;
}

} // namespace inreact

#include "daemon/reaction_dispatcher.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace inreact {

namespace {

FireResult fromWorker(const std::optional<WorkerId> &worker)
{
    FireResult result;
    if (worker) {
        result.status = FireStatus::Spawned;
        result.worker = *worker;
    }
    return result;
}

FireResult fromInline(bool ok)
{
    FireResult result;
    result.status = ok ? FireStatus::Completed : FireStatus::Failed;
    return result;
}

struct FireVisitor {
    ActionExecutor &executor;
    DirectiveHandler *directives;
    const WatchEntry &entry;
    const std::vector<std::string> &args;

    FireResult operator()(const RunCommand &command) const
    {
        std::string commandLine = command.commandLine;
        for (const auto &arg : args) {
            commandLine += ' ';
            commandLine += shellQuote(arg);
        }
        return fromWorker(executor.runCommand(commandLine));
    }

    FireResult operator()(const ForwardToSocket &forward) const
    {
        std::string payload = forward.payload;
        for (const auto &arg : args) {
            if (!payload.empty()) {
                payload += ' ';
            }
            payload += arg;
        }
        return fromWorker(executor.forwardToDaemon(forward.daemon, payload));
    }

    FireResult operator()(const LoadConfig &load) const
    {
        if (!directives) {
            return fromInline(false);
        }
        return fromInline(directives->loadConfig(load.configPath, entry.sourceConfig));
    }

    FireResult operator()(const SetWatch &setWatch) const
    {
        if (!directives) {
            return fromInline(false);
        }
        return fromInline(directives->setWatch(setWatch.specLine, entry.sourceConfig));
    }
};

} // namespace

std::string shellQuote(const std::string &arg)
{
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

ReactionDispatcher::ReactionDispatcher(ActionExecutor &executor)
    : m_executor(executor)
{
}

FireResult ReactionDispatcher::fire(const WatchEntry &entry, const std::vector<std::string> &args)
{
    IRLOG_DEBUG(QStringLiteral("ReactionDispatcher"),
                QStringLiteral("fire"),
                QStringLiteral("reaction_fire"),
                QString::fromStdString(toReactionKindString(entry.reaction)),
                (nlohmann::json{{"path", entry.path},
                                {"reaction", describeReaction(entry.reaction)},
                                {"args", args}}));

    const FireResult result = std::visit(FireVisitor{m_executor, m_directives, entry, args},
                                         entry.reaction);
    if (result.status == FireStatus::Failed) {
        IRLOG_WARN(QStringLiteral("ReactionDispatcher"),
                   QStringLiteral("fire"),
                   QStringLiteral("reaction_failed"),
                   QString::fromStdString(toReactionKindString(entry.reaction)),
                   (nlohmann::json{{"path", entry.path},
                                   {"reaction", describeReaction(entry.reaction)}}));
    }
    return result;
}

} // namespace inreact

#include "daemon/config_parser.hpp"

#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

#include "common/event_mask.hpp"

namespace inreact {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

// Splits off the first whitespace-delimited field; rest keeps its inner spacing.
std::string takeField(const std::string &text, std::string &rest)
{
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = start;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
        ++end;
    }
    rest = trim(text.substr(end));
    return text.substr(start, end - start);
}

} // namespace

Reaction parseReaction(const std::string &text, const std::string &watchedPath)
{
    std::string rest;
    const std::string keyword = takeField(text, rest);

    if (keyword == kLoadConfDirective) {
        std::string ignored;
        const std::string target = takeField(rest, ignored);
        return LoadConfig{target.empty() ? watchedPath : target};
    }
    if (keyword == kSetWatchDirective) {
        return SetWatch{rest};
    }
    if (keyword == kForwardDirective) {
        std::string payload;
        const std::string daemon = takeField(rest, payload);
        return ForwardToSocket{daemon, payload};
    }
    return RunCommand{trim(text)};
}

std::optional<WatchSpec> parseWatchLine(const std::string &line, std::string *reason)
{
    const std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
        return std::nullopt;
    }

    auto fail = [reason](const std::string &why) -> std::optional<WatchSpec> {
        if (reason) {
            *reason = why;
        }
        return std::nullopt;
    };

    std::string afterPath;
    const std::string path = takeField(trimmed, afterPath);
    std::string reactionText;
    const std::string maskText = takeField(afterPath, reactionText);

    if (path.front() != '/') {
        return fail("path is not absolute");
    }
    if (maskText.empty()) {
        return fail("missing event mask");
    }
    if (reactionText.empty()) {
        return fail("missing reaction");
    }

    const MaskExpr expr = parseMaskExpr(maskText);
    if (!expr.unknownTokens.empty()) {
        return fail("unknown event kind " + expr.unknownTokens.front());
    }

    WatchSpec spec;
    spec.path = path;
    // Editors replace files by delete+recreate; the watch must notice.
    spec.mask = expr.bits | mask::DeleteSelf;
    spec.createIfMissing = expr.createIfMissing;
    spec.runReactionIfMissing = expr.runReactionIfMissing;
    spec.reaction = parseReaction(reactionText, path);

    if (const auto *forward = std::get_if<ForwardToSocket>(&spec.reaction)) {
        if (forward->daemon.empty()) {
            return fail("FORWARD without daemon name");
        }
    }
    if (const auto *setWatch = std::get_if<SetWatch>(&spec.reaction)) {
        std::string nestedReason;
        if (!parseWatchLine(setWatch->specLine, &nestedReason)) {
            return fail("invalid SET_WATCH target: "
                        + (nestedReason.empty() ? std::string("empty") : nestedReason));
        }
    }
    return spec;
}

ConfigParseResult parseConfigText(const std::string &text)
{
    ConfigParseResult result;
    std::set<std::string> seen;
    std::istringstream stream(text);
    std::string line;
    int lineNumber = 0;

    while (std::getline(stream, line)) {
        ++lineNumber;
        std::string reason;
        auto spec = parseWatchLine(line, &reason);
        if (!spec) {
            if (!reason.empty()) {
                result.issues.push_back({lineNumber, line, reason});
            }
            continue;
        }
        if (!seen.insert(spec->path).second) {
            result.issues.push_back({lineNumber, line, "duplicate path " + spec->path});
            continue;
        }
        spec->lineNumber = lineNumber;
        result.specs.push_back(std::move(*spec));
    }
    return result;
}

ConfigParseResult parseConfigFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        ConfigParseResult result;
        result.hadError = true;
        return result;
    }
    std::ostringstream content;
    content << in.rdbuf();
    return parseConfigText(content.str());
}

} // namespace inreact

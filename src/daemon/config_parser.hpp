#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace inreact {

// Directive keywords recognised at the start of the reaction field.
inline constexpr const char *kLoadConfDirective = "LOAD_CONF";
inline constexpr const char *kSetWatchDirective = "SET_WATCH";
inline constexpr const char *kForwardDirective = "FORWARD";

struct ParseIssue {
    int lineNumber = 0;
    std::string line;
    std::string reason;
};

struct ConfigParseResult {
    std::vector<WatchSpec> specs;
    std::vector<ParseIssue> issues;
    bool hadError = false;
};

/**
 * Parse one "<path> <mask-expr> <reaction>" line. The reaction runs to end of
 * line. Returns nullopt for comments and blank lines; malformed lines also
 * return nullopt and fill *reason.
 *
 * The returned spec always has IN_DELETE_SELF in its mask and an empty
 * sourceConfig.
 */
std::optional<WatchSpec> parseWatchLine(const std::string &line, std::string *reason = nullptr);

/**
 * Parse a whole configuration resource. Lines that fail to parse are reported
 * in issues and skipped. A path declared twice keeps its first declaration.
 */
ConfigParseResult parseConfigText(const std::string &text);

ConfigParseResult parseConfigFile(const std::string &path);

Reaction parseReaction(const std::string &text, const std::string &watchedPath);

} // namespace inreact

#include "common/event_mask.hpp"

#include <cctype>
#include <cstdio>
#include <exception>
#include <sstream>

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

std::optional<std::uint32_t> parseLiteral(const std::string &token)
{
    if (token.empty() || !std::isdigit(static_cast<unsigned char>(token[0]))) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        const unsigned long value = std::stoul(token, &consumed, 0);
        if (consumed != token.size() || value > 0xFFFFFFFFUL) {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(value);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

} // namespace

const std::vector<EventKindName> &eventKindNames()
{
    static const std::vector<EventKindName> names = {
        {"IN_ACCESS", mask::Access},
        {"IN_MODIFY", mask::Modify},
        {"IN_ATTRIB", mask::Attrib},
        {"IN_CLOSE_WRITE", mask::CloseWrite},
        {"IN_CLOSE_NOWRITE", mask::CloseNoWrite},
        {"IN_OPEN", mask::Open},
        {"IN_MOVED_FROM", mask::MovedFrom},
        {"IN_MOVED_TO", mask::MovedTo},
        {"IN_CREATE", mask::Create},
        {"IN_DELETE", mask::Delete},
        {"IN_DELETE_SELF", mask::DeleteSelf},
        {"IN_MOVE_SELF", mask::MoveSelf},
        {"IN_UNMOUNT", mask::Unmount},
        {"IN_Q_OVERFLOW", mask::QueueOverflow},
        {"IN_IGNORED", mask::Ignored},
        {"IN_ISDIR", mask::IsDir},
        {"IN_ONLYDIR", mask::OnlyDir},
        {"IN_DONT_FOLLOW", mask::DontFollow},
        {"IN_EXCL_UNLINK", mask::ExclUnlink},
        {"IN_CLOSE", mask::Close},
        {"IN_MOVE", mask::Move},
        {"IN_ALL_EVENTS", mask::AllEvents},
    };
    return names;
}

std::optional<std::uint32_t> maskForName(const std::string &name)
{
    for (const auto &entry : eventKindNames()) {
        if (name == entry.name) {
            return entry.bits;
        }
    }
    return std::nullopt;
}

std::string describeMask(std::uint32_t bits)
{
    std::ostringstream out;
    std::uint32_t remaining = bits;
    bool first = true;
    for (const auto &entry : eventKindNames()) {
        // Single-bit names only; composites would repeat their members.
        if ((entry.bits & (entry.bits - 1)) != 0) {
            continue;
        }
        if ((bits & entry.bits) == 0) {
            continue;
        }
        if (!first) {
            out << '|';
        }
        out << entry.name;
        first = false;
        remaining &= ~entry.bits;
    }
    if (remaining != 0) {
        char hex[16];
        std::snprintf(hex, sizeof(hex), "0x%x", remaining);
        if (!first) {
            out << '|';
        }
        out << hex;
        first = false;
    }
    if (first) {
        out << '0';
    }
    return out.str();
}

MaskExpr parseMaskExpr(const std::string &expr)
{
    MaskExpr result;
    std::istringstream stream(expr);
    std::string token;
    while (std::getline(stream, token, '|')) {
        token = trim(token);
        if (token.empty()) {
            continue;
        }
        if (token == kCreateIfMissingToken) {
            result.createIfMissing = true;
            continue;
        }
        if (token == kRunIfMissingToken) {
            result.runReactionIfMissing = true;
            continue;
        }
        auto bits = maskForName(token);
        if (!bits) {
            bits = parseLiteral(token);
        }
        if (bits && (*bits & ~mask::Requestable) == 0) {
            result.bits |= *bits;
            continue;
        }
        result.unknownTokens.push_back(token);
    }
    return result;
}

} // namespace inreact

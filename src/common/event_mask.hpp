#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace inreact {

// Event kind bits. Values are the Linux inotify ABI values so a mask can be
// handed to the kernel unchanged.
namespace mask {

constexpr std::uint32_t Access = 0x00000001;
constexpr std::uint32_t Modify = 0x00000002;
constexpr std::uint32_t Attrib = 0x00000004;
constexpr std::uint32_t CloseWrite = 0x00000008;
constexpr std::uint32_t CloseNoWrite = 0x00000010;
constexpr std::uint32_t Open = 0x00000020;
constexpr std::uint32_t MovedFrom = 0x00000040;
constexpr std::uint32_t MovedTo = 0x00000080;
constexpr std::uint32_t Create = 0x00000100;
constexpr std::uint32_t Delete = 0x00000200;
constexpr std::uint32_t DeleteSelf = 0x00000400;
constexpr std::uint32_t MoveSelf = 0x00000800;

// Reported by the kernel only, never requested.
constexpr std::uint32_t Unmount = 0x00002000;
constexpr std::uint32_t QueueOverflow = 0x00004000;
constexpr std::uint32_t Ignored = 0x00008000;
constexpr std::uint32_t IsDir = 0x40000000;

// Watch options.
constexpr std::uint32_t OnlyDir = 0x01000000;
constexpr std::uint32_t DontFollow = 0x02000000;
constexpr std::uint32_t ExclUnlink = 0x04000000;

constexpr std::uint32_t Close = CloseWrite | CloseNoWrite;
constexpr std::uint32_t Move = MovedFrom | MovedTo;
constexpr std::uint32_t AllEvents = Access | Modify | Attrib | Close | Open | Move
    | Create | Delete | DeleteSelf | MoveSelf;

constexpr std::uint32_t SelfGone = DeleteSelf | MoveSelf;
constexpr std::uint32_t ErrorClass = Unmount | QueueOverflow | Ignored;
constexpr std::uint32_t Options = OnlyDir | DontFollow | ExclUnlink;
// What a configuration line may ask the kernel for.
constexpr std::uint32_t Requestable = AllEvents | Options;

} // namespace mask

// Config syntax names for the two pseudo kinds; they set entry flags, not bits.
inline constexpr const char *kCreateIfMissingToken = "IN_CREATE_SELF";
inline constexpr const char *kRunIfMissingToken = "IN_RUN_SELF";

struct EventKindName {
    const char *name;
    std::uint32_t bits;
};

// Every name accepted in a mask expression, composites included.
const std::vector<EventKindName> &eventKindNames();

std::optional<std::uint32_t> maskForName(const std::string &name);

// "IN_MODIFY|IN_DELETE_SELF"; composites are expanded, unknown bits shown as hex.
std::string describeMask(std::uint32_t bits);

struct MaskExpr {
    std::uint32_t bits = 0;
    bool createIfMissing = false;
    bool runReactionIfMissing = false;
    std::vector<std::string> unknownTokens;
};

// Parse "token|token|..." where a token is an event name, a pseudo kind or a
// decimal/0x-hex literal. Unknown tokens are collected, not fatal; so are
// kernel-reported names and literals with bits outside mask::Requestable.
MaskExpr parseMaskExpr(const std::string &expr);

} // namespace inreact

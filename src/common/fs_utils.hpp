#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace inreact {

// Inode of the path itself (symlinks are followed), or nullopt if it cannot be stat'ed.
std::optional<std::uint64_t> inodeOf(const std::string &path);

std::optional<std::uint64_t> fileSizeOf(const std::string &path);

bool pathExists(const std::string &path);

// Creates an empty regular file, including missing parent directories.
// An existing path is left untouched and counts as success.
bool createEmptyFile(const std::string &path, std::string *error = nullptr);

// Polls for the path for up to graceMs; covers editors that delete and
// recreate a file on save.
bool waitForPath(const std::string &path, int graceMs);

} // namespace inreact

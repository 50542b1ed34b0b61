#include "common/fs_utils.hpp"

#include <QDir>
#include <QFileInfo>
#include <QThread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace inreact {

namespace {

constexpr int kPathPollStepMs = 50;

} // namespace

std::optional<std::uint64_t> inodeOf(const std::string &path)
{
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.st_ino);
}

std::optional<std::uint64_t> fileSizeOf(const std::string &path)
{
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.st_size);
}

bool pathExists(const std::string &path)
{
    struct stat info {};
    return ::stat(path.c_str(), &info) == 0;
}

bool createEmptyFile(const std::string &path, std::string *error)
{
    if (pathExists(path)) {
        return true;
    }

    const QString parent = QFileInfo(QString::fromStdString(path)).absolutePath();
    if (!QDir().mkpath(parent)) {
        if (error) {
            *error = "cannot create directory " + parent.toStdString();
        }
        return false;
    }

    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (error) {
            *error = std::strerror(errno);
        }
        return false;
    }
    ::close(fd);
    return true;
}

bool waitForPath(const std::string &path, int graceMs)
{
    if (pathExists(path)) {
        return true;
    }
    for (int waited = 0; waited < graceMs; waited += kPathPollStepMs) {
        QThread::msleep(kPathPollStepMs);
        if (pathExists(path)) {
            return true;
        }
    }
    return false;
}

} // namespace inreact

#include "lxcri/filelock.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "lxcri/errors.h"
#include "lxcri/filesystem.h"

FileLock::FileLock(const std::string& path, LockType type)
    : lock_path_(path + ".lock"), type_(type) {
    if (!ensure_parent_directory(lock_path_)) {
        throw RuntimeError(ErrorCode::OperationFailed,
                           "Failed to create directory for lock file " + lock_path_);
    }
    fd_ = open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw RuntimeError(ErrorCode::OperationFailed,
                           "Failed to open lock file " + lock_path_ + ": " + std::strerror(errno));
    }
    int operation = type_ == LockType::Write ? LOCK_EX : LOCK_SH;
    while (flock(fd_, operation) != 0) {
        if (errno == EINTR) {
            continue;
        }
        int saved = errno;
        close(fd_);
        fd_ = -1;
        throw RuntimeError(ErrorCode::OperationFailed,
                           "Failed to lock " + lock_path_ + ": " + std::strerror(saved));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}

#pragma once

#include <string>

enum class LockType {
    Read,
    Write,
};

// Advisory flock(2) on "<path>.lock", held for the lifetime of the object.
// Throws RuntimeError(OperationFailed) when the lock file cannot be opened or locked.
class FileLock {
public:
    FileLock(const std::string& path, LockType type);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    LockType type() const { return type_; }
    const std::string& lock_path() const { return lock_path_; }

private:
    std::string lock_path_;
    LockType type_;
    int fd_ = -1;
};

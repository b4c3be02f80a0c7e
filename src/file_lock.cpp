#include "file_lock.hpp"
#include "errors.hpp"
#include <algorithm>
#include <thread>
#include <cerrno>

#ifndef _WIN32
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>
#endif

namespace teamfs {

namespace {
constexpr std::chrono::milliseconds kRetryInterval{10};
}

#ifdef _WIN32

FileLock::FileLock(const std::string& path, std::chrono::milliseconds timeout)
    : path_(path) {
    handle_ = CreateFileA(path_.c_str(), GENERIC_READ | GENERIC_WRITE,
                          FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                          nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle_ == INVALID_HANDLE_VALUE) {
        throw StoreError(ErrorCode::IOError,
                         "open lock " + path_ + ": error " + std::to_string(GetLastError()));
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        OVERLAPPED ov = {};
        if (LockFileEx(handle_, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                       0, MAXDWORD, MAXDWORD, &ov)) {
            return;
        }
        DWORD err = GetLastError();
        if (err != ERROR_LOCK_VIOLATION && err != ERROR_IO_PENDING) {
            CloseHandle(handle_);
            throw StoreError(ErrorCode::IOError,
                             "lock " + path_ + ": error " + std::to_string(err));
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            CloseHandle(handle_);
            throw StoreError(ErrorCode::LockTimeout,
                             "timed out after " + std::to_string(timeout.count()) +
                             "ms waiting for lock " + path_);
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(kRetryInterval, left));
    }
}

FileLock::~FileLock() {
    if (handle_ != INVALID_HANDLE_VALUE) {
        OVERLAPPED ov = {};
        UnlockFileEx(handle_, 0, MAXDWORD, MAXDWORD, &ov);
        CloseHandle(handle_);
    }
}

#else

FileLock::FileLock(const std::string& path, std::chrono::milliseconds timeout)
    : path_(path) {
    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) throw io_error_errno("open lock " + path_, errno);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) return;
        int err = errno;
        if (err == EINTR) continue;
        if (err != EWOULDBLOCK) {
            ::close(fd_);
            throw io_error_errno("flock " + path_, err);
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ::close(fd_);
            throw StoreError(ErrorCode::LockTimeout,
                             "timed out after " + std::to_string(timeout.count()) +
                             "ms waiting for lock " + path_);
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(kRetryInterval, left));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

#endif

} // namespace teamfs

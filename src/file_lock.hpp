#pragma once
#include <string>
#include <chrono>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace teamfs {

// One held exclusive lock. Released when the handle is destroyed.
class LockHandle {
public:
    LockHandle() = default;
    virtual ~LockHandle() = default;
    LockHandle(const LockHandle&) = delete;
    LockHandle& operator=(const LockHandle&) = delete;
};

// ── RAII advisory file lock (cross-process) ─────────────────────────
//
// Locks a marker file with flock() (LockFileEx on Windows), so the lock is
// honoured by every cooperating process on the machine, not only by threads
// of this one. The constructor polls with LOCK_NB until `timeout` elapses and
// then throws StoreError(LockTimeout); nothing has been changed at that point.
//
// The marker is created if missing and never unlinked: removing it while
// another process waits would let the two of them lock different inodes.
//
// Not reentrant. Locking the same path twice from one logical operation
// deadlocks until the timeout fires.
class FileLock final : public LockHandle {
public:
    FileLock(const std::string& path, std::chrono::milliseconds timeout);
    ~FileLock() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

} // namespace teamfs

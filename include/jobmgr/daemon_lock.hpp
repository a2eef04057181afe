/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <sys/types.h>

#include "jobmgr/types.hpp"

namespace jobmgr {

enum class LockState : uint8_t { NotRunning, Running, Stale };

// True if a process with this pid exists (signal 0 check).
[[nodiscard]] bool isProcessAlive(pid_t pid) noexcept;

// Singleton token for the daemon: a file holding the holder's pid.
class DaemonLock final {
public:
    explicit DaemonLock(const std::filesystem::path& home) noexcept;

    [[nodiscard]] std::optional<pid_t> read() const noexcept;
    [[nodiscard]] bool exists() const noexcept;
    [[nodiscard]] LockState state() const noexcept;

    // Exclusive create with the given pid; AlreadyRunning if the file exists.
    [[nodiscard]] Result acquire(pid_t pid) const noexcept;
    // Removes the lock only if it still names `pid`.
    bool release(pid_t pid) const noexcept;
    bool clear() const noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}

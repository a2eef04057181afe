/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <string>
#include <sys/types.h>

#include "jobmgr/config.hpp"
#include "jobmgr/daemon_lock.hpp"
#include "jobmgr/types.hpp"

namespace jobmgr {

enum class DaemonState : uint8_t { NotRunning, Starting, Running, Stopping };

struct StartResult {
    bool ok = false;
    pid_t pid = 0;
    JobError error = JobError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Singleton background process that runs the Server scan loop.
// Liveness is the lock file plus a live holder pid; a lock whose holder
// is gone counts as stale and is cleared by start() and stop().
class Daemon final {
public:
    explicit Daemon(const Config& config);

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // Detaches a background daemon and returns its pid in the calling process.
    [[nodiscard]] StartResult start();

    // Runs the daemon in this process until SIGTERM or SIGINT. Returns an exit code.
    int runForeground();

    // Sends SIGTERM to the recorded pid and removes the lock without waiting.
    [[nodiscard]] Result stop();

    [[nodiscard]] bool isRunning() const noexcept { return lock_.state() == LockState::Running; }
    [[nodiscard]] LockState lockState() const noexcept { return lock_.state(); }
    [[nodiscard]] DaemonState state() const noexcept { return state_.load(); }
    [[nodiscard]] const DaemonLock& lock() const noexcept { return lock_; }

private:
    Config config_;
    DaemonLock lock_;
    std::atomic<DaemonState> state_{DaemonState::NotRunning};

    void clearIfStale();
    int serve();
};

}

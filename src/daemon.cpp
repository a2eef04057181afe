/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/daemon.hpp"
#include "jobmgr/server.hpp"
#include "jobmgr/logger.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace jobmgr {

namespace {
// Async-signal-safe: only set flag, no complex operations
volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void detachStdio() {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull < 0) {
        return;
    }
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(devnull, STDOUT_FILENO);
    ::dup2(devnull, STDERR_FILENO);
    if (devnull > STDERR_FILENO) {
        ::close(devnull);
    }
}
}

Daemon::Daemon(const Config& config) : config_(config), lock_(config.home) {
}

void Daemon::clearIfStale() {
    if (lock_.state() != LockState::Stale) {
        return;
    }
    auto holder = lock_.read();
    LOG_WARN("Removing stale daemon lock" +
             (holder ? " left by pid " + std::to_string(*holder) : std::string(" with no valid pid")));
    lock_.clear();
}

StartResult Daemon::start() {
    if (lock_.state() == LockState::Running) {
        return {false, 0, JobError::AlreadyRunning, "Daemon is already running!"};
    }
    clearIfStale();

    state_.store(DaemonState::Starting);

    // The child reports through this pipe once it holds the lock
    int ready[2] = {-1, -1};
    if (::pipe2(ready, O_CLOEXEC) != 0) {
        state_.store(DaemonState::NotRunning);
        return {false, 0, JobError::IoError, std::string("pipe failed: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(ready[0]);
        ::close(ready[1]);
        state_.store(DaemonState::NotRunning);
        return {false, 0, JobError::IoError, std::string("fork failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        ::close(ready[0]);
        ::setsid();

        Result acquired = lock_.acquire(::getpid());
        if (!acquired) {
            LOG_ERROR("Daemon could not take the lock: " + acquired.message);
            std::_Exit(1);
        }

        char ok = '1';
        ssize_t written = ::write(ready[1], &ok, 1);
        (void)written;
        ::close(ready[1]);

        if (::chdir("/") != 0) {
            LOG_WARN(std::string("chdir(/) failed: ") + std::strerror(errno));
        }
        detachStdio();

        std::exit(serve());
    }

    ::close(ready[1]);
    char ok = 0;
    ssize_t n = 0;
    do {
        n = ::read(ready[0], &ok, 1);
    } while (n < 0 && errno == EINTR);
    ::close(ready[0]);

    if (n != 1) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        state_.store(DaemonState::NotRunning);
        return {false, 0, JobError::AlreadyRunning, "Daemon is already running!"};
    }

    state_.store(DaemonState::Running);
    LOG_INFO("Daemon started with pid " + std::to_string(pid));
    return {true, pid, JobError::None, "Daemon started (pid " + std::to_string(pid) + ")."};
}

int Daemon::runForeground() {
    if (lock_.state() == LockState::Running) {
        LOG_ERROR("Daemon is already running");
        return 1;
    }
    clearIfStale();

    state_.store(DaemonState::Starting);
    Result acquired = lock_.acquire(::getpid());
    if (!acquired) {
        LOG_ERROR("Failed to start daemon: " + acquired.message);
        state_.store(DaemonState::NotRunning);
        return 1;
    }
    return serve();
}

int Daemon::serve() {
    const pid_t self = ::getpid();
    g_shutdown_requested = 0;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exitCode = 0;
    try {
        Server server(config_);
        if (!server.start()) {
            LOG_ERROR("Failed to start server");
            lock_.release(self);
            state_.store(DaemonState::NotRunning);
            return 1;
        }

        state_.store(DaemonState::Running);
        LOG_INFO("Daemon running (pid " + std::to_string(self) + ")");

        while (!g_shutdown_requested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        state_.store(DaemonState::Stopping);
        LOG_INFO("Shutdown requested, stopping server...");
        server.shutdown();
    } catch (const std::exception& e) {
        LOG_ERROR("Daemon error: " + std::string(e.what()));
        exitCode = 1;
    }

    // stop() normally removed the lock already; never remove a successor's
    lock_.release(self);
    state_.store(DaemonState::NotRunning);
    LOG_INFO("Daemon stopped");
    return exitCode;
}

Result Daemon::stop() {
    if (!lock_.exists()) {
        return Result::failure(JobError::NotRunning, "Daemon is not running!");
    }

    auto pid = lock_.read();
    if (!pid || !isProcessAlive(*pid)) {
        lock_.clear();
        LOG_WARN("Stop found a stale daemon lock; removed it");
        return Result::failure(JobError::NotRunning, "Daemon is not running! (removed stale lock)");
    }

    state_.store(DaemonState::Stopping);
    if (::kill(*pid, SIGTERM) != 0) {
        // Lock is removed regardless; the caller does not wait for the exit
        LOG_WARN("Failed to signal daemon pid " + std::to_string(*pid) + ": " + std::strerror(errno));
    }
    lock_.clear();
    state_.store(DaemonState::NotRunning);

    LOG_INFO("Daemon stopped (pid " + std::to_string(*pid) + ")");
    return {true, JobError::None, "Daemon stopped."};
}

}

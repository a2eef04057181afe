/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/daemon_lock.hpp"
#include "jobmgr/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <unistd.h>

namespace jobmgr {

bool isProcessAlive(pid_t pid) noexcept {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

DaemonLock::DaemonLock(const std::filesystem::path& home) noexcept
    : path_(home / "jobmgr.lock") {
}

std::optional<pid_t> DaemonLock::read() const noexcept {
    try {
        std::ifstream file(path_);
        if (!file) {
            return std::nullopt;
        }
        long pid = 0;
        file >> pid;
        if (pid <= 0) {
            return std::nullopt;
        }
        return static_cast<pid_t>(pid);
    } catch (...) {
        return std::nullopt;
    }
}

bool DaemonLock::exists() const noexcept {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

LockState DaemonLock::state() const noexcept {
    if (!exists()) {
        return LockState::NotRunning;
    }
    auto pid = read();
    if (pid && isProcessAlive(*pid)) {
        return LockState::Running;
    }
    return LockState::Stale;
}

Result DaemonLock::acquire(pid_t pid) const noexcept {
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Result::failure(JobError::AlreadyRunning, "Daemon is already running!");
        }
        return Result::failure(JobError::IoError,
                               "Failed to create lock " + path_.string() + ": " + std::strerror(errno));
    }

    std::string text = std::to_string(pid) + "\n";
    ssize_t written = ::write(fd, text.data(), text.size());
    ::close(fd);
    if (written != static_cast<ssize_t>(text.size())) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        return Result::failure(JobError::IoError, "Failed to write lock " + path_.string());
    }

    LOG_DEBUG("Daemon lock acquired by pid " + std::to_string(pid));
    return Result::success();
}

bool DaemonLock::release(pid_t pid) const noexcept {
    auto holder = read();
    if (!holder || *holder != pid) {
        LOG_DEBUG("Daemon lock not held by pid " + std::to_string(pid) + ", leaving it");
        return false;
    }
    return clear();
}

bool DaemonLock::clear() const noexcept {
    std::error_code ec;
    bool removed = std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_ERROR("Failed to remove daemon lock: " + ec.message());
        return false;
    }
    return removed;
}

}

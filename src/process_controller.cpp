/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/process_controller.hpp"
#include "jobmgr/job_store.hpp"
#include "jobmgr/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>

namespace jobmgr {

ProcessController::ProcessController(JobStore& store) noexcept : store_(store) {
}

Result ProcessController::pause(JobId id) {
    Result result = store_.signalLive(id, Status::Paused, [](pid_t pid) {
        return deliver(pid, SIGSTOP);
    });
    if (result) {
        LOG_INFO("Paused job " + std::to_string(id));
    } else {
        LOG_WARN("Pause of job " + std::to_string(id) + " failed: " + result.message);
    }
    return result;
}

Result ProcessController::resume(JobId id) {
    Result result = store_.signalLive(id, Status::Running, [](pid_t pid) {
        return deliver(pid, SIGCONT);
    });
    if (result) {
        LOG_INFO("Resumed job " + std::to_string(id));
    } else {
        LOG_WARN("Resume of job " + std::to_string(id) + " failed: " + result.message);
    }
    return result;
}

Result ProcessController::deliver(pid_t pid, int signal) {
    if (pid <= 0) {
        return Result::failure(JobError::NotFound, "No process bound");
    }
    if (::kill(-pid, signal) == 0) {
        return Result::success();
    }
    if (errno == ESRCH) {
        return Result::failure(JobError::NotFound, "Process " + std::to_string(pid) + " no longer exists");
    }
    return Result::failure(JobError::SignalFailed,
                           "Failed to signal process " + std::to_string(pid) + ": " + std::strerror(errno));
}

}

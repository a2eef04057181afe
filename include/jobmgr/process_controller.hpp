/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <sys/types.h>

#include "jobmgr/types.hpp"

namespace jobmgr {

class JobStore;

// Suspends and resumes running jobs through the pid bound to them at spawn.
// Signals go to the whole process group so commands run by the shell stop too.
class ProcessController {
public:
    explicit ProcessController(JobStore& store) noexcept;

    ProcessController(const ProcessController&) = delete;
    ProcessController& operator=(const ProcessController&) = delete;

    [[nodiscard]] Result pause(JobId id);
    [[nodiscard]] Result resume(JobId id);

    [[nodiscard]] static Result deliver(pid_t pid, int signal);

private:
    JobStore& store_;
};

}

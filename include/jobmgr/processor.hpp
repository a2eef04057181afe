/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "jobmgr/runner.hpp"
#include "jobmgr/types.hpp"

namespace jobmgr {

class JobStore;

enum class ProcessResult : uint8_t {
    Success,
    Failed,
    NotFound,
    SystemError
};

// Executes one job inside a pool slot.
class Processor {
public:
    Processor(JobStore& store, const std::string& shell);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] ProcessResult process(JobUid uid, int workerId) noexcept;

private:
    JobStore& store_;
    Runner runner_;

    [[nodiscard]] bool finalize(JobUid uid, const RunResult& run) noexcept;
    [[nodiscard]] bool finalizeFailure(JobUid uid, const std::string& reason) noexcept;
    void discardIfDeleted(JobUid uid, const Result& update) noexcept;
};

}

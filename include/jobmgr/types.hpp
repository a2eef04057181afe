/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace jobmgr {

// Job lifecycle states. COMPLETED and ERROR are terminal.
enum class Status : std::uint8_t { Pending, Running, Paused, Completed, Error };

// Caller-facing identifier: 1-based position in the store, shifts down after a delete.
using JobId = std::size_t;

// Stable identity assigned from the persisted counter, never reused.
using JobUid = std::uint64_t;

enum class JobError : std::uint8_t {
    None = 0,
    NotFound,
    AlreadyRunning,
    NotRunning,
    Busy,
    Corrupt,
    InvalidContent,
    InvalidTransition,
    IoError,
    SignalFailed
};

struct JobRecord {
    JobId id = 0;
    JobUid uid = 0;
    std::string command;
    std::filesystem::path workdir;
    Status status = Status::Pending;
    std::optional<pid_t> pid;
};

struct Result {
    bool ok = false;
    JobError error = JobError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    static Result success() { return {true, JobError::None, ""}; }
    static Result failure(JobError error, std::string message) { return {false, error, std::move(message)}; }
};

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(JobError error) noexcept;
[[nodiscard]] std::optional<Status> parseStatus(const std::string& text) noexcept;

[[nodiscard]] inline bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Error;
}

[[nodiscard]] inline bool isLive(Status status) noexcept {
    return status == Status::Running || status == Status::Paused;
}

[[nodiscard]] bool isValidTransition(Status from, Status to) noexcept;

} // namespace jobmgr

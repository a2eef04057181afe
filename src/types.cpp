/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/types.hpp"

namespace jobmgr {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Pending:   return "PENDING";
        case Status::Running:   return "RUNNING";
        case Status::Paused:    return "PAUSED";
        case Status::Completed: return "COMPLETED";
        case Status::Error:     return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* toString(JobError error) noexcept {
    switch (error) {
        case JobError::None:              return "None";
        case JobError::NotFound:          return "NotFound";
        case JobError::AlreadyRunning:    return "AlreadyRunning";
        case JobError::NotRunning:        return "NotRunning";
        case JobError::Busy:              return "Busy";
        case JobError::Corrupt:           return "Corrupt";
        case JobError::InvalidContent:    return "InvalidContent";
        case JobError::InvalidTransition: return "InvalidTransition";
        case JobError::IoError:           return "IoError";
        case JobError::SignalFailed:      return "SignalFailed";
        default: return "Unknown";
    }
}

std::optional<Status> parseStatus(const std::string& text) noexcept {
    if (text == "PENDING") return Status::Pending;
    if (text == "RUNNING") return Status::Running;
    if (text == "PAUSED") return Status::Paused;
    if (text == "COMPLETED") return Status::Completed;
    if (text == "ERROR") return Status::Error;
    return std::nullopt;
}

bool isValidTransition(Status from, Status to) noexcept {
    if (from == to) {
        return true;
    }
    switch (from) {
        case Status::Pending:
            return to == Status::Running || to == Status::Error;
        case Status::Running:
            return to == Status::Paused || isTerminal(to);
        case Status::Paused:
            return to == Status::Running || isTerminal(to);
        default:
            return false; // terminal
    }
}

}

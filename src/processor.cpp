/*
 * jobmgr - Local Background Job Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "jobmgr/processor.hpp"
#include "jobmgr/job_store.hpp"
#include "jobmgr/logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

namespace jobmgr {

namespace {
std::string elapsedSince(std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << elapsed << "s";
    return ss.str();
}
}

Processor::Processor(JobStore& store, const std::string& shell)
    : store_(store), runner_(shell) {
    LOG_DEBUG("Processor created for store: " + store_.home().string() + " with shell: " + runner_.shell());
}

ProcessResult Processor::process(JobUid uid, int workerId) noexcept {
    const std::string tag = "job uid " + std::to_string(uid);
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " processing " + tag);

    try {
        // Step 1: PENDING -> RUNNING before anything is spawned
        LookupResult claimed = store_.claim(uid);
        if (!claimed) {
            LOG_DEBUG("Skipping " + tag + ": " + claimed.message);
            return ProcessResult::NotFound;
        }
        const JobRecord& job = claimed.job;

        LOG_INFO("Starting " + tag + " in " + job.workdir.string() + " with " + runner_.shell() + ": " + job.command);
        auto startTime = std::chrono::steady_clock::now();

        // Step 2: run, binding the pid as soon as the child exists
        RunResult run = runner_.run(job.command, job.workdir, [this, uid](pid_t pid) {
            Result bound = store_.bindPid(uid, pid);
            if (!bound) {
                LOG_WARN("Could not bind pid " + std::to_string(pid) + " to job uid " +
                         std::to_string(uid) + ": " + bound.message);
            }
        });

        if (!run.ok) {
            LOG_ERROR("Failed to run " + tag + ": " + run.message);
            (void)finalizeFailure(uid, run.message);
            return ProcessResult::Failed;
        }

        // Step 3: output, then terminal status
        if (!finalize(uid, run)) {
            return ProcessResult::SystemError;
        }

        if (run.succeeded()) {
            LOG_INFO("Completed " + tag + " in " + elapsedSince(startTime) + ": " + job.command);
            return ProcessResult::Success;
        }
        if (run.termSignal != 0) {
            LOG_ERROR("Error in " + tag + " killed by signal " + std::to_string(run.termSignal) + ": " + job.command);
        } else {
            LOG_ERROR("Error in " + tag + " with code " + std::to_string(run.exitCode) + ": " + job.command);
        }
        return ProcessResult::Failed;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception processing " + tag + ": " + std::string(e.what()));
        (void)finalizeFailure(uid, "Internal processing error: " + std::string(e.what()));
        return ProcessResult::SystemError;
    } catch (...) {
        LOG_ERROR("Unknown exception processing " + tag);
        (void)finalizeFailure(uid, "Unknown internal processing error");
        return ProcessResult::SystemError;
    }
}

bool Processor::finalize(JobUid uid, const RunResult& run) noexcept {
    Result written = store_.outputs().write(uid, run.output, run.error);
    if (!written) {
        LOG_ERROR("Failed to store output for job uid " + std::to_string(uid) + ": " + written.message);
        (void)finalizeFailure(uid, "Failed to store output: " + written.message);
        return false;
    }

    Result updated = store_.updateStatusByUid(uid, run.succeeded() ? Status::Completed : Status::Error);
    if (!updated) {
        discardIfDeleted(uid, updated);
        return updated.error == JobError::NotFound;
    }
    return true;
}

bool Processor::finalizeFailure(JobUid uid, const std::string& reason) noexcept {
    // The reason takes the place of stderr so `view` explains the failure
    Result written = store_.outputs().write(uid, "", reason);
    if (!written) {
        LOG_ERROR("Failed to record failure output for job uid " + std::to_string(uid) + ": " + written.message);
    }

    Result updated = store_.updateStatusByUid(uid, Status::Error);
    if (!updated) {
        discardIfDeleted(uid, updated);
        return false;
    }
    return true;
}

void Processor::discardIfDeleted(JobUid uid, const Result& update) noexcept {
    if (update.error == JobError::NotFound) {
        // Deleted while running: don't leave output for a record that no longer exists
        store_.outputs().remove(uid);
        LOG_WARN("Job uid " + std::to_string(uid) + " was deleted while running; output discarded");
    } else {
        LOG_ERROR("Failed to set final status for job uid " + std::to_string(uid) + ": " + update.message);
    }
}

}
